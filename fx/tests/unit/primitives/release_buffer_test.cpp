// ==============================================================================
// Layer 1: Primitives
// release_buffer_test.cpp - Tests for ReleaseBuffer
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <midichain/fx/primitives/release_buffer.h>

#include <cmath>

using namespace Midichain::Fx;

namespace {

Event noteAt(uint8_t pitch, double onset) {
    return Event::fromNote(Note{pitch, 100, 0, onset, 0.5});
}

} // namespace

TEST_CASE("ReleaseBuffer releases in ascending release time", "[release_buffer]") {
    ReleaseBuffer buffer;
    REQUIRE(buffer.push(3.0, noteAt(63, 3.0)));
    REQUIRE(buffer.push(1.0, noteAt(61, 1.0)));
    REQUIRE(buffer.push(2.0, noteAt(62, 2.0)));
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.nextReleaseTime() == 1.0);

    Event out;
    REQUIRE(buffer.popNext(out));
    REQUIRE(out.note.pitch == 61);
    REQUIRE(buffer.popNext(out));
    REQUIRE(out.note.pitch == 62);
    REQUIRE(buffer.popNext(out));
    REQUIRE(out.note.pitch == 63);
    REQUIRE(buffer.empty());
    REQUIRE_FALSE(buffer.popNext(out));
}

TEST_CASE("ReleaseBuffer keeps insertion order for equal release times", "[release_buffer]") {
    ReleaseBuffer buffer;
    for (uint8_t pitch = 60; pitch < 70; ++pitch) {
        REQUIRE(buffer.push(5.0, noteAt(pitch, 0.0)));
    }

    Event out;
    for (uint8_t pitch = 60; pitch < 70; ++pitch) {
        REQUIRE(buffer.popDue(5.0, out));
        REQUIRE(out.note.pitch == pitch);
    }
}

TEST_CASE("ReleaseBuffer::popDue respects the release time", "[release_buffer]") {
    ReleaseBuffer buffer;
    REQUIRE(buffer.push(2.0, noteAt(60, 2.0)));

    Event out = Event::endOfStream(0.0);
    REQUIRE_FALSE(buffer.isDue(1.999));
    REQUIRE_FALSE(buffer.popDue(1.999, out));
    REQUIRE(out.isEndOfStream());

    REQUIRE(buffer.isDue(2.0));
    REQUIRE(buffer.popDue(2.0, out));
    REQUIRE(out.note.pitch == 60);
}

TEST_CASE("ReleaseBuffer is unbounded by default", "[release_buffer][capacity]") {
    ReleaseBuffer buffer;
    REQUIRE(buffer.capacity() == ReleaseBuffer::kUnboundedCapacity);
    for (int i = 0; i < 10000; ++i) {
        REQUIRE(buffer.push(static_cast<double>(i), noteAt(60, 0.0)));
    }
    REQUIRE(buffer.size() == 10000);
    REQUIRE(buffer.rejectedCount() == 0);
}

TEST_CASE("ReleaseBuffer with capacity rejects new events when full",
          "[release_buffer][capacity]") {
    ReleaseBuffer buffer(2);
    REQUIRE(buffer.push(5.0, noteAt(60, 0.0)));
    REQUIRE(buffer.push(6.0, noteAt(61, 0.0)));
    REQUIRE_FALSE(buffer.push(1.0, noteAt(62, 0.0)));
    REQUIRE(buffer.rejectedCount() == 1);
    REQUIRE(buffer.nextReleaseTime() == 5.0);

    Event out;
    REQUIRE(buffer.popNext(out));
    REQUIRE(buffer.push(7.0, noteAt(63, 0.0)));
}

TEST_CASE("ReleaseBuffer empty state", "[release_buffer][edge]") {
    ReleaseBuffer buffer;
    REQUIRE(std::isinf(buffer.nextReleaseTime()));
    REQUIRE_FALSE(buffer.isDue(1e9));

    REQUIRE(buffer.push(1.0, noteAt(60, 0.0)));
    buffer.clear();
    REQUIRE(buffer.empty());
}
