// ==============================================================================
// Layer 4: Effect Tests - Delay
// ==============================================================================
// Tests for effects/delay.h and the DeferredModule scheduling it relies on.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <midichain/fx/effects/delay.h>

#include <optional>
#include <vector>

#include "test_helpers/pipeline_helpers.h"

using namespace Midichain::Fx;
using Catch::Approx;
using TestHelpers::closedNote;
using TestHelpers::control;
using TestHelpers::drive;
using TestHelpers::LogCapture;

// =============================================================================
// Timing
// =============================================================================

TEST_CASE("Delay 2.0 s re-emits a note two seconds later", "[delay][effects]") {
    Delay delay(2.0f);

    const auto out = drive(delay, {closedNote(60, 0.0, 0.5)}, 0.25, 3.0);

    REQUIRE(out.size() == 1);
    REQUIRE(out[0].time == 2.0);
    REQUIRE(out[0].event.isClosedNote());
    REQUIRE(out[0].event.note.onset == Approx(2.0));
    REQUIRE(*out[0].event.note.duration == Approx(0.5));
}

TEST_CASE("Delay assembles signals and shifts the closed note", "[delay][effects]") {
    Delay delay(1.0f);

    const auto out = drive(delay,
                           {Event::noteBegin(60, 100, 0, 0.0), Event::noteEnd(60, 0, 0, 1.5)},
                           0.5, 4.0);

    REQUIRE(out.size() == 1);
    REQUIRE(out[0].time == 2.5);
    REQUIRE(out[0].event.note.pitch == 60);
    REQUIRE(out[0].event.note.onset == Approx(1.0));
    REQUIRE(*out[0].event.note.duration == Approx(1.5));
}

TEST_CASE("Delay passes control messages straight through", "[delay][effects]") {
    Delay delay(1.0f);

    const auto out = drive(delay, {closedNote(60, 0.0, 0.5), control(1, 0, 10, 0.5)}, 0.5, 2.0);

    REQUIRE(out.size() == 2);
    REQUIRE(out[0].time == 0.5);
    REQUIRE(out[0].event.isControl());
    REQUIRE(out[1].time == 1.0);
    REQUIRE(out[1].event.isClosedNote());
}

TEST_CASE("Delay amount is fixed when a note is scheduled", "[delay][effects][control]") {
    Parameter amount(1.0f, 0.0f, 4.0f, "delay");
    REQUIRE(amount.bind(7, 0).ok());
    Delay delay(std::move(amount));

    const auto out = drive(delay,
                           {closedNote(60, 0.0, 0.25), control(7, 0, 127, 0.5),
                            closedNote(62, 1.5, 0.25)},
                           0.5, 6.0);

    // The control message is consumed by the amount parameter
    REQUIRE(delay.amount().value() == 4.0f);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].time == 1.0);
    REQUIRE(out[0].event.note.pitch == 60);
    REQUIRE(out[1].time == 5.5);
    REQUIRE(out[1].event.note.pitch == 62);
    REQUIRE(out[1].event.note.onset == Approx(5.5));
}

TEST_CASE("Delay with a negative amount emits immediately", "[delay][effects][edge]") {
    Delay delay(-1.0f);
    const auto out = delay.process(closedNote(60, 0.0, 0.5), 0.0);
    REQUIRE(out.has_value());
    REQUIRE(out->note.onset == 0.0);
}

// =============================================================================
// One event per tick
// =============================================================================

TEST_CASE("Delay emits one event per tick and queues the rest", "[delay][effects][schedule]") {
    Delay delay(1.0f);

    REQUIRE_FALSE(delay.process(closedNote(60, 0.0, 0.5), 0.0).has_value());
    REQUIRE_FALSE(delay.process(closedNote(61, 0.1, 0.5), 0.1).has_value());
    REQUIRE(delay.pendingCount() == 2);

    // Both releases are due; a pass-through arrives in the same tick
    auto first = delay.process(control(1, 0, 5, 2.0), 2.0);
    REQUIRE(first.has_value());
    REQUIRE(first->note.pitch == 60);
    REQUIRE(delay.queuedCount() == 1);

    auto second = delay.process(std::nullopt, 2.1);
    REQUIRE(second.has_value());
    REQUIRE(second->note.pitch == 61);

    auto third = delay.process(std::nullopt, 2.2);
    REQUIRE(third.has_value());
    REQUIRE(third->isControl());

    REQUIRE_FALSE(delay.process(std::nullopt, 2.3).has_value());
}

TEST_CASE("Delay releases equal release times in arrival order", "[delay][effects][schedule]") {
    Delay later(2.0f);
    REQUIRE_FALSE(later.process(closedNote(60, 0.0, 0.5), 1.0).has_value());
    REQUIRE_FALSE(later.process(closedNote(61, 0.0, 0.5), 1.0).has_value());

    auto a = later.process(std::nullopt, 3.0);
    auto b = later.process(std::nullopt, 3.0);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->note.pitch == 60);
    REQUIRE(b->note.pitch == 61);
}

// =============================================================================
// End of stream
// =============================================================================

TEST_CASE("Delay holds end of stream until its buffer is empty", "[delay][effects][eos]") {
    Delay delay(1.0f);

    REQUIRE_FALSE(delay.process(closedNote(60, 0.0, 0.5), 0.0).has_value());
    REQUIRE_FALSE(delay.process(Event::endOfStream(0.5), 0.5).has_value());
    REQUIRE(delay.holdingEndOfStream());

    auto note = delay.process(std::nullopt, 1.0);
    REQUIRE(note.has_value());
    REQUIRE(note->isClosedNote());

    auto end = delay.process(std::nullopt, 1.5);
    REQUIRE(end.has_value());
    REQUIRE(end->isEndOfStream());
    REQUIRE(end->time() == 0.5);
    REQUIRE_FALSE(delay.holdingEndOfStream());
}

TEST_CASE("Delay flush emits everything held in release order", "[delay][effects][flush]") {
    Delay delay(5.0f);
    (void)delay.process(closedNote(60, 0.0, 0.5), 0.5);
    (void)delay.process(closedNote(61, 1.0, 0.5), 1.0);
    (void)delay.process(Event::endOfStream(2.0), 2.0);

    std::vector<Event> flushed;
    delay.flush(flushed, 2.5);

    REQUIRE(flushed.size() == 3);
    REQUIRE(flushed[0].note.pitch == 60);   // released at 5.5
    REQUIRE(flushed[1].note.pitch == 61);   // released at 6.0
    REQUIRE(flushed[2].isEndOfStream());
    REQUIRE(delay.pendingCount() == 0);
}

// =============================================================================
// On/off
// =============================================================================

TEST_CASE("Delay switched off passes notes without delay", "[delay][effects][bypass]") {
    Delay delay(1.0f, false);

    const auto begin = delay.process(Event::noteBegin(60, 100, 0, 0.0), 0.0);
    REQUIRE(begin.has_value());
    REQUIRE(begin->type == Event::Type::NoteBegin);

    const auto note = delay.process(closedNote(62, 0.5, 0.5), 0.5);
    REQUIRE(note.has_value());
    REQUIRE(note->note.onset == 0.5);
}

TEST_CASE("Delay keeps releasing after being switched off", "[delay][effects][bypass]") {
    Switch on(true, "delay on");
    REQUIRE(on.bind(80, 0).ok());
    Delay delay(1.0f, std::move(on));

    REQUIRE_FALSE(delay.process(closedNote(60, 0.0, 0.5), 0.0).has_value());
    REQUIRE_FALSE(delay.process(control(80, 0, 0, 0.5), 0.5).has_value());
    REQUIRE_FALSE(delay.isOn());

    auto released = delay.process(std::nullopt, 1.0);
    REQUIRE(released.has_value());
    REQUIRE(released->note.onset == Approx(1.0));
}

// =============================================================================
// Capacity
// =============================================================================

TEST_CASE("Delay with a capacity drops notes beyond it", "[delay][effects][capacity]") {
    LogCapture capture(LogLevel::Warning);
    Delay delay(1.0f, true, 1);

    (void)delay.process(closedNote(60, 0.0, 0.5), 0.0);
    (void)delay.process(closedNote(61, 0.1, 0.5), 0.1);

    REQUIRE(delay.pendingCount() == 1);
    REQUIRE(delay.rejectedCount() == 1);
    REQUIRE(capture.contains(LogLevel::Warning, "release buffer full"));
}
