// ==============================================================================
// Layer 3: System Tests - Chain
// ==============================================================================
// Build-time validation, the tick loop, shutdown flushing and error paths.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <midichain/fx/effects/delay.h>
#include <midichain/fx/systems/chain.h>
#include <midichain/fx/systems/endpoints.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "test_helpers/pipeline_helpers.h"

using namespace Midichain::Fx;
using Catch::Approx;
using TestHelpers::closedNote;
using TestHelpers::control;
using TestHelpers::LogCapture;
using TestHelpers::makeModules;
using TestHelpers::RejectingSink;

namespace {

/// Accepts assembled notes only.
class NotesOnly : public Module {
public:
    NotesOnly() : Module("Notes only") {}
    [[nodiscard]] EventMask accepts() const noexcept override { return kNoteEvents; }
};

std::unique_ptr<Delay> boundDelay(float seconds, int controller, int channel) {
    Parameter amount(seconds, 0.0f, 4.0f, "delay");
    (void)amount.bind(controller, channel);
    return std::make_unique<Delay>(std::move(amount));
}

} // namespace

// =============================================================================
// End to end
// =============================================================================

TEST_CASE("Chain runs source, delay and sink end to end", "[chain][systems]") {
    ManualClock clock(0.5);
    SequenceSource source({Event::noteBegin(60, 100, 0, 0.0), Event::noteEnd(60, 0, 0, 1.5)});
    EventRecorder recorder;

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<Delay>(1.0f),
                                    std::make_unique<SinkModule>(recorder)))
                .ok());

    const Status result = chain.run();
    REQUIRE(result.ok());
    REQUIRE(chain.stopReason() == StopReason::EndOfStream);

    const auto notes = recorder.notes();
    REQUIRE(notes.size() == 1);
    REQUIRE(notes[0].emittedAt == 2.5);
    REQUIRE(notes[0].event.note.pitch == 60);
    REQUIRE(notes[0].event.note.channel == 0);
    REQUIRE(*notes[0].event.note.duration == Approx(1.5));
    REQUIRE(notes[0].event.note.onset == Approx(1.0));

    // End of stream follows once the delay has emptied
    REQUIRE(recorder.records().size() == 2);
    REQUIRE(recorder.records()[1].event.isEndOfStream());
    REQUIRE(recorder.records()[1].emittedAt == 3.0);
    REQUIRE(recorder.closed());
    REQUIRE(chain.tickCount() == 7);
    REQUIRE_FALSE(chain.isRunning());
}

TEST_CASE("Chain delays a pulse train until the pulses run out", "[chain][systems][pulse]") {
    ManualClock clock(0.25);
    PulseSource pulses({.interval = 0.5, .duration = 0.1, .count = 3});
    EventRecorder recorder;

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(pulses),
                                    std::make_unique<Delay>(1.0f),
                                    std::make_unique<SinkModule>(recorder)))
                .ok());

    REQUIRE(chain.run().ok());
    REQUIRE(chain.stopReason() == StopReason::EndOfStream);

    const auto notes = recorder.notes();
    REQUIRE(notes.size() == 3);
    for (size_t i = 0; i < notes.size(); ++i) {
        const double expected = 1.0 + 0.5 * static_cast<double>(i);
        REQUIRE(notes[i].emittedAt == expected);
        REQUIRE(notes[i].event.note.onset == Approx(expected));
        REQUIRE(notes[i].event.note.pitch == 69);
        REQUIRE(*notes[i].event.note.duration == Approx(0.1));
    }
    REQUIRE(recorder.records().back().event.isEndOfStream());
}

TEST_CASE("Chain without endpoints is driven tick by tick", "[chain][systems]") {
    ManualClock clock;
    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<Delay>(1.0f))).ok());
    REQUIRE(chain.size() == 1);

    REQUIRE_FALSE(chain.tick(0.0, closedNote(60, 0.0, 0.5)).has_value());
    REQUIRE_FALSE(chain.tick(0.5).has_value());

    const auto out = chain.tick(1.0);
    REQUIRE(out.has_value());
    REQUIRE(out->note.onset == Approx(1.0));
}

// =============================================================================
// Build validation
// =============================================================================

TEST_CASE("Chain::build rejects invalid topologies", "[chain][systems][config]") {
    ManualClock clock;
    Chain chain(clock);
    SequenceSource source({});
    EventRecorder recorder;

    SECTION("no modules") {
        REQUIRE(chain.build({}).code == ErrorCode::Configuration);
    }

    SECTION("null module") {
        std::vector<std::unique_ptr<Module>> modules;
        modules.push_back(nullptr);
        REQUIRE(chain.build(std::move(modules)).code == ErrorCode::Configuration);
    }

    SECTION("source not first") {
        const Status status = chain.build(makeModules(std::make_unique<Delay>(1.0f),
                                                      std::make_unique<SourceModule>(source)));
        REQUIRE(status.code == ErrorCode::Configuration);
        REQUIRE(status.message.find("first") != std::string::npos);
    }

    SECTION("two sources") {
        SequenceSource other({});
        REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                        std::make_unique<SourceModule>(other)))
                    .code == ErrorCode::Configuration);
    }

    SECTION("sink not last") {
        const Status status = chain.build(makeModules(std::make_unique<SinkModule>(recorder),
                                                      std::make_unique<Delay>(1.0f)));
        REQUIRE(status.code == ErrorCode::Configuration);
        REQUIRE(status.message.find("last") != std::string::npos);
    }

    SECTION("incompatible neighbours") {
        const Status status = chain.build(makeModules(std::make_unique<SourceModule>(source),
                                                      std::make_unique<NotesOnly>()));
        REQUIRE(status.code == ErrorCode::Configuration);
        REQUIRE(status.message.find("Notes only") != std::string::npos);
    }

    REQUIRE_FALSE(chain.isBuilt());
}

TEST_CASE("Chain::build rejects duplicate control bindings", "[chain][systems][config]") {
    ManualClock clock;
    Chain chain(clock);

    const Status status =
        chain.build(makeModules(boundDelay(1.0f, 7, 0), boundDelay(2.0f, 7, 0)));

    REQUIRE(status.code == ErrorCode::Configuration);
    REQUIRE(status.message.find("controller 7 on channel 0") != std::string::npos);
    REQUIRE_FALSE(chain.isBuilt());
}

TEST_CASE("Chain::build accepts distinct bindings", "[chain][systems][config]") {
    ManualClock clock;
    Chain chain(clock);

    REQUIRE(chain.build(makeModules(boundDelay(1.0f, 7, 0), boundDelay(2.0f, 7, 1))).ok());
    REQUIRE(chain.isBuilt());
}

// =============================================================================
// Input validation
// =============================================================================

TEST_CASE("Chain drops malformed input", "[chain][systems][validation]") {
    LogCapture capture(LogLevel::Error);
    ManualClock clock;
    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<Delay>(0.0f))).ok());

    REQUIRE_FALSE(chain.tick(0.0, control(200, 0, 1, 0.0)).has_value());
    REQUIRE(chain.rejectedCount() == 1);
    REQUIRE(chain.lastError().code == ErrorCode::Validation);
    REQUIRE(capture.count(LogLevel::Error) == 1);

    // The chain keeps going
    const auto out = chain.tick(0.1, control(7, 0, 1, 0.1));
    REQUIRE(out.has_value());
}

TEST_CASE("Chain rejects timestamps going backwards", "[chain][systems][validation]") {
    ManualClock clock;

    SECTION("by default") {
        Chain chain(clock);
        REQUIRE(chain.build(makeModules(std::make_unique<Delay>(0.0f))).ok());
        REQUIRE(chain.tick(1.0, control(1, 0, 1, 1.0)).has_value());
        REQUIRE_FALSE(chain.tick(1.1, control(1, 0, 1, 0.5)).has_value());
        REQUIRE(chain.rejectedCount() == 1);
    }

    SECTION("unless disabled") {
        ChainConfig config;
        config.rejectNonMonotonicInput = false;
        Chain chain(clock, config);
        REQUIRE(chain.build(makeModules(std::make_unique<Delay>(0.0f))).ok());
        REQUIRE(chain.tick(1.0, control(1, 0, 1, 1.0)).has_value());
        REQUIRE(chain.tick(1.1, control(1, 0, 1, 0.5)).has_value());
        REQUIRE(chain.rejectedCount() == 0);
    }
}

// =============================================================================
// Stop and shutdown
// =============================================================================

TEST_CASE("Chain flushes held notes to the sink on stop", "[chain][systems][stop]") {
    ManualClock clock(1.0);
    SequenceSource source({closedNote(60, 0.0, 0.5)}, false);
    EventRecorder recorder;

    ChainConfig config;
    config.maxTicks = 5;
    Chain chain(clock, config);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<Delay>(10.0f),
                                    std::make_unique<SinkModule>(recorder)))
                .ok());

    REQUIRE(chain.run().ok());
    REQUIRE(chain.stopReason() == StopReason::TickLimit);
    REQUIRE(chain.tickCount() == 5);

    REQUIRE(recorder.records().size() == 1);
    REQUIRE(recorder.records()[0].emittedAt == 5.0);
    REQUIRE(recorder.records()[0].event.note.onset == Approx(10.0));
    REQUIRE(recorder.closed());
}

TEST_CASE("Chain::stop before run shuts down cleanly", "[chain][systems][stop]") {
    ManualClock clock;
    SequenceSource source({control(1, 0, 1, 0.0)});
    EventRecorder recorder;

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<SinkModule>(recorder)))
                .ok());
    chain.stop();

    REQUIRE(chain.run().ok());
    REQUIRE(chain.stopReason() == StopReason::StopRequested);
    REQUIRE(chain.tickCount() == 0);
    REQUIRE(recorder.records().empty());
    REQUIRE(recorder.closed());
    REQUIRE(chain.isFinished());
}

TEST_CASE("Chain stops when the sink asks to", "[chain][systems][stop]") {
    ManualClock clock(0.1);
    SequenceSource source({control(1, 0, 1, 0.0), control(2, 0, 1, 0.0), control(3, 0, 1, 0.0)});
    EventRecorder recorder(1);

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<SinkModule>(recorder)))
                .ok());

    REQUIRE(chain.run().ok());
    REQUIRE(chain.stopReason() == StopReason::StopRequested);
    REQUIRE(recorder.records().size() == 1);
    REQUIRE(source.remaining() == 2);
}

TEST_CASE("Chain::finish returns what leaves the last module", "[chain][systems][stop]") {
    ManualClock clock;
    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<Delay>(5.0f), std::make_unique<Delay>(1.0f)))
                .ok());

    REQUIRE_FALSE(chain.tick(0.0, closedNote(60, 0.0, 0.5)).has_value());
    REQUIRE_FALSE(chain.tick(0.5, Event::endOfStream(0.5)).has_value());

    const auto flushed = chain.finish(1.0);
    REQUIRE(flushed.size() == 2);
    REQUIRE(flushed[0].note.onset == Approx(6.0));
    REQUIRE(flushed[1].isEndOfStream());

    REQUIRE(chain.finish(2.0).empty());
    REQUIRE_FALSE(chain.tick(3.0).has_value());
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Chain logs and survives non-fatal sink failures", "[chain][systems][error]") {
    LogCapture capture(LogLevel::Warning);
    ManualClock clock;
    SequenceSource source({control(1, 0, 1, 0.0)});
    RejectingSink sink;

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<SinkModule>(sink)))
                .ok());

    REQUIRE(chain.run().ok());
    REQUIRE(chain.stopReason() == StopReason::EndOfStream);
    REQUIRE(sink.attempts == 2);
    REQUIRE(sink.closed);
    REQUIRE(capture.contains(LogLevel::Warning, "failed to emit"));
}

TEST_CASE("Chain stops on a fatal sink failure without flushing", "[chain][systems][error]") {
    LogCapture capture(LogLevel::Error);
    ManualClock clock;
    SequenceSource source({control(1, 0, 1, 0.0), control(2, 0, 1, 0.0)});
    RejectingSink sink;

    Chain chain(clock);
    REQUIRE(chain.build(makeModules(std::make_unique<SourceModule>(source),
                                    std::make_unique<SinkModule>(sink, SinkOptions{true})))
                .ok());

    const Status result = chain.run();
    REQUIRE(result.code == ErrorCode::Sink);
    REQUIRE(chain.stopReason() == StopReason::ModuleError);
    REQUIRE(chain.lastError().code == ErrorCode::Sink);
    REQUIRE(sink.attempts == 1);
    REQUIRE_FALSE(sink.closed);
    REQUIRE(chain.tickCount() == 1);
}

TEST_CASE("Chain refuses to run before build", "[chain][systems][error]") {
    ManualClock clock;
    Chain chain(clock);
    REQUIRE(chain.run().code == ErrorCode::Configuration);
    REQUIRE_FALSE(chain.tick(0.0).has_value());
}
