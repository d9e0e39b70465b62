// ==============================================================================
// Chain Implementation
// ==============================================================================

#include "chain.h"

#include <midichain/fx/core/log.h>

#include <cstdio>
#include <map>
#include <utility>

namespace Midichain::Fx {

namespace {

Status configurationError(const char* fmt, const std::string& a, const std::string& b = {}) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), fmt, a.c_str(), b.c_str());
    return Status::error(ErrorCode::Configuration, buf);
}

} // namespace

Chain::Chain(Clock& clock, ChainConfig config)
    : clock_(clock), config_(std::move(config)) {}

// =============================================================================
// Build
// =============================================================================

Status Chain::validateTopology(const std::vector<std::unique_ptr<Module>>& modules) const {
    if (modules.empty()) {
        return Status::error(ErrorCode::Configuration, "chain has no modules");
    }

    for (size_t i = 0; i < modules.size(); ++i) {
        if (!modules[i]) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "module %zu is null", i);
            return Status::error(ErrorCode::Configuration, buf);
        }
        const ModuleRole role = modules[i]->role();
        if (role == ModuleRole::Source && i != 0) {
            return configurationError("source '%s' must be the first module",
                                      modules[i]->name());
        }
        if (role == ModuleRole::Sink && i + 1 != modules.size()) {
            return configurationError("sink '%s' must be the last module", modules[i]->name());
        }
    }

    for (size_t i = 1; i < modules.size(); ++i) {
        const Module& previous = *modules[i - 1];
        const Module& next = *modules[i];
        if ((previous.produces() & ~next.accepts()) != 0) {
            return configurationError("'%s' cannot accept what '%s' produces", next.name(),
                                      previous.name());
        }
    }

    // One Controllable per (controller, channel) across the whole chain
    std::map<std::pair<uint8_t, uint8_t>, std::string> owners;
    for (const auto& module : modules) {
        for (const Controllable* controllable : module->controllables()) {
            if (!controllable->isBound()) {
                continue;
            }
            const ControlBinding& binding = controllable->binding();
            std::string owner = module->name() + "." + controllable->name();
            auto [it, inserted] =
                owners.emplace(std::make_pair(binding.controller, binding.channel), owner);
            if (!inserted) {
                char buf[256];
                std::snprintf(buf, sizeof(buf),
                              "controller %u on channel %u is bound by both '%s' and '%s'",
                              binding.controller, binding.channel, it->second.c_str(),
                              owner.c_str());
                return Status::error(ErrorCode::Configuration, buf);
            }
        }
    }
    return Status::success();
}

Status Chain::build(std::vector<std::unique_ptr<Module>> modules) {
    if (running_) {
        return Status::error(ErrorCode::Configuration, "cannot rebuild a running chain");
    }

    Status status = validateTopology(modules);
    if (!status.ok()) {
        MIDICHAIN_LOG_ERROR("%s: %s", config_.name.c_str(), status.message.c_str());
        return status;
    }

    modules_ = std::move(modules);
    hasSource_ = modules_.front()->role() == ModuleRole::Source;
    built_ = true;

    if (logLevel() <= LogLevel::Debug) {
        for (const auto& module : modules_) {
            MIDICHAIN_LOG_DEBUG("%s: %s '%s'", config_.name.c_str(),
                                moduleRoleName(module->role()), module->name().c_str());
        }
    }
    return status;
}

// =============================================================================
// Tick
// =============================================================================

Status Chain::validateInput(const Event& event) {
    Status status = validate(event);
    if (!status.ok()) {
        return status;
    }
    const double time = event.time();
    if (config_.rejectNonMonotonicInput && time < lastInputTime_) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "timestamp %.6f precedes previous input at %.6f", time,
                      lastInputTime_);
        return Status::error(ErrorCode::Validation, buf);
    }
    lastInputTime_ = time;
    return status;
}

std::optional<Event> Chain::forward(std::optional<Event> event, size_t first, double now) {
    for (size_t i = first; i < modules_.size(); ++i) {
        Module& module = *modules_[i];
        event = module.process(std::move(event), now);
        if (module.failed()) {
            // Keep the first Module error
            if (stopReason_ != StopReason::ModuleError) {
                lastError_ = module.status();
            }
            stopReason_ = StopReason::ModuleError;
            return std::nullopt;
        }
    }
    return event;
}

std::optional<Event> Chain::tick(double now, std::optional<Event> input) {
    if (!built_) {
        MIDICHAIN_LOG_ERROR("%s: tick on a chain that was never built", config_.name.c_str());
        return std::nullopt;
    }
    if (finished_ || stopReason_ == StopReason::ModuleError) {
        return std::nullopt;
    }
    ++tickCount_;

    size_t first = 0;
    std::optional<Event> event = std::move(input);
    if (hasSource_) {
        event = modules_.front()->process(std::move(event), now);
        first = 1;
    }

    if (event.has_value()) {
        Status status = validateInput(*event);
        if (!status.ok()) {
            ++rejected_;
            MIDICHAIN_LOG_ERROR("%s: dropping %s: %s", config_.name.c_str(),
                                describe(*event).c_str(), status.message.c_str());
            lastError_ = std::move(status);
            return std::nullopt;
        }
    }

    std::optional<Event> output = forward(std::move(event), first, now);
    if (stopReason_ == StopReason::ModuleError) {
        stop();
        return std::nullopt;
    }

    if (output.has_value() && output->isEndOfStream()) {
        endReached_ = true;
    }
    for (const auto& module : modules_) {
        if (module->requestsStop()) {
            MIDICHAIN_LOG_DEBUG("%s: '%s' requested stop", config_.name.c_str(),
                                module->name().c_str());
            stop();
            break;
        }
    }
    return output;
}

// =============================================================================
// Run / shutdown
// =============================================================================

Status Chain::run() {
    if (!built_) {
        return Status::error(ErrorCode::Configuration, "chain was never built");
    }
    if (finished_) {
        return Status::error(ErrorCode::Configuration, "chain has already finished");
    }

    running_ = true;
    MIDICHAIN_LOG_INFO("%s: running %zu module(s)", config_.name.c_str(), modules_.size());

    while (true) {
        if (stopRequested()) {
            stopReason_ = StopReason::StopRequested;
            break;
        }
        if (config_.maxTicks > 0 && tickCount_ >= config_.maxTicks) {
            stopReason_ = StopReason::TickLimit;
            break;
        }

        (void)tick(clock_.now());

        if (stopReason_ == StopReason::ModuleError) {
            running_ = false;
            MIDICHAIN_LOG_ERROR("%s: stopped after %llu tick(s): %s", config_.name.c_str(),
                                static_cast<unsigned long long>(tickCount_),
                                lastError_.message.c_str());
            return lastError_;
        }
        if (endReached_) {
            stopReason_ = StopReason::EndOfStream;
            break;
        }
        clock_.waitForNextTick();
    }

    (void)finish(clock_.now());
    running_ = false;
    MIDICHAIN_LOG_INFO("%s: stopped after %llu tick(s) (%s)", config_.name.c_str(),
                       static_cast<unsigned long long>(tickCount_), stopReasonName(stopReason_));
    if (stopReason_ == StopReason::ModuleError) {
        return lastError_;
    }
    return Status::success();
}

std::vector<Event> Chain::finish(double now) {
    std::vector<Event> emitted;
    if (!built_ || finished_) {
        return emitted;
    }
    finished_ = true;

    for (size_t i = 0; i < modules_.size(); ++i) {
        std::vector<Event> flushed;
        modules_[i]->flush(flushed, now);
        for (Event& event : flushed) {
            std::optional<Event> output = forward(std::move(event), i + 1, now);
            if (output.has_value()) {
                emitted.push_back(std::move(*output));
            }
        }
    }
    if (stopReason_ == StopReason::ModuleError) {
        MIDICHAIN_LOG_ERROR("%s: error during shutdown: %s", config_.name.c_str(),
                            lastError_.message.c_str());
    }
    return emitted;
}

} // namespace Midichain::Fx
