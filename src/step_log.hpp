#pragma once

// Mirrors server diagnostics into the active launch step and the log.
// Internal header — not installed.

#include <xmit-cpp/launch_step.hpp>
#include <xmit-cpp/wire.hpp>

#include <spdlog/spdlog.h>

namespace xmit_cpp::detail {

// The team-required marker is left to the caller, which acts on it.
inline void log_diagnostics(StepTracker& tracker, const Diagnostics& diagnostics) {
    for (const auto& error : diagnostics.other_errors()) {
        spdlog::warn("server error: {}", error);
        tracker.log("Error: " + error);
    }
    for (const auto& warning : diagnostics.warnings) {
        spdlog::warn("server warning: {}", warning);
        tracker.log("Warning: " + warning);
    }
    for (const auto& message : diagnostics.messages) {
        spdlog::info("server: {}", message);
        tracker.log(message);
    }
}

}  // namespace xmit_cpp::detail
