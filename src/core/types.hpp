/**
 * @file types.hpp
 * @brief Fundamental types used throughout DeadlineGroup.
 * @author DeadlineGroup contributors
 *
 * Defines the clock aliases, task identity and the execution phase
 * vocabulary shared by the engine, logging and tests.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deadline_group {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using GroupName = std::string;
using TaskIndex = std::size_t;                 ///< Position in the group's task list
using Duration = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/// Structured context attached to a log line, in insertion order.
using LogFields = std::vector<std::pair<std::string, std::string>>;

// ─────────────────────────────────────────────
// Execution Phase
// ─────────────────────────────────────────────

/**
 * @brief Lifecycle of one group execution.
 *
 * Idle → Validating → (Failed | Running) → (DeadlineExpired | AllCompleted)
 * → Draining → Delivered. Failed and Delivered are terminal.
 */
enum class ExecutionPhase : uint8_t {
    Idle,
    Validating,
    Failed,
    Running,
    DeadlineExpired,
    AllCompleted,
    Draining,
    Delivered
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionPhase phase) noexcept {
    switch (phase) {
        case ExecutionPhase::Idle:            return "idle";
        case ExecutionPhase::Validating:      return "validating";
        case ExecutionPhase::Failed:          return "failed";
        case ExecutionPhase::Running:         return "running";
        case ExecutionPhase::DeadlineExpired: return "deadline_expired";
        case ExecutionPhase::AllCompleted:    return "all_completed";
        case ExecutionPhase::Draining:        return "draining";
        case ExecutionPhase::Delivered:       return "delivered";
    }
    return "unknown";
}

}  // namespace deadline_group
