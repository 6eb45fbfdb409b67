/**
 * @file types.hpp
 * @brief Fundamental types used throughout runexec.
 *
 * Defines RunLimits, RunRequest, RunResult, TerminationReason and the
 * other shared vocabulary types of a single measured run.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace runexec {

// ─────────────────────────────────────────────
// Time Types
// ─────────────────────────────────────────────

using Duration = std::chrono::microseconds;
using Seconds = std::chrono::duration<double>;
using SteadyTime = std::chrono::steady_clock::time_point;

using Command = std::vector<std::string>;

/**
 * @brief Join a command line with single spaces (the output file header).
 */
[[nodiscard]] std::string join_command(const Command& command);

// ─────────────────────────────────────────────
// Termination Reason
// ─────────────────────────────────────────────

/**
 * @brief Why a run ended. At most one reason is attached per run.
 */
enum class TerminationReason : uint8_t {
    None,          ///< Process exited on its own
    CpuTime,       ///< Hard CPU-time limit
    CpuTimeSoft,   ///< Soft CPU-time limit
    WallTime,      ///< Wall-clock limit
    Killed,        ///< External stop()
    Memory         ///< Resource limiter reported over-quota
};

[[nodiscard]] constexpr std::string_view to_string(TerminationReason reason) noexcept {
    switch (reason) {
        case TerminationReason::None:        return "none";
        case TerminationReason::CpuTime:     return "cputime";
        case TerminationReason::CpuTimeSoft: return "cputime-soft";
        case TerminationReason::WallTime:    return "walltime";
        case TerminationReason::Killed:      return "killed";
        case TerminationReason::Memory:      return "memory";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Limits & Request
// ─────────────────────────────────────────────

/**
 * @brief Optional per-run limits. Time limits are in seconds.
 */
struct RunLimits {
    std::optional<double> hard_time_limit;    ///< CPU seconds, forceful kill
    std::optional<double> soft_time_limit;    ///< CPU seconds, graceful kill
    std::optional<double> wall_time_limit;    ///< Wall seconds, forceful kill
    std::optional<uint64_t> memory_limit;     ///< Bytes

    bool operator==(const RunLimits&) const = default;
};

struct RunRequest {
    Command command;
    std::string output_path;
    RunLimits limits;
};

// ─────────────────────────────────────────────
// Resource Usage
// ─────────────────────────────────────────────

/**
 * @brief Cumulative usage as read back from a resource limiter context.
 */
struct ResourceUsage {
    Duration cpu_time{0};
    std::optional<uint64_t> peak_memory_bytes;
};

// ─────────────────────────────────────────────
// Run Result
// ─────────────────────────────────────────────

/**
 * @brief Outcome of a single run.
 *
 * exit_code follows the engine convention: a process killed by a signal
 * reports the signal number (9 for SIGKILL), never 128+signal and never a
 * raw wait status.
 */
struct RunResult {
    int exit_code{0};
    double wall_time{0.0};
    double cpu_time{0.0};
    std::optional<uint64_t> memory;
    std::optional<TerminationReason> termination_reason;

    /// Result keys in their canonical order; optional keys only when present.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> fields() const;

    /// Single-line JSON object built from fields().
    [[nodiscard]] std::string to_json() const;
};

// ─────────────────────────────────────────────
// Run Phase
// ─────────────────────────────────────────────

enum class RunPhase : uint8_t {
    Idle,
    Spawning,
    Running,
    Finishing,
    Done
};

[[nodiscard]] constexpr std::string_view to_string(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Idle:      return "idle";
        case RunPhase::Spawning:  return "spawning";
        case RunPhase::Running:   return "running";
        case RunPhase::Finishing: return "finishing";
        case RunPhase::Done:      return "done";
    }
    return "unknown";
}

}  // namespace runexec
