/**
 * @file limits.cpp
 * @brief normalize_limits / validate_command.
 */

#include "core/limits.hpp"

#include <cmath>
#include <format>

namespace runexec {

namespace {

Result<void> check_positive(const std::optional<double>& value, std::string_view name) {
    if (value && (!std::isfinite(*value) || *value <= 0.0)) {
        return Error{std::format("{} must be a positive number of seconds, got {}", name, *value),
                     ErrorCode::Config};
    }
    return {};
}

}  // namespace

Result<RunLimits> normalize_limits(const RunLimits& limits) {
    for (auto check : {check_positive(limits.hard_time_limit, "hardtimelimit"),
                       check_positive(limits.soft_time_limit, "softtimelimit"),
                       check_positive(limits.wall_time_limit, "walltimelimit")}) {
        if (!check) return std::move(check).error();
    }
    if (limits.memory_limit && *limits.memory_limit == 0) {
        return Error{"memlimit must be positive", ErrorCode::Config};
    }

    RunLimits normalized = limits;

    if (normalized.soft_time_limit) {
        if (!normalized.hard_time_limit) {
            return Error{"softtimelimit requires hardtimelimit", ErrorCode::Config};
        }
        if (*normalized.soft_time_limit > *normalized.hard_time_limit) {
            return Error{std::format("softtimelimit ({}) exceeds hardtimelimit ({})",
                                     *normalized.soft_time_limit,
                                     *normalized.hard_time_limit),
                         ErrorCode::Config};
        }
    }

    // Without a CPU limit the wall limit is also the hard CPU limit.
    if (!normalized.hard_time_limit && normalized.wall_time_limit) {
        normalized.hard_time_limit = normalized.wall_time_limit;
    }

    return normalized;
}

Result<void> validate_command(const Command& command) {
    if (command.empty()) {
        return Error{"Command is empty", ErrorCode::Config};
    }
    if (command.front().empty()) {
        return Error{"Executable name is empty", ErrorCode::Config};
    }
    return {};
}

}  // namespace runexec
