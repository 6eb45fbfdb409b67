/**
 * @file limits.hpp
 * @brief Validation and normalization of per-run limits.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

namespace runexec {

/**
 * @brief Check limit invariants and fill in implied values.
 *
 * - a soft CPU limit requires a hard CPU limit that is not below it
 * - time limits must be positive, a memory limit must be non-zero
 * - with no CPU limit at all, a wall limit doubles as the hard CPU limit
 *
 * Fails with ErrorCode::Config; nothing is spawned in that case.
 */
Result<RunLimits> normalize_limits(const RunLimits& limits);

/**
 * @brief Reject an empty command or an empty executable name.
 */
Result<void> validate_command(const Command& command);

}  // namespace runexec
