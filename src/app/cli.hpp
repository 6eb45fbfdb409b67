/**
 * @file cli.hpp
 * @brief Command-line parsing and result formatting for the runexec driver.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace runexec::cli {

struct CliArgs {
    std::optional<std::filesystem::path> config_path;
    std::string output_path = "output.log";
    RunLimits limits;                       ///< Only the limits given on the command line
    std::optional<std::string> log_level;
    bool show_help = false;
    Command command;
};

/**
 * @brief Parse `runexec [options] [--] <command> [args...]`.
 *
 * Option parsing stops at `--` or at the first non-option argument; the
 * rest is the command. Fails with ErrorCode::Config on usage errors.
 */
Result<CliArgs> parse_args(int argc, const char* const argv[]);

[[nodiscard]] std::string usage();

/**
 * @brief Overlay command-line limits on the configured defaults.
 */
[[nodiscard]] RunLimits merge_limits(const RunLimits& defaults, const RunLimits& overrides);

/**
 * @brief One `key=value` line per result field.
 */
[[nodiscard]] std::string format_result(const RunResult& result);

}  // namespace runexec::cli
