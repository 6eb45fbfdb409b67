/**
 * @file config.hpp
 * @brief Executor configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace runexec {

struct ExecutorConfig {
    uint32_t cpu_poll_interval_ms = 100;    ///< CPU-limit polling period (bounds overshoot)
    uint32_t grace_period_ms = 1000;        ///< SIGTERM → SIGKILL escalation window
    uint32_t drain_linger_ms = 200;         ///< Max output draining after the child is reaped
};

struct OutputConfig {
    char separator_char = '-';
    uint32_t separator_width = 80;
};

struct LimiterConfig {
    std::string backend = "auto";           ///< "auto", "cgroup", "procfs"
    std::filesystem::path cgroup_root = "/sys/fs/cgroup";
    std::string cgroup_prefix = "runexec_";
};

struct LoggingConfig {
    std::string level = "warn";
    std::filesystem::path log_dir;          ///< empty = stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 *
 * `limits` holds defaults applied by the command-line driver; the engine
 * itself only takes limits from each RunRequest.
 */
struct Config {
    ExecutorConfig executor;
    OutputConfig output;
    LimiterConfig limiter;
    RunLimits limits;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file. The result is validated.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the executor cannot work with.
 */
Result<void> validate_config(const Config& config);

}  // namespace runexec
