/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace runexec {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::Config};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.cpu_poll_interval_ms = static_cast<uint32_t>(
                executor["cpu_poll_interval_ms"].value_or(int64_t{100}));
            config.executor.grace_period_ms = static_cast<uint32_t>(
                executor["grace_period_ms"].value_or(int64_t{1000}));
            config.executor.drain_linger_ms = static_cast<uint32_t>(
                executor["drain_linger_ms"].value_or(int64_t{200}));
        }

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            auto separator = output["separator_char"].value_or(std::string{"-"});
            if (separator.size() != 1) {
                return Error{"output.separator_char must be a single character",
                             ErrorCode::Config};
            }
            config.output.separator_char = separator.front();
            config.output.separator_width = static_cast<uint32_t>(
                output["separator_width"].value_or(int64_t{80}));
        }

        // [limiter]
        if (auto limiter = tbl["limiter"]; limiter.is_table()) {
            config.limiter.backend = limiter["backend"].value_or(std::string{"auto"});
            config.limiter.cgroup_root =
                limiter["cgroup_root"].value_or(std::string{"/sys/fs/cgroup"});
            config.limiter.cgroup_prefix =
                limiter["cgroup_prefix"].value_or(std::string{"runexec_"});
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.hard_time_limit = limits["hardtimelimit"].value<double>();
            config.limits.soft_time_limit = limits["softtimelimit"].value<double>();
            config.limits.wall_time_limit = limits["walltimelimit"].value<double>();
            if (auto mem = limits["memlimit"].value<int64_t>()) {
                if (*mem <= 0) {
                    return Error{"limits.memlimit must be positive", ErrorCode::Config};
                }
                config.limits.memory_limit = static_cast<uint64_t>(*mem);
            }
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{"warn"});
            config.logging.log_dir = logging["log_dir"].value_or(std::string{});
            config.logging.max_file_size_mb = static_cast<uint32_t>(
                logging["max_file_size_mb"].value_or(int64_t{50}));
            config.logging.rotate_count = static_cast<uint32_t>(
                logging["rotate_count"].value_or(int64_t{5}));
        }

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Config};
    }

    if (auto valid = validate_config(config); !valid) {
        return std::move(valid).error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.executor.cpu_poll_interval_ms == 0) {
        return Error{"executor.cpu_poll_interval_ms must be positive", ErrorCode::Config};
    }
    if (config.output.separator_width == 0) {
        return Error{"output.separator_width must be positive", ErrorCode::Config};
    }
    if (config.output.separator_char == '\n' || config.output.separator_char == '\r') {
        return Error{"output.separator_char must not be a line break", ErrorCode::Config};
    }
    const auto& backend = config.limiter.backend;
    if (backend != "auto" && backend != "cgroup" && backend != "procfs") {
        return Error{"Unknown limiter backend: " + backend, ErrorCode::Config};
    }
    if (auto level = parse_log_level(config.logging.level); !level) {
        return std::move(level).error();
    }
    return {};
}

}  // namespace runexec
