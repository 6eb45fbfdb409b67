/**
 * @file cli.cpp
 * @brief Command-line parsing for the runexec driver.
 */

#include "app/cli.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace runexec::cli {

namespace {

Result<double> parse_seconds(std::string_view option, const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return Error{std::string{option} + " expects a number of seconds, got '" + text + "'",
                     ErrorCode::Config};
    }
    return value;
}

Result<uint64_t> parse_bytes(std::string_view option, const std::string& text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{std::string{option} + " expects a number of bytes, got '" + text + "'",
                     ErrorCode::Config};
    }
    return value;
}

}  // anonymous namespace

Result<CliArgs> parse_args(int argc, const char* const argv[]) {
    CliArgs args;
    int i = 1;

    auto next_value = [&](std::string_view option) -> Result<std::string> {
        if (i + 1 >= argc) {
            return Error{std::string{option} + " requires a value", ErrorCode::Config};
        }
        return std::string{argv[++i]};
    };

    for (; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.empty() || arg.front() != '-') break;

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
            return args;
        }

        auto value = next_value(arg);
        if (!value) return std::move(value).error();

        if (arg == "--config") {
            args.config_path = *value;
        } else if (arg == "--output") {
            args.output_path = *value;
        } else if (arg == "--log-level") {
            args.log_level = *value;
        } else if (arg == "--timelimit" || arg == "--softtimelimit" || arg == "--walltimelimit") {
            auto seconds = parse_seconds(arg, *value);
            if (!seconds) return std::move(seconds).error();
            if (arg == "--timelimit") {
                args.limits.hard_time_limit = *seconds;
            } else if (arg == "--softtimelimit") {
                args.limits.soft_time_limit = *seconds;
            } else {
                args.limits.wall_time_limit = *seconds;
            }
        } else if (arg == "--memlimit") {
            auto bytes = parse_bytes(arg, *value);
            if (!bytes) return std::move(bytes).error();
            args.limits.memory_limit = *bytes;
        } else {
            return Error{"Unknown option " + std::string{arg}, ErrorCode::Config};
        }
    }

    for (; i < argc; ++i) {
        args.command.emplace_back(argv[i]);
    }
    if (args.command.empty()) {
        return Error{"No command given", ErrorCode::Config};
    }
    return args;
}

std::string usage() {
    return "Usage: runexec [OPTIONS] [--] <command> [args...]\n"
           "  --config <path>          Configuration file (TOML)\n"
           "  --output <path>          Output file (default: output.log)\n"
           "  --timelimit <s>          Hard CPU time limit, forceful kill\n"
           "  --softtimelimit <s>      Soft CPU time limit, graceful kill\n"
           "  --walltimelimit <s>      Wall time limit\n"
           "  --memlimit <bytes>       Memory limit\n"
           "  --log-level <level>      debug, info, warn or error\n"
           "  --help, -h               Show this help message\n";
}

RunLimits merge_limits(const RunLimits& defaults, const RunLimits& overrides) {
    RunLimits merged = defaults;
    if (overrides.hard_time_limit) merged.hard_time_limit = overrides.hard_time_limit;
    if (overrides.soft_time_limit) merged.soft_time_limit = overrides.soft_time_limit;
    if (overrides.wall_time_limit) merged.wall_time_limit = overrides.wall_time_limit;
    if (overrides.memory_limit) merged.memory_limit = overrides.memory_limit;
    return merged;
}

std::string format_result(const RunResult& result) {
    std::string out;
    for (const auto& [key, value] : result.fields()) {
        out += key;
        out += '=';
        out += value;
        out += '\n';
    }
    return out;
}

}  // namespace runexec::cli
