/**
 * @file main.cpp
 * @brief runexec command-line driver.
 *
 * Wires the modules for a single run:
 *   CLI → Config → Logger → RunExecutor → key=value result on stdout
 *
 * SIGINT and SIGTERM are routed to RunExecutor::stop() by a signal-waiting
 * thread, so the measured child is killed and still reported.
 */

#include "app/cli.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/run_executor.hpp"
#include "telemetry/log_sinks.hpp"

#include <csignal>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

using namespace runexec;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

/**
 * @brief Wait for SIGINT/SIGTERM and stop the active run.
 *
 * The signals are blocked in every thread, so only sigtimedwait() sees them.
 */
void watch_signals(std::stop_token stop, RunExecutor& executor) {
    const sigset_t set = shutdown_signals();
    const timespec timeout{0, 200'000'000};
    while (!stop.stop_requested()) {
        int sig = ::sigtimedwait(&set, nullptr, &timeout);
        if (sig < 0) continue;  // EAGAIN on timeout, EINTR
        executor.logger().info("Received signal " + std::to_string(sig) + ", stopping run");
        executor.stop();
    }
}

std::unique_ptr<ILogSink> make_log_sink(const LoggingConfig& logging) {
    if (logging.log_dir.empty()) {
        return std::make_unique<StderrSink>();
    }
    return std::make_unique<JsonFileSink>(logging.log_dir, "runexec",
                                          logging.max_file_size_mb, logging.rotate_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = cli::parse_args(argc, argv);
    if (!args) {
        std::cerr << "runexec: " << args.error().message << "\n\n" << cli::usage();
        return kExitUsage;
    }
    if (args->show_help) {
        std::cout << cli::usage();
        return kExitOk;
    }

    // Load configuration
    Config config = default_config();
    if (args->config_path) {
        auto loaded = load_config(*args->config_path);
        if (!loaded) {
            std::cerr << "runexec: failed to load config: " << loaded.error().message << '\n';
            return kExitFailure;
        }
        config = std::move(*loaded);
    }
    if (args->log_level) config.logging.level = *args->log_level;

    auto level = parse_log_level(config.logging.level);
    if (!level) {
        std::cerr << "runexec: " << level.error().message << '\n';
        return kExitUsage;
    }

    // Block the shutdown signals before any thread exists; the child unblocks them.
    const sigset_t signals = shutdown_signals();
    if (int rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        std::cerr << "runexec: pthread_sigmask failed: " << std::strerror(rc) << '\n';
        return kExitFailure;
    }

    RunLimits limits = cli::merge_limits(config.limits, args->limits);
    std::string output_path = args->output_path;
    Command command = args->command;

    auto log_sink = make_log_sink(config.logging);
    RunExecutor executor(RunExecutor::Options{
        .config = std::move(config),
        .log_sink = std::move(log_sink),
        .log_level = *level,
        .limiter = nullptr,
    });

    std::jthread signal_watcher([&executor](std::stop_token stop) {
        watch_signals(stop, executor);
    });

    auto result = executor.execute_run(command, output_path, limits);

    signal_watcher.request_stop();
    signal_watcher.join();
    executor.logger().flush();

    if (!result) {
        const auto& error = result.error();
        std::cerr << "runexec: " << error.message << '\n';
        if (error.exit_code) {
            std::cout << "exitcode=" << *error.exit_code << '\n';
        }
        return kExitFailure;
    }

    std::cout << cli::format_result(*result);
    return kExitOk;
}
