/**
 * @file run_executor.hpp
 * @brief RunExecutor: runs one command under limits and measures it.
 *
 * Ties the modules together for a single run:
 *   1. normalize limits, open the output file, write header and separator
 *   2. create a limiter context, spawn the child attached to it
 *   3. drain child output and arm the limit timers
 *   4. wait for exit, reconcile, tear everything down in reverse order
 *
 * One run at a time per instance; stop() may be called from any thread.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "limiter/limiter.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace runexec {

class ProcessController;
class RunState;

class RunExecutor {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Warn;
        std::unique_ptr<IResourceLimiter> limiter;   ///< null = make_limiter(config.limiter)
    };

    explicit RunExecutor(Options opts);
    ~RunExecutor();

    // Non-copyable, non-movable
    RunExecutor(const RunExecutor&) = delete;
    RunExecutor& operator=(const RunExecutor&) = delete;

    /**
     * @brief Execute `request.command` and block until it has terminated.
     *
     * Limit firings and stop() still yield a RunResult (with a termination
     * reason). Errors: Config (before anything is spawned), Spawn, Io (with
     * the child's exit code when it ran).
     */
    Result<RunResult> execute_run(const RunRequest& request);

    Result<RunResult> execute_run(const Command& command,
                                  const std::string& output_path,
                                  const RunLimits& limits = {});

    /**
     * @brief Kill the active run, if any. Returns immediately.
     */
    void stop();

    [[nodiscard]] RunPhase phase() const noexcept { return phase_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return busy_.load(); }

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    IResourceLimiter& limiter() { return *limiter_; }

private:
    Result<RunResult> run(const RunRequest& request, const RunLimits& limits);
    Result<std::unique_ptr<ILimiterContext>> create_context(const RunLimits& limits);

    void register_state(RunState* state);
    void register_controller(ProcessController* controller);
    void unregister_run();

    Config config_;
    Logger logger_;
    std::unique_ptr<IResourceLimiter> limiter_;
    ProcfsLimiter fallback_limiter_;

    std::atomic<bool> busy_{false};
    std::atomic<RunPhase> phase_{RunPhase::Idle};

    // Guards the active run pointers; held across kill requests from stop().
    std::mutex active_mutex_;
    RunState* active_state_{nullptr};
    ProcessController* active_controller_{nullptr};
};

}  // namespace runexec
