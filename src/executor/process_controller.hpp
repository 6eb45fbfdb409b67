/**
 * @file process_controller.hpp
 * @brief Spawns the child, delivers kill requests, waits for exit.
 *
 * The child runs in its own process group with stdin from /dev/null and
 * stdout/stderr on the given descriptor. It is attached to the limiter
 * context before it execs.
 *
 * Kill requests and reaping share one mutex: once the child has been
 * observed to exit no signal is ever sent, so a recycled pid is never hit.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <sys/types.h>

namespace runexec {

class ILimiterContext;

enum class KillMode : uint8_t {
    Graceful,   ///< SIGTERM, escalated to SIGKILL after the grace period
    Forceful    ///< SIGKILL
};

/**
 * @brief Reconciled exit status of the child.
 */
struct ExitStatus {
    int exit_code{0};                    ///< Own exit code, or the terminating signal number
    std::optional<int> signal;           ///< Terminating signal, if any
    Duration cpu_time{0};                ///< rusage user + system of the reaped tree
    std::optional<uint64_t> max_rss_bytes;
};

/**
 * @brief Turn a raw wait status into an ExitStatus (signal number, not 128+signal).
 */
[[nodiscard]] ExitStatus reconcile_exit_status(int wait_status);

class ProcessController {
public:
    /**
     * @brief Fork and exec `command`.
     *
     * @param output_fd   receives the child's stdout and stderr
     * @param limiter     context the child is attached to before exec (may be null)
     * @param grace_period SIGTERM → SIGKILL escalation window
     *
     * Fails with ErrorCode::Spawn if the executable cannot be run.
     */
    static Result<std::unique_ptr<ProcessController>> spawn(
        const Command& command,
        int output_fd,
        ILimiterContext* limiter,
        std::chrono::milliseconds grace_period);

    ~ProcessController();

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;

    /**
     * @brief Signal the child's process group. Idempotent and thread-safe.
     * @return true if a signal was sent, false if the child already exited.
     */
    bool request_kill(KillMode mode);

    /**
     * @brief Block until the child exits, then reap it.
     *
     * `before_reap` runs after the child has exited but while it is still a
     * zombie, so /proc data of the pid is final and cannot belong to a
     * different process yet.
     */
    Result<ExitStatus> wait(const std::function<void()>& before_reap = {});

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool exited() const;

    /// Limiter attach failure, if any (the child runs unattached then).
    [[nodiscard]] const std::optional<Error>& attach_error() const noexcept { return attach_error_; }

private:
    ProcessController(pid_t pid, std::chrono::milliseconds grace_period);

    bool send_signal_locked(int signal);
    void escalation_loop(std::stop_token stop);

    pid_t pid_;
    std::chrono::milliseconds grace_period_;
    std::optional<Error> attach_error_;

    std::mutex escalation_mutex_;
    std::condition_variable_any escalation_cv_;

    mutable std::mutex mutex_;
    bool exited_{false};
    bool reaped_{false};
    bool forceful_sent_{false};
    std::jthread escalation_;
};

}  // namespace runexec
