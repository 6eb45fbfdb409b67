/**
 * @file run_executor.cpp
 * @brief RunExecutor implementation.
 */

#include "executor/run_executor.hpp"
#include "core/limits.hpp"
#include "executor/output_sink.hpp"
#include "executor/process_controller.hpp"
#include "executor/run_state.hpp"
#include "executor/timer_set.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace runexec {

namespace {

/// Clears the busy flag when execute_run returns.
class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyGuard() { flag_.store(false); }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

Duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<Duration>(Seconds{seconds});
}

double to_seconds(Duration d) {
    return std::chrono::duration_cast<Seconds>(d).count();
}

}  // anonymous namespace

RunExecutor::RunExecutor(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , limiter_(opts.limiter ? std::move(opts.limiter) : make_limiter(config_.limiter)) {
    logger_.debug(std::format("Resource limiter backend: {}", limiter_->name()));
}

RunExecutor::~RunExecutor() {
    stop();
}

Result<RunResult> RunExecutor::execute_run(const Command& command,
                                           const std::string& output_path,
                                           const RunLimits& limits) {
    return execute_run(RunRequest{command, output_path, limits});
}

Result<RunResult> RunExecutor::execute_run(const RunRequest& request) {
    if (busy_.exchange(true)) {
        return Error{"RunExecutor is already running a command", ErrorCode::Config};
    }
    BusyGuard guard(busy_);

    if (auto valid = validate_command(request.command); !valid) {
        logger_.warn("Rejected run: " + valid.error().message);
        return std::move(valid).error();
    }
    auto limits = normalize_limits(request.limits);
    if (!limits) {
        logger_.warn("Rejected run: " + limits.error().message);
        return std::move(limits).error();
    }

    phase_.store(RunPhase::Spawning);
    auto result = run(request, *limits);
    phase_.store(RunPhase::Done);

    if (result) {
        logger_.info(std::format("Run finished: {}", result->to_json()));
    } else {
        logger_.error(std::format("Run failed ({}): {}",
                                  to_string(result.error().code), result.error().message));
    }
    return result;
}

void RunExecutor::stop() {
    std::lock_guard lock(active_mutex_);
    if (!active_state_) return;

    active_state_->request_stop();
    logger_.info("Stop requested, killing the active run");
    if (active_controller_) {
        active_controller_->request_kill(KillMode::Forceful);
    }
}

void RunExecutor::register_state(RunState* state) {
    std::lock_guard lock(active_mutex_);
    active_state_ = state;
}

void RunExecutor::register_controller(ProcessController* controller) {
    std::lock_guard lock(active_mutex_);
    active_controller_ = controller;
    // stop() may have arrived while the child was being spawned.
    if (active_state_ && active_state_->stop_requested()) {
        controller->request_kill(KillMode::Forceful);
    }
}

void RunExecutor::unregister_run() {
    std::lock_guard lock(active_mutex_);
    active_state_ = nullptr;
    active_controller_ = nullptr;
}

Result<std::unique_ptr<ILimiterContext>> RunExecutor::create_context(const RunLimits& limits) {
    auto context = limiter_->create(limits);
    if (context) return context;

    logger_.warn(std::format("{} limiter unavailable ({}), falling back to procfs",
                             limiter_->name(), context.error().message));
    return fallback_limiter_.create(limits);
}

Result<RunResult> RunExecutor::run(const RunRequest& request, const RunLimits& limits) {
    logger_.info(std::format("Starting run: {} -> {}", join_command(request.command),
                             request.output_path));

    auto sink = OutputSink::open(request.output_path,
                                 OutputFormat{config_.output.separator_char,
                                              config_.output.separator_width});
    if (!sink) return std::move(sink).error();
    if (auto header = sink->write_header(request.command); !header) {
        return std::move(header).error();
    }
    if (auto separator = sink->write_separator(); !separator) {
        return std::move(separator).error();
    }

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return Error{std::format("pipe2 failed: {}", std::strerror(errno)), ErrorCode::Internal};
    }
    const int read_fd = pipe_fds[0];
    const int write_fd = pipe_fds[1];

    auto context_result = create_context(limits);
    if (!context_result) {
        ::close(read_fd);
        ::close(write_fd);
        return Error{"Cannot create resource limiter context: "
                     + context_result.error().message, ErrorCode::Limiter};
    }
    std::unique_ptr<ILimiterContext> context = std::move(*context_result);
    logger_.debug(std::format("Limiter context created ({})", context->backend()));

    RunState state;
    register_state(&state);

    const SteadyTime spawn_time = std::chrono::steady_clock::now();
    auto spawned = ProcessController::spawn(
        request.command, write_fd, context.get(),
        std::chrono::milliseconds{config_.executor.grace_period_ms});
    ::close(write_fd);

    if (!spawned) {
        unregister_run();
        ::close(read_fd);
        if (auto closed = sink->close(); !closed) {
            logger_.warn("Closing output after failed spawn: " + closed.error().message);
        }
        if (auto released = context->destroy(); !released) {
            logger_.warn("Releasing limiter context: " + released.error().message);
        }
        return std::move(spawned).error();
    }
    std::unique_ptr<ProcessController> controller = std::move(*spawned);
    logger_.debug(std::format("Spawned pid {}", controller->pid()));
    if (const auto& attach_error = controller->attach_error()) {
        logger_.warn(std::format("Child {} runs without limiter attachment: {}",
                                 controller->pid(), attach_error->message));
    }

    std::optional<Result<uint64_t>> drained;
    std::jthread drain_thread(
        [&drained, &sink, read_fd,
         linger = std::chrono::milliseconds{config_.executor.drain_linger_ms}](
            std::stop_token stop) { drained.emplace(sink->drain(read_fd, stop, linger)); });

    register_controller(controller.get());
    phase_.store(RunPhase::Running);

    ProcessController* process = controller.get();
    ILimiterContext* limiter_context = context.get();
    TimerSet timers([limiter_context] { return limiter_context->read_usage().cpu_time; },
                    std::chrono::milliseconds{config_.executor.cpu_poll_interval_ms});

    if (limits.soft_time_limit) {
        timers.arm_cpu(TimerKind::SoftCpu, seconds_to_duration(*limits.soft_time_limit),
                       [this, &state, process] {
            if (state.try_set_reason(TerminationReason::CpuTimeSoft)) {
                logger_.info("Soft CPU time limit reached, terminating");
            }
            process->request_kill(KillMode::Graceful);
        });
    }
    if (limits.hard_time_limit) {
        timers.arm_cpu(TimerKind::HardCpu, seconds_to_duration(*limits.hard_time_limit),
                       [this, &state, process] {
            if (state.try_set_reason(TerminationReason::CpuTime)) {
                logger_.info("Hard CPU time limit reached, killing");
            }
            process->request_kill(KillMode::Forceful);
        });
    }
    if (limits.wall_time_limit) {
        auto deadline = spawn_time + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            Seconds{*limits.wall_time_limit});
        timers.arm_wall(deadline, [this, &state, process] {
            if (state.try_set_reason(TerminationReason::WallTime)) {
                logger_.info("Wall time limit reached, killing");
            }
            process->request_kill(KillMode::Forceful);
        });
    }

    SteadyTime exit_time = spawn_time;
    ResourceUsage final_usage;
    bool memory_exceeded = false;
    // Runs while the child is a zombie: its pid cannot have been reused yet.
    auto waited = controller->wait([&] {
        exit_time = std::chrono::steady_clock::now();
        timers.cancel();
        final_usage = limiter_context->read_usage();
        memory_exceeded = limiter_context->memory_exceeded();
        limiter_context->detach();
    });
    phase_.store(RunPhase::Finishing);

    drain_thread.request_stop();
    drain_thread.join();
    ::close(read_fd);

    auto closed = sink->close();

    if (memory_exceeded && state.try_set_reason(TerminationReason::Memory)) {
        logger_.info("Memory limit exceeded");
    }
    if (auto released = context->destroy(); !released) {
        logger_.warn("Releasing limiter context: " + released.error().message);
    }

    unregister_run();

    if (!waited) return std::move(waited).error();
    const ExitStatus& status = *waited;

    if (drained && !*drained) {
        return std::move(*drained).error().with_exit_code(status.exit_code);
    }
    if (!closed) {
        return std::move(closed).error().with_exit_code(status.exit_code);
    }

    RunResult result;
    result.exit_code = status.exit_code;
    result.wall_time = std::chrono::duration_cast<Seconds>(exit_time - spawn_time).count();
    result.cpu_time = to_seconds(std::max(final_usage.cpu_time, status.cpu_time));
    result.memory = final_usage.peak_memory_bytes ? final_usage.peak_memory_bytes
                                                  : status.max_rss_bytes;
    if (auto reason = state.reason(); reason != TerminationReason::None) {
        result.termination_reason = reason;
    }
    return result;
}

}  // namespace runexec
