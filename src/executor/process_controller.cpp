/**
 * @file process_controller.cpp
 * @brief ProcessController implementation (fork/exec, signals, reaping).
 */

#include "executor/process_controller.hpp"
#include "limiter/limiter.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runexec {

namespace {

Duration to_duration(const timeval& tv) {
    return Duration{static_cast<int64_t>(tv.tv_sec) * 1'000'000 + tv.tv_usec};
}

void close_pair(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

/// Report errno to the parent over the exec-error pipe and exit.
[[noreturn]] void fail_child(int err_fd) {
    int err = errno;
    ssize_t ignored = ::write(err_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

/**
 * @brief Child side of spawn(). Only async-signal-safe calls from here on.
 */
[[noreturn]] void exec_child(char* const* argv, int devnull, int output_fd,
                             int go_fd, int err_fd) {
    ::setpgid(0, 0);

    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig != SIGKILL && sig != SIGSTOP) {
            ::sigaction(sig, &dfl, nullptr);
        }
    }
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    if (::dup2(devnull, STDIN_FILENO) < 0
        || ::dup2(output_fd, STDOUT_FILENO) < 0
        || ::dup2(output_fd, STDERR_FILENO) < 0) {
        fail_child(err_fd);
    }

    // Wait until the parent has attached us to the limiter context.
    char go = 0;
    ssize_t n;
    do {
        n = ::read(go_fd, &go, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) ::_exit(127);

    ::execvp(argv[0], argv);
    fail_child(err_fd);
}

}  // anonymous namespace

ExitStatus reconcile_exit_status(int wait_status) {
    ExitStatus status;
    if (WIFSIGNALED(wait_status)) {
        status.signal = WTERMSIG(wait_status);
        status.exit_code = *status.signal;
    } else if (WIFEXITED(wait_status)) {
        status.exit_code = WEXITSTATUS(wait_status);
    }
    return status;
}

ProcessController::ProcessController(pid_t pid, std::chrono::milliseconds grace_period)
    : pid_(pid), grace_period_(grace_period) {}

ProcessController::~ProcessController() {
    bool reaped;
    {
        std::lock_guard lock(mutex_);
        reaped = reaped_;
    }
    if (!reaped) {
        request_kill(KillMode::Forceful);
        [[maybe_unused]] auto status = wait();
    }
}

Result<std::unique_ptr<ProcessController>> ProcessController::spawn(
    const Command& command,
    int output_fd,
    ILimiterContext* limiter,
    std::chrono::milliseconds grace_period) {
    if (command.empty() || command.front().empty()) {
        return Error{"Cannot spawn an empty command", ErrorCode::Spawn};
    }

    // argv must be fully built before fork(); the child may not allocate.
    std::vector<std::string> args = command;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        return Error{std::format("Cannot open /dev/null: {}", std::strerror(errno)),
                     ErrorCode::Spawn};
    }
    int go_pipe[2];
    if (::pipe2(go_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(devnull);
        return Error{std::format("pipe2 failed: {}", std::strerror(err)), ErrorCode::Spawn};
    }
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(devnull);
        close_pair(go_pipe);
        return Error{std::format("pipe2 failed: {}", std::strerror(err)), ErrorCode::Spawn};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(devnull);
        close_pair(go_pipe);
        close_pair(err_pipe);
        return Error{std::format("fork failed: {}", std::strerror(err)), ErrorCode::Spawn};
    }
    if (pid == 0) {
        exec_child(argv.data(), devnull, output_fd, go_pipe[0], err_pipe[1]);
    }

    ::close(devnull);
    ::close(go_pipe[0]);
    ::close(err_pipe[1]);

    std::unique_ptr<ProcessController> controller{new ProcessController(pid, grace_period)};

    if (limiter) {
        if (auto attached = limiter->attach(pid); !attached) {
            controller->attach_error_ = std::move(attached).error();
        }
    }

    const char go = 1;
    ssize_t written;
    do {
        written = ::write(go_pipe[1], &go, 1);
    } while (written < 0 && errno == EINTR);
    int go_errno = written == 1 ? 0 : errno;
    ::close(go_pipe[1]);

    // EOF on the close-on-exec pipe means exec succeeded.
    int child_errno = 0;
    size_t received = 0;
    while (received < sizeof(child_errno)) {
        ssize_t n = ::read(err_pipe[0], reinterpret_cast<char*>(&child_errno) + received,
                           sizeof(child_errno) - received);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        received += static_cast<size_t>(n);
    }
    ::close(err_pipe[0]);

    if (received == sizeof(child_errno) || go_errno != 0) {
        [[maybe_unused]] auto reaped = controller->wait();
        int err = received == sizeof(child_errno) ? child_errno : go_errno;
        return Error{std::format("Cannot execute {}: {}", command.front(), std::strerror(err)),
                     ErrorCode::Spawn};
    }

    return controller;
}

bool ProcessController::exited() const {
    std::lock_guard lock(mutex_);
    return exited_;
}

bool ProcessController::send_signal_locked(int signal) {
    if (::kill(-pid_, signal) == 0) return true;
    // The group leader may not have called setpgid yet; signal the pid itself.
    return ::kill(pid_, signal) == 0;
}

bool ProcessController::request_kill(KillMode mode) {
    std::lock_guard lock(mutex_);
    if (exited_) return false;
    if (forceful_sent_) return true;

    if (mode == KillMode::Forceful) {
        forceful_sent_ = true;
        return send_signal_locked(SIGKILL);
    }

    bool sent = send_signal_locked(SIGTERM);
    if (!escalation_.joinable()) {
        escalation_ = std::jthread([this](std::stop_token stop) { escalation_loop(stop); });
    }
    return sent;
}

void ProcessController::escalation_loop(std::stop_token stop) {
    {
        std::unique_lock lock(escalation_mutex_);
        escalation_cv_.wait_for(lock, stop, grace_period_, [] { return false; });
    }
    if (!stop.stop_requested()) {
        request_kill(KillMode::Forceful);
    }
}

Result<ExitStatus> ProcessController::wait(const std::function<void()>& before_reap) {
    {
        std::lock_guard lock(mutex_);
        if (reaped_) {
            return Error{std::format("Process {} was already reaped", pid_), ErrorCode::Internal};
        }
    }

    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            return Error{std::format("waitid({}) failed: {}", pid_, std::strerror(errno)),
                         ErrorCode::Internal};
        }
    }

    if (before_reap) before_reap();

    std::jthread escalation;
    {
        std::lock_guard lock(mutex_);
        exited_ = true;
        escalation = std::move(escalation_);
    }
    if (escalation.joinable()) {
        escalation.request_stop();
        escalation.join();
    }

    int wait_status = 0;
    struct rusage usage {};
    while (::wait4(pid_, &wait_status, 0, &usage) < 0) {
        if (errno != EINTR) {
            return Error{std::format("wait4({}) failed: {}", pid_, std::strerror(errno)),
                         ErrorCode::Internal};
        }
    }
    {
        std::lock_guard lock(mutex_);
        reaped_ = true;
    }

    auto status = reconcile_exit_status(wait_status);
    status.cpu_time = to_duration(usage.ru_utime) + to_duration(usage.ru_stime);
    if (usage.ru_maxrss > 0) {
        status.max_rss_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    }
    return status;
}

}  // namespace runexec
