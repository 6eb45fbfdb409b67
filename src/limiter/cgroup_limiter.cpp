/**
 * @file cgroup_limiter.cpp
 * @brief CgroupLimiter — one cgroup v2 child group per run.
 */

#include "limiter/limiter.hpp"
#include "limiter/procfs.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <sstream>
#include <thread>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace runexec {

namespace {

namespace fs = std::filesystem;

constexpr int kRemoveAttempts = 50;
constexpr auto kRemoveRetryDelay = std::chrono::milliseconds(10);

class CgroupContext : public ILimiterContext {
public:
    explicit CgroupContext(fs::path path) : path_(std::move(path)) {}

    ~CgroupContext() override {
        [[maybe_unused]] auto released = destroy();
    }

    Result<void> attach(pid_t pid) override {
        int err = procfs::write_file(path_ / "cgroup.procs", std::to_string(pid));
        if (err != 0) {
            return Error{std::format("Cannot move pid {} into {}: {}",
                                     pid, path_.string(), std::strerror(err)),
                         ErrorCode::Limiter};
        }
        return {};
    }

    ResourceUsage read_usage() override {
        std::lock_guard lock(mutex_);
        if (destroyed_) return last_;

        if (auto usec = procfs::read_keyed_value(path_ / "cpu.stat", "usage_usec")) {
            last_.cpu_time = Duration{static_cast<int64_t>(*usec)};
        }
        auto peak = procfs::read_single_value(path_ / "memory.peak");
        if (!peak) {
            peak = procfs::read_single_value(path_ / "memory.current");
        }
        if (peak && (!last_.peak_memory_bytes || *peak > *last_.peak_memory_bytes)) {
            last_.peak_memory_bytes = peak;
        }
        return last_;
    }

    bool memory_exceeded() override {
        std::lock_guard lock(mutex_);
        if (!destroyed_) {
            auto kills = procfs::read_keyed_value(path_ / "memory.events", "oom_kill");
            oom_killed_ = oom_killed_ || (kills && *kills > 0);
        }
        return oom_killed_;
    }

    Result<void> destroy() override {
        // Capture final counters before the group disappears.
        read_usage();
        memory_exceeded();

        std::lock_guard lock(mutex_);
        if (destroyed_) return {};
        destroyed_ = true;

        kill_members();

        int last_errno = 0;
        for (int attempt = 0; attempt < kRemoveAttempts; ++attempt) {
            if (::rmdir(path_.c_str()) == 0 || errno == ENOENT) {
                return {};
            }
            last_errno = errno;
            if (last_errno != EBUSY) break;
            std::this_thread::sleep_for(kRemoveRetryDelay);
        }
        return Error{std::format("Cannot remove cgroup {}: {}",
                                 path_.string(), std::strerror(last_errno)),
                     ErrorCode::Limiter};
    }

    [[nodiscard]] std::string_view backend() const noexcept override { return "cgroup"; }

private:
    void kill_members() {
        if (fs::exists(path_ / "cgroup.kill")) {
            if (procfs::write_file(path_ / "cgroup.kill", "1") == 0) return;
        }
        for (const auto& line : procfs::read_file_lines(path_ / "cgroup.procs")) {
            try {
                ::kill(static_cast<pid_t>(std::stol(line)), SIGKILL);
            } catch (const std::exception&) {
                continue;
            }
        }
    }

    fs::path path_;
    std::mutex mutex_;
    ResourceUsage last_;
    bool oom_killed_{false};
    bool destroyed_{false};
};

}  // anonymous namespace

CgroupLimiter::CgroupLimiter(std::filesystem::path root, std::string prefix)
    : root_(std::move(root)), prefix_(std::move(prefix)) {}

Result<void> CgroupLimiter::probe() {
    if (!fs::exists(root_ / "cgroup.controllers")) {
        return Error{root_.string() + " is not a cgroup v2 hierarchy", ErrorCode::Limiter};
    }
    // Child groups only get the controllers enabled in the parent's subtree_control.
    auto enabled = procfs::read_file_line(root_ / "cgroup.subtree_control");
    std::istringstream controllers(enabled);
    bool has_cpu = false;
    bool has_memory = false;
    for (std::string controller; controllers >> controller;) {
        if (controller == "cpu") has_cpu = true;
        if (controller == "memory") has_memory = true;
    }
    if (!has_cpu || !has_memory) {
        return Error{std::format("{} controller is not enabled in {}/cgroup.subtree_control",
                                 has_cpu ? "memory" : "cpu", root_.string()),
                     ErrorCode::Limiter};
    }
    if (::access(root_.c_str(), W_OK) != 0) {
        return Error{std::format("{} is not writable: {}", root_.string(), std::strerror(errno)),
                     ErrorCode::Limiter};
    }
    return {};
}

Result<std::unique_ptr<ILimiterContext>> CgroupLimiter::create(const RunLimits& limits) {
    const auto& memory_limit = limits.memory_limit;
    auto name = std::format("{}{}_{}", prefix_, ::getpid(), counter_.fetch_add(1));
    auto path = root_ / name;

    if (::mkdir(path.c_str(), 0755) != 0) {
        return Error{std::format("Cannot create cgroup {}: {}", path.string(), std::strerror(errno)),
                     ErrorCode::Limiter};
    }
    auto context = std::make_unique<CgroupContext>(path);

    if (memory_limit) {
        if (!fs::exists(path / "memory.max")) {
            return Error{"memory controller is not enabled below " + root_.string(),
                         ErrorCode::Limiter};
        }
        int err = procfs::write_file(path / "memory.max", std::to_string(*memory_limit));
        if (err != 0) {
            return Error{std::format("Cannot set memory.max: {}", std::strerror(err)),
                         ErrorCode::Limiter};
        }
        if (fs::exists(path / "memory.swap.max")) {
            err = procfs::write_file(path / "memory.swap.max", "0");
            if (err != 0) {
                return Error{std::format("Cannot set memory.swap.max: {}", std::strerror(err)),
                             ErrorCode::Limiter};
            }
        }
    }

    return std::unique_ptr<ILimiterContext>{std::move(context)};
}

}  // namespace runexec
