/**
 * @file procfs_limiter.cpp
 * @brief ProcfsLimiter — prlimit enforcement and /proc sampling.
 */

#include "limiter/limiter.hpp"
#include "limiter/procfs.hpp"

#include <cerrno>
#include <cmath>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/resource.h>
#include <unistd.h>

namespace runexec {

namespace {

constexpr auto kMemorySampleInterval = std::chrono::milliseconds(20);

// RLIMIT_AS cuts off allocations before the limit itself is reached; a peak
// this close to it counts as the quota being hit.
constexpr uint64_t kAddressSpaceSlack = 4ULL * 1024 * 1024;

class ProcfsContext : public ILimiterContext {
public:
    explicit ProcfsContext(const RunLimits& limits)
        : memory_limit_(limits.memory_limit) {
        if (limits.hard_time_limit) {
            cpu_backstop_seconds_ =
                static_cast<rlim_t>(std::ceil(*limits.hard_time_limit)) + 1;
        }
    }

    Result<void> attach(pid_t pid) override {
        if (memory_limit_) {
            struct rlimit rl {};
            rl.rlim_cur = *memory_limit_;
            rl.rlim_max = *memory_limit_;
            if (::prlimit(pid, RLIMIT_AS, &rl, nullptr) != 0) {
                return Error{std::format("prlimit(RLIMIT_AS) on pid {} failed: {}",
                                         pid, std::strerror(errno)),
                             ErrorCode::Limiter};
            }
        }
        if (cpu_backstop_seconds_) {
            // SIGXCPU at the soft value, SIGKILL one second later.
            struct rlimit rl {};
            rl.rlim_cur = *cpu_backstop_seconds_;
            rl.rlim_max = *cpu_backstop_seconds_ + 1;
            if (::prlimit(pid, RLIMIT_CPU, &rl, nullptr) != 0) {
                return Error{std::format("prlimit(RLIMIT_CPU) on pid {} failed: {}",
                                         pid, std::strerror(errno)),
                             ErrorCode::Limiter};
            }
        }
        {
            std::lock_guard lock(mutex_);
            pid_ = pid;
        }
        if (memory_limit_ && !sampler_.joinable()) {
            sampler_ = std::jthread([this](std::stop_token stop) { sample_loop(stop); });
        }
        return {};
    }

    ResourceUsage read_usage() override {
        std::lock_guard lock(mutex_);
        sample_locked();
        return last_;
    }

    bool memory_exceeded() override {
        if (!memory_limit_) return false;
        std::lock_guard lock(mutex_);
        sample_locked();
        return peak_vm_ + kAddressSpaceSlack >= *memory_limit_
            || (last_.peak_memory_bytes && *last_.peak_memory_bytes > *memory_limit_);
    }

    void detach() override {
        sampler_.request_stop();
        if (sampler_.joinable()) sampler_.join();
        std::lock_guard lock(mutex_);
        pid_ = 0;
    }

    Result<void> destroy() override {
        detach();
        return {};
    }

    [[nodiscard]] std::string_view backend() const noexcept override { return "procfs"; }

private:
    void sample_locked() {
        if (pid_ <= 0) return;

        if (auto cpu = procfs::process_group_cpu_time(pid_); cpu && *cpu > last_.cpu_time) {
            last_.cpu_time = *cpu;
        }
        if (auto rss = procfs::process_peak_rss(pid_);
            rss && (!last_.peak_memory_bytes || *rss > *last_.peak_memory_bytes)) {
            last_.peak_memory_bytes = rss;
        }
        if (memory_limit_) {
            for (pid_t member : procfs::process_group_members(pid_)) {
                if (auto vm = procfs::process_peak_vm(member); vm && *vm > peak_vm_) {
                    peak_vm_ = *vm;
                }
            }
        }
    }

    void sample_loop(std::stop_token stop) {
        std::unique_lock lock(mutex_);
        while (!stop.stop_requested()) {
            sample_locked();
            sample_cv_.wait_for(lock, stop, kMemorySampleInterval, [] { return false; });
        }
    }

    std::optional<uint64_t> memory_limit_;
    std::optional<rlim_t> cpu_backstop_seconds_;
    std::mutex mutex_;
    std::condition_variable_any sample_cv_;
    pid_t pid_{0};
    ResourceUsage last_;
    uint64_t peak_vm_{0};
    std::jthread sampler_;
};

}  // anonymous namespace

Result<void> ProcfsLimiter::probe() {
    if (!procfs::process_cpu_time(::getpid())) {
        return Error{"/proc/self/stat is not readable", ErrorCode::Limiter};
    }
    return {};
}

Result<std::unique_ptr<ILimiterContext>> ProcfsLimiter::create(const RunLimits& limits) {
    return std::unique_ptr<ILimiterContext>{std::make_unique<ProcfsContext>(limits)};
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

std::unique_ptr<IResourceLimiter> make_limiter(const LimiterConfig& config) {
    if (config.backend == "procfs") {
        return std::make_unique<ProcfsLimiter>();
    }
    auto cgroup = std::make_unique<CgroupLimiter>(config.cgroup_root, config.cgroup_prefix);
    if (config.backend == "cgroup" || cgroup->probe()) {
        return cgroup;
    }
    return std::make_unique<ProcfsLimiter>();
}

}  // namespace runexec
