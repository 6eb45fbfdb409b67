/**
 * @file limiter.hpp
 * @brief Resource limiter interface and concrete implementations.
 *
 * A limiter wraps the OS isolation mechanism used to bound and measure one
 * run: CgroupLimiter (cgroup v2 hierarchy) and ProcfsLimiter (prlimit plus
 * /proc sampling, used where cgroups are unavailable). MockLimiter serves
 * tests. The backend is chosen at runtime from configuration, so the seam
 * is a virtual interface.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace runexec {

// ─────────────────────────────────────────────
// Interfaces
// ─────────────────────────────────────────────

/**
 * @brief One limited execution context, owned by a single run.
 *
 * read_usage() may be called concurrently from timer threads and keeps
 * returning the last observed values after the attached process is gone.
 */
class ILimiterContext {
public:
    virtual ~ILimiterContext() = default;

    virtual Result<void> attach(pid_t pid) = 0;
    virtual ResourceUsage read_usage() = 0;
    virtual bool memory_exceeded() = 0;

    /**
     * @brief Stop following the attached pid before it is reaped.
     *
     * Later reads return the last sample. Backends that track a group rather
     * than a pid have nothing to do.
     */
    virtual void detach() {}

    /// Release the context. Idempotent.
    virtual Result<void> destroy() = 0;

    [[nodiscard]] virtual std::string_view backend() const noexcept = 0;
};

class IResourceLimiter {
public:
    virtual ~IResourceLimiter() = default;

    /// Check that the backend can be used on this host.
    virtual Result<void> probe() = 0;

    /// Create a context bounding a run by `limits` (memory, and CPU where the
    /// backend enforces it itself).
    virtual Result<std::unique_ptr<ILimiterContext>> create(const RunLimits& limits) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// CgroupLimiter
// ─────────────────────────────────────────────

/**
 * @brief cgroup v2 backend.
 *
 * Each context is a fresh child group below `root` (which must be delegated
 * to the current user). Data sources:
 *   cpu.stat       — usage_usec of every process in the group
 *   memory.peak    — peak usage (memory.current sampled as fallback)
 *   memory.events  — oom_kill counter for the memory reason
 */
class CgroupLimiter : public IResourceLimiter {
public:
    explicit CgroupLimiter(std::filesystem::path root, std::string prefix = "runexec_");

    Result<void> probe() override;
    Result<std::unique_ptr<ILimiterContext>> create(const RunLimits& limits) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "cgroup"; }

private:
    std::filesystem::path root_;
    std::string prefix_;
    std::atomic<uint64_t> counter_{0};
};

// ─────────────────────────────────────────────
// ProcfsLimiter
// ─────────────────────────────────────────────

/**
 * @brief Fallback backend without a process group container.
 *
 * The memory limit becomes RLIMIT_AS on the attached process and the hard
 * CPU limit an RLIMIT_CPU backstop one second past it. CPU usage is summed
 * over the child's process group from /proc/<pid>/stat; with a memory limit
 * a sampler thread watches VmPeak, since the address space of an exited
 * process is no longer visible.
 */
class ProcfsLimiter : public IResourceLimiter {
public:
    Result<void> probe() override;
    Result<std::unique_ptr<ILimiterContext>> create(const RunLimits& limits) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "procfs"; }
};

// ─────────────────────────────────────────────
// MockLimiter
// ─────────────────────────────────────────────

/**
 * @brief Scriptable limiter for tests.
 *
 * Reports a fixed usage, can be told to fail create() or to flag the
 * memory quota as exceeded. Must outlive the contexts it creates.
 */
class MockLimiter : public IResourceLimiter {
public:
    Result<void> probe() override;
    Result<std::unique_ptr<ILimiterContext>> create(const RunLimits& limits) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    void set_fail_create(bool fail) { fail_create_ = fail; }
    void set_usage(ResourceUsage usage);
    void set_memory_exceeded(bool exceeded) { memory_exceeded_ = exceeded; }

    [[nodiscard]] size_t created_count() const noexcept { return created_.load(); }
    [[nodiscard]] size_t destroyed_count() const noexcept { return destroyed_.load(); }
    [[nodiscard]] pid_t last_attached_pid() const noexcept { return last_pid_.load(); }

private:
    friend class MockLimiterContext;

    std::atomic<bool> fail_create_{false};
    std::atomic<bool> memory_exceeded_{false};
    std::mutex usage_mutex_;
    ResourceUsage usage_;
    std::atomic<size_t> created_{0};
    std::atomic<size_t> destroyed_{0};
    std::atomic<pid_t> last_pid_{0};
};

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

/**
 * @brief Build the limiter named by config.backend.
 *
 * "auto" probes the cgroup backend and falls back to procfs.
 */
std::unique_ptr<IResourceLimiter> make_limiter(const LimiterConfig& config);

}  // namespace runexec
