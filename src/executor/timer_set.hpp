/**
 * @file timer_set.hpp
 * @brief One-shot limit timers (soft CPU, hard CPU, wall clock).
 *
 * Every armed timer runs on its own std::jthread. CPU timers poll a CPU
 * clock at a fixed interval, which bounds how far a hard limit can be
 * overshot; the wall timer sleeps until its deadline. A timer fires at most
 * once, and cancel() guarantees no callback runs after it returns.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace runexec {

enum class TimerKind : uint8_t {
    SoftCpu,
    HardCpu,
    Wall
};

[[nodiscard]] constexpr std::string_view to_string(TimerKind kind) noexcept {
    switch (kind) {
        case TimerKind::SoftCpu: return "soft-cpu";
        case TimerKind::HardCpu: return "hard-cpu";
        case TimerKind::Wall:    return "wall";
    }
    return "unknown";
}

using TimerCallback = std::function<void()>;

/// Cumulative CPU time of the supervised process tree.
using CpuClock = std::function<Duration()>;

class TimerSet {
public:
    TimerSet(CpuClock cpu_clock, std::chrono::milliseconds poll_interval);
    ~TimerSet();

    TimerSet(const TimerSet&) = delete;
    TimerSet& operator=(const TimerSet&) = delete;

    /// Fire once the CPU clock reaches `limit` (kind is SoftCpu or HardCpu).
    void arm_cpu(TimerKind kind, Duration limit, TimerCallback on_fire);

    /// Fire at `deadline` on the steady clock.
    void arm_wall(SteadyTime deadline, TimerCallback on_fire);

    /**
     * @brief Stop and join every timer. Idempotent.
     *
     * Must not be called from inside a timer callback.
     */
    void cancel();

    [[nodiscard]] bool fired(TimerKind kind) const noexcept;
    [[nodiscard]] size_t armed_count() const noexcept;

private:
    void cpu_loop(std::stop_token stop, TimerKind kind, Duration limit, TimerCallback on_fire);
    void wall_loop(std::stop_token stop, SteadyTime deadline, TimerCallback on_fire);
    void fire(TimerKind kind, const TimerCallback& on_fire);

    CpuClock cpu_clock_;
    std::chrono::milliseconds poll_interval_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;

    mutable std::mutex threads_mutex_;
    std::vector<std::jthread> threads_;
    std::array<std::atomic<bool>, 3> fired_{};
};

}  // namespace runexec
