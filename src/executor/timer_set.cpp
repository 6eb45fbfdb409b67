/**
 * @file timer_set.cpp
 * @brief TimerSet implementation.
 */

#include "executor/timer_set.hpp"

namespace runexec {

TimerSet::TimerSet(CpuClock cpu_clock, std::chrono::milliseconds poll_interval)
    : cpu_clock_(std::move(cpu_clock))
    , poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds{1}) {}

TimerSet::~TimerSet() {
    cancel();
}

void TimerSet::arm_cpu(TimerKind kind, Duration limit, TimerCallback on_fire) {
    std::lock_guard lock(threads_mutex_);
    threads_.emplace_back([this, kind, limit, cb = std::move(on_fire)](std::stop_token stop) {
        cpu_loop(stop, kind, limit, cb);
    });
}

void TimerSet::arm_wall(SteadyTime deadline, TimerCallback on_fire) {
    std::lock_guard lock(threads_mutex_);
    threads_.emplace_back([this, deadline, cb = std::move(on_fire)](std::stop_token stop) {
        wall_loop(stop, deadline, cb);
    });
}

void TimerSet::cancel() {
    std::vector<std::jthread> threads;
    {
        std::lock_guard lock(threads_mutex_);
        threads.swap(threads_);
    }
    for (auto& thread : threads) {
        thread.request_stop();
    }
    for (auto& thread : threads) {
        if (thread.joinable()) thread.join();
    }
}

bool TimerSet::fired(TimerKind kind) const noexcept {
    return fired_[static_cast<size_t>(kind)].load();
}

size_t TimerSet::armed_count() const noexcept {
    std::lock_guard lock(threads_mutex_);
    return threads_.size();
}

void TimerSet::cpu_loop(std::stop_token stop, TimerKind kind, Duration limit,
                        TimerCallback on_fire) {
    while (!stop.stop_requested()) {
        if (cpu_clock_() >= limit) {
            fire(kind, on_fire);
            return;
        }
        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop, poll_interval_, [] { return false; });
    }
}

void TimerSet::wall_loop(std::stop_token stop, SteadyTime deadline, TimerCallback on_fire) {
    {
        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_until(lock, stop, deadline, [] { return false; });
    }
    if (!stop.stop_requested()) {
        fire(TimerKind::Wall, on_fire);
    }
}

void TimerSet::fire(TimerKind kind, const TimerCallback& on_fire) {
    if (fired_[static_cast<size_t>(kind)].exchange(true)) return;
    if (on_fire) on_fire();
}

}  // namespace runexec
