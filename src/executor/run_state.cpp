/**
 * @file run_state.cpp
 * @brief RunState implementation.
 */

#include "executor/run_state.hpp"

namespace runexec {

bool RunState::try_set_reason(TerminationReason reason) {
    if (reason == TerminationReason::None) return false;
    std::lock_guard lock(mutex_);
    if (reason_ != TerminationReason::None) return false;
    reason_ = reason;
    return true;
}

TerminationReason RunState::reason() const {
    std::lock_guard lock(mutex_);
    return reason_;
}

void RunState::request_stop() {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
    if (reason_ == TerminationReason::None) {
        reason_ = TerminationReason::Killed;
    }
}

bool RunState::stop_requested() const {
    std::lock_guard lock(mutex_);
    return stop_requested_;
}

}  // namespace runexec
