/**
 * @file run_state.hpp
 * @brief Per-run termination bookkeeping shared by timers, stop() and the coordinator.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace runexec {

/**
 * @brief First-writer-wins termination reason plus the external stop flag.
 *
 * Whichever of the soft, hard, wall or stop paths claims the reason first
 * keeps it; later claims are rejected.
 */
class RunState {
public:
    /// @return true if `reason` became the run's reason.
    bool try_set_reason(TerminationReason reason);

    [[nodiscard]] TerminationReason reason() const;

    /**
     * @brief Record an external stop. Claims TerminationReason::Killed if
     *        no other reason was set before.
     */
    void request_stop();
    [[nodiscard]] bool stop_requested() const;

private:
    mutable std::mutex mutex_;
    TerminationReason reason_{TerminationReason::None};
    bool stop_requested_{false};
};

}  // namespace runexec
