#ifndef BACKOFF_HPP
#define BACKOFF_HPP

#include "../common/config.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace kott {

/**
 * RetryState - Retry state machine for the operation at the queue head
 *
 *   ATTEMPT --ok--> DONE
 *   ATTEMPT --fail--> WAITING(backoff) --elapsed--> ATTEMPT
 *
 * The backoff starts at the policy's initial value, doubles after each
 * failure and stays at the cap once reached.
 */
class RetryState {
public:
    enum class Phase : uint8_t {
        ATTEMPT,
        WAITING,
        DONE
    };

    explicit RetryState(const RetryPolicy& policy)
        : policy_(policy)
        , backoff_(std::min(policy.initialBackoff, policy.maxBackoff))
    {
    }

    Phase phase() const { return phase_; }
    uint32_t attempts() const { return attempts_; }

    /**
     * Wait to apply before the next attempt (valid in WAITING)
     */
    std::chrono::milliseconds currentBackoff() const { return backoff_; }

    void onSuccess() {
        attempts_++;
        phase_ = Phase::DONE;
    }

    /**
     * Enter WAITING with the current backoff; the following wait is doubled
     */
    void onFailure() {
        attempts_++;
        if (attempts_ > 1) {
            backoff_ = std::min(backoff_ * 2, policy_.maxBackoff);
        }
        phase_ = Phase::WAITING;
    }

    void onWaitElapsed() {
        phase_ = Phase::ATTEMPT;
    }

private:
    RetryPolicy policy_;
    std::chrono::milliseconds backoff_;
    Phase phase_ = Phase::ATTEMPT;
    uint32_t attempts_ = 0;
};

} // namespace kott

#endif // BACKOFF_HPP
