#include "agent/retry_policy.hpp"

#include <utility>

namespace shellpilot::agent {

FailureTracker::FailureTracker(RetryPolicy policy)
    : policy_(std::move(policy)) {}

bool FailureTracker::BeginTurn(int max_iterations) {
    if (state_.done || state_.step >= max_iterations || Exhausted()) {
        return false;
    }
    state_.step += 1;
    return true;
}

void FailureTracker::RecordSuccess() {
    state_.consecutive_failures = 0;
}

bool FailureTracker::RecordFailure() {
    state_.consecutive_failures += 1;
    return Exhausted();
}

bool FailureTracker::ShouldRetryParse(int attempts_made) const {
    return attempts_made < policy_.max_parse_retries;
}

bool FailureTracker::Exhausted() const {
    return state_.consecutive_failures >= policy_.max_consecutive_failures;
}

}  // namespace shellpilot::agent
