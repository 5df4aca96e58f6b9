#pragma once

namespace shellpilot::agent {

struct RetryPolicy {
    int max_parse_retries = 5;
    int max_consecutive_failures = 3;
};

// Counters carried from one turn to the next.
struct RunState {
    int step = 0;
    int consecutive_failures = 0;
    bool done = false;
};

class FailureTracker {
public:
    explicit FailureTracker(RetryPolicy policy);

    // Starts a new turn; false once the iteration budget is spent.
    bool BeginTurn(int max_iterations);

    void RecordSuccess();
    // Returns true when the streak reached the ceiling.
    bool RecordFailure();

    bool ShouldRetryParse(int attempts_made) const;
    bool Exhausted() const;

    const RunState& State() const { return state_; }
    const RetryPolicy& Policy() const { return policy_; }
    void MarkDone() { state_.done = true; }

private:
    RetryPolicy policy_;
    RunState state_;
};

}  // namespace shellpilot::agent
