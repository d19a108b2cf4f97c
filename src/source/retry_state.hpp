#pragma once
#include <algorithm>
#include <chrono>

// Retry budget and backoff for a failing source
struct RetryPolicy
{
    int max_attempts = 5;          // Consecutive failures tolerated before giving up
    int initial_backoff_ms = 200;  // Delay after the first failure
    double backoff_multiplier = 2.0;
    int max_backoff_ms = 3000;     // Upper bound for a single delay
};

// Counts consecutive failures against a RetryPolicy
// A success resets the count; the delay grows geometrically up to max_backoff_ms
class RetryState
{
public:
    explicit RetryState(const RetryPolicy &policy = RetryPolicy()) : policy_(policy) {}

    // Record one failure and return how long to wait before the next attempt
    std::chrono::milliseconds recordFailure()
    {
        attempts_++;
        double delay = policy_.initial_backoff_ms;
        for (int i = 1; i < attempts_; i++)
        {
            delay *= policy_.backoff_multiplier;
            if (delay >= policy_.max_backoff_ms)
                break;
        }
        delay = std::min<double>(delay, policy_.max_backoff_ms);
        return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay)));
    }

    // True once more failures were recorded than the budget allows
    bool exhausted() const { return attempts_ > policy_.max_attempts; }

    void reset() { attempts_ = 0; }
    int attempts() const { return attempts_; }
    const RetryPolicy &policy() const { return policy_; }

private:
    RetryPolicy policy_;
    int attempts_ = 0;
};
