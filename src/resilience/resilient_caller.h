#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include "errors.h"
#include "resilience/clock.h"
#include "resilience/rate_limiter.h"

namespace runscope::resilience {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds min_backoff{2000};
    std::chrono::milliseconds max_backoff{10000};
    double multiplier = 2.0;
    double jitter_ratio = 0.0; // delay is scaled by a uniform factor in [1 - r, 1 + r] before clamping
    std::chrono::milliseconds total_budget{60000};
    std::optional<uint64_t> seed; // jitter RNG seed
};

// Throws ConfigurationError when the policy cannot be honored.
void ValidateRetryPolicy(const RetryPolicy& policy);

// Delay before attempt `failed_attempt + 1`, without jitter:
// min_backoff * multiplier^(failed_attempt - 1), clamped to [min_backoff, max_backoff].
auto BackoffFor(const RetryPolicy& policy, int failed_attempt) -> std::chrono::milliseconds;

struct CallStats {
    int attempts = 0;
    int retries = 0;
    std::chrono::milliseconds total_backoff{0};
    std::optional<FailureKind> last_failure;
};

/**
 * @brief Runs one outbound operation under a rate limiter and a retry policy.
 *
 * Every attempt first takes a token for the service. A ServiceError with a transient kind is
 * retried with exponential backoff; a terminal kind propagates unchanged. Running out of
 * attempts, or of the overall time budget, throws RetriesExhaustedError. Exceptions that are
 * not ServiceError propagate unchanged without retry.
 *
 * Safe to share across threads.
 */
class ResilientCaller {
public:
    ResilientCaller(std::shared_ptr<RateLimiter> limiter,
                    RetryPolicy policy,
                    ClockFn clock = SteadyNow,
                    SleepFn sleeper = ThreadSleep);

    template <typename Operation>
    auto Execute(const std::string& service, Operation&& operation, CallStats* stats = nullptr)
        -> decltype(operation());

    [[nodiscard]] auto policy() const -> const RetryPolicy& { return policy_; }
    [[nodiscard]] auto limiter() const -> const std::shared_ptr<RateLimiter>& { return limiter_; }

private:
    // Backoff for the next attempt with jitter applied.
    auto NextDelay(int failed_attempt) -> std::chrono::milliseconds;

    void AcquireToken(const std::string& service, TimePoint deadline, int attempts_so_far,
                      const std::optional<FailureKind>& last_kind, const std::string& last_message);

    // Logs and counts a failed attempt.
    void RecordFailure(const std::string& service, const ServiceError& error, int attempt);

    // Sleeps before the next attempt or throws TIME_BUDGET when the sleep would overrun.
    void Backoff(const std::string& service, const ServiceError& error, int attempt,
                 TimePoint deadline, CallStats* stats);

    std::shared_ptr<RateLimiter> limiter_;
    RetryPolicy policy_;
    ClockFn clock_;
    SleepFn sleeper_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

template <typename Operation>
auto ResilientCaller::Execute(const std::string& service, Operation&& operation, CallStats* stats)
    -> decltype(operation()) {
    const TimePoint deadline = clock_() + policy_.total_budget;
    std::optional<FailureKind> last_kind;
    std::string last_message;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        AcquireToken(service, deadline, attempt - 1, last_kind, last_message);
        if (stats != nullptr) {
            stats->attempts = attempt;
        }
        try {
            return operation();
        } catch (const ServiceError& e) {
            RecordFailure(service, e, attempt);
            last_kind = e.kind();
            last_message = e.what();
            if (stats != nullptr) {
                stats->last_failure = e.kind();
            }
            if (!e.transient()) {
                throw;
            }
            if (attempt < policy_.max_attempts) {
                Backoff(service, e, attempt, deadline, stats);
            }
        }
    }
    throw RetriesExhaustedError(service, policy_.max_attempts, ExhaustionReason::MAX_ATTEMPTS,
                                last_kind.value_or(FailureKind::CONNECTION), last_message);
}

} // namespace runscope::resilience
