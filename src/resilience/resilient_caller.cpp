#include "resilience/resilient_caller.h"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "obs/logging.h"
#include "obs/metrics.h"

namespace runscope::resilience {

void ValidateRetryPolicy(const RetryPolicy& policy) {
    if (policy.max_attempts < 1) {
        throw ConfigurationError("retry.max_attempts must be >= 1");
    }
    if (policy.min_backoff.count() < 0 || policy.max_backoff < policy.min_backoff) {
        throw ConfigurationError("retry backoff bounds must satisfy 0 <= min_backoff <= max_backoff");
    }
    if (!(policy.multiplier >= 1.0)) {
        throw ConfigurationError("retry.multiplier must be >= 1");
    }
    if (!(policy.jitter_ratio >= 0.0 && policy.jitter_ratio < 1.0)) {
        throw ConfigurationError("retry.jitter_ratio must be in [0, 1)");
    }
    if (policy.total_budget.count() <= 0) {
        throw ConfigurationError("retry.total_budget must be positive");
    }
}

auto BackoffFor(const RetryPolicy& policy, int failed_attempt) -> std::chrono::milliseconds {
    double lo = static_cast<double>(policy.min_backoff.count());
    double hi = static_cast<double>(policy.max_backoff.count());
    double ms = lo * std::pow(policy.multiplier, std::max(0, failed_attempt - 1));
    ms = std::clamp(ms, lo, hi);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(ms)));
}

ResilientCaller::ResilientCaller(std::shared_ptr<RateLimiter> limiter,
                                 RetryPolicy policy,
                                 ClockFn clock,
                                 SleepFn sleeper)
    : limiter_(std::move(limiter)),
      policy_(std::move(policy)),
      clock_(clock ? std::move(clock) : ClockFn(SteadyNow)),
      sleeper_(sleeper ? std::move(sleeper) : SleepFn(ThreadSleep)),
      rng_(policy_.seed.has_value() ? *policy_.seed : std::random_device{}()) {
    if (!limiter_) {
        throw ConfigurationError("ResilientCaller requires a rate limiter");
    }
    ValidateRetryPolicy(policy_);
}

auto ResilientCaller::NextDelay(int failed_attempt) -> std::chrono::milliseconds {
    auto base = BackoffFor(policy_, failed_attempt);
    if (policy_.jitter_ratio <= 0.0) {
        return base;
    }
    double factor = 1.0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(1.0 - policy_.jitter_ratio, 1.0 + policy_.jitter_ratio);
        factor = dist(rng_);
    }
    double ms = std::clamp(static_cast<double>(base.count()) * factor,
                           static_cast<double>(policy_.min_backoff.count()),
                           static_cast<double>(policy_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(ms)));
}

void ResilientCaller::AcquireToken(const std::string& service, TimePoint deadline, int attempts_so_far,
                                   const std::optional<FailureKind>& last_kind, const std::string& last_message) {
    if (limiter_->AcquireUntil(service, deadline)) {
        return;
    }
    obs::LogEvent(obs::LogLevel::Error, "call_budget_exhausted", "resilient_caller",
                  {{"service", service}, {"attempts", attempts_so_far}, {"stage", "rate_limit"},
                   {"error_code", obs::kErrRetriesExhausted}});
    throw RetriesExhaustedError(service, attempts_so_far, ExhaustionReason::TIME_BUDGET,
                                last_kind.value_or(FailureKind::RATE_LIMITED),
                                last_message.empty() ? "no rate-limit token available within the time budget"
                                                     : last_message);
}

void ResilientCaller::RecordFailure(const std::string& service, const ServiceError& error, int attempt) {
    obs::EmitCounter("call_failures_total", 1, "failures", "resilient_caller",
                     {{"service", service}, {"kind", FailureKindToString(error.kind())}});
    obs::LogEvent(error.transient() ? obs::LogLevel::Warn : obs::LogLevel::Error, "call_failed", "resilient_caller",
                  {{"service", service},
                   {"attempt", attempt},
                   {"kind", FailureKindToString(error.kind())},
                   {"transient", error.transient()},
                   {"error_code", error.code()},
                   {"error", error.what()}});
}

void ResilientCaller::Backoff(const std::string& service, const ServiceError& error, int attempt,
                              TimePoint deadline, CallStats* stats) {
    auto delay = NextDelay(attempt);
    if (clock_() + delay > deadline) {
        obs::LogEvent(obs::LogLevel::Error, "call_budget_exhausted", "resilient_caller",
                      {{"service", service}, {"attempts", attempt}, {"stage", "backoff"},
                       {"backoff_ms", delay.count()}, {"error_code", obs::kErrRetriesExhausted}});
        throw RetriesExhaustedError(service, attempt, ExhaustionReason::TIME_BUDGET, error.kind(), error.what());
    }
    obs::EmitCounter("call_retries_total", 1, "retries", "resilient_caller", {{"service", service}});
    spdlog::warn("{} call failed ({}), retrying in {}ms (attempt {}/{})",
                 service, FailureKindToString(error.kind()), delay.count(), attempt + 1, policy_.max_attempts);
    if (stats != nullptr) {
        stats->retries++;
        stats->total_backoff += delay;
    }
    sleeper_(delay);
}

} // namespace runscope::resilience
