#include "resilience/rate_limiter.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace runscope::resilience {

namespace {

// Floor for a retry sleep when another thread took the token we were waiting for.
constexpr auto kMinWait = std::chrono::milliseconds(1);

} // namespace

RateLimiter::RateLimiter(const std::map<std::string, BucketConfig>& limits, ClockFn clock, SleepFn sleeper)
    : clock_(clock ? std::move(clock) : ClockFn(SteadyNow)),
      sleeper_(sleeper ? std::move(sleeper) : SleepFn(ThreadSleep)) {
    for (const auto& [service, config] : limits) {
        buckets_.emplace(service, std::make_unique<TokenBucket>(service, config, clock_));
        spdlog::info("Rate limit for '{}': capacity={} refill={}/s", service, config.capacity, config.refill_per_second);
    }
}

auto RateLimiter::Bucket(const std::string& service) const -> TokenBucket& {
    auto it = buckets_.find(service);
    if (it == buckets_.end()) {
        throw ConfigurationError("No rate limit configured for service '" + service + "'");
    }
    return *it->second;
}

auto RateLimiter::HasService(const std::string& service) const -> bool {
    return buckets_.count(service) > 0;
}

auto RateLimiter::Services() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(buckets_.size());
    for (const auto& kv : buckets_) {
        out.push_back(kv.first);
    }
    return out;
}

void RateLimiter::Acquire(const std::string& service) {
    auto& bucket = Bucket(service);
    auto start = clock_();
    bool waited = false;
    while (!bucket.TryAcquire()) {
        auto wait = std::max<Duration>(bucket.TimeUntilAvailable(), kMinWait);
        if (!waited) {
            obs::LogEvent(obs::LogLevel::Warn, "rate_limit_wait", "rate_limiter",
                          {{"service", service}, {"wait_ms", ToMillis(wait)}});
            waited = true;
        }
        sleeper_(wait);
    }
    RecordAcquire(service, waited ? clock_() - start : Duration::zero());
}

auto RateLimiter::AcquireUntil(const std::string& service, TimePoint deadline) -> bool {
    auto& bucket = Bucket(service);
    auto start = clock_();
    bool waited = false;
    while (!bucket.TryAcquire()) {
        auto wait = std::max<Duration>(bucket.TimeUntilAvailable(), kMinWait);
        if (clock_() + wait > deadline) {
            obs::LogEvent(obs::LogLevel::Warn, "rate_limit_deadline", "rate_limiter",
                          {{"service", service}, {"wait_ms", ToMillis(wait)}});
            return false;
        }
        if (!waited) {
            obs::LogEvent(obs::LogLevel::Warn, "rate_limit_wait", "rate_limiter",
                          {{"service", service}, {"wait_ms", ToMillis(wait)}});
            waited = true;
        }
        sleeper_(wait);
    }
    RecordAcquire(service, waited ? clock_() - start : Duration::zero());
    return true;
}

auto RateLimiter::TryAcquire(const std::string& service) -> bool {
    bool ok = Bucket(service).TryAcquire();
    if (ok) {
        RecordAcquire(service, Duration::zero());
    }
    return ok;
}

auto RateLimiter::TimeUntilAvailable(const std::string& service) -> Duration {
    return Bucket(service).TimeUntilAvailable();
}

auto RateLimiter::Available(const std::string& service) -> double {
    return Bucket(service).Available();
}

void RateLimiter::RecordAcquire(const std::string& service, Duration waited) {
    double wait_ms = ToMillis(waited);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        total_acquires_++;
        if (waited > Duration::zero()) {
            total_waits_++;
            total_wait_ms_ += wait_ms;
        }
    }
    if (waited > Duration::zero()) {
        obs::EmitHistogram("rate_limit_wait_ms", wait_ms, "ms", "rate_limiter", {{"service", service}});
    }
}

auto RateLimiter::GetStats() const -> LimiterStats {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return {total_acquires_, total_waits_, total_wait_ms_};
}

} // namespace runscope::resilience
