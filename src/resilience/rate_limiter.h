#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "resilience/clock.h"
#include "resilience/token_bucket.h"

namespace runscope::resilience {

inline constexpr const char* kTrackingService = "tracking";
inline constexpr const char* kLlmService = "llm";

/**
 * @brief Registry of independent token buckets, one per external service.
 *
 * Built once at startup from the configured limits and shared with every caller that talks
 * to those services. Blocking waits sleep outside any bucket lock and re-check afterwards.
 * Unknown service names throw ConfigurationError.
 */
class RateLimiter {
public:
    explicit RateLimiter(const std::map<std::string, BucketConfig>& limits,
                         ClockFn clock = SteadyNow,
                         SleepFn sleeper = ThreadSleep);

    RateLimiter(const RateLimiter&) = delete;
    auto operator=(const RateLimiter&) -> RateLimiter& = delete;

    // Blocks until a token for `service` is taken.
    void Acquire(const std::string& service);

    // Like Acquire, but gives up (returning false) instead of waiting past `deadline`.
    auto AcquireUntil(const std::string& service, TimePoint deadline) -> bool;

    auto TryAcquire(const std::string& service) -> bool;

    auto TimeUntilAvailable(const std::string& service) -> Duration;
    auto Available(const std::string& service) -> double;

    [[nodiscard]] auto HasService(const std::string& service) const -> bool;
    [[nodiscard]] auto Services() const -> std::vector<std::string>;

    [[nodiscard]] auto Now() const -> TimePoint { return clock_(); }

    struct LimiterStats {
        long long acquires;
        long long waits;
        double total_wait_ms;
    };
    auto GetStats() const -> LimiterStats;

private:
    auto Bucket(const std::string& service) const -> TokenBucket&;
    void RecordAcquire(const std::string& service, Duration waited);

    std::map<std::string, std::unique_ptr<TokenBucket>> buckets_;
    ClockFn clock_;
    SleepFn sleeper_;

    mutable std::mutex stats_mutex_;
    long long total_acquires_ = 0;
    long long total_waits_ = 0;
    double total_wait_ms_ = 0.0;
};

} // namespace runscope::resilience
