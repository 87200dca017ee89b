#pragma once

#include <mutex>
#include <string>

#include "resilience/clock.h"

namespace runscope::resilience {

// Slowest accepted refill (one token per day). TimeUntilAvailable never reports more than a day.
inline constexpr double kMinRefillPerSecond = 1.0 / 86400.0;
inline constexpr auto kMaxTokenWait = std::chrono::hours(24);

struct BucketConfig {
    double capacity = 60.0;
    double refill_per_second = 1.0;

    // e.g. PerMinute(60) admits 60 calls per minute with a burst of 60
    static auto PerMinute(double calls) -> BucketConfig { return BucketConfig{calls, calls / 60.0}; }
};

/**
 * @brief Token bucket with lazy refill.
 *
 * Tokens accrue at refill_per_second up to capacity and are computed from elapsed time on each
 * access; there is no background timer. Refill and decrement happen under one mutex. The
 * bucket starts full.
 */
class TokenBucket {
public:
    // Throws ConfigurationError when capacity < 1 or the refill rate is below kMinRefillPerSecond.
    TokenBucket(std::string name, BucketConfig config, ClockFn clock = SteadyNow);

    TokenBucket(const TokenBucket&) = delete;
    auto operator=(const TokenBucket&) -> TokenBucket& = delete;

    // Takes one token if available. Never blocks beyond the critical section.
    auto TryAcquire() -> bool;

    // Zero when a token is available now.
    auto TimeUntilAvailable() -> Duration;

    auto Available() -> double;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto config() const -> const BucketConfig& { return config_; }

private:
    void RefillLocked(TimePoint now);

    std::string name_;
    BucketConfig config_;
    ClockFn clock_;

    std::mutex mutex_;
    double tokens_;
    TimePoint last_refill_;
};

} // namespace runscope::resilience
