#include "resilience/token_bucket.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "errors.h"

namespace runscope::resilience {

TokenBucket::TokenBucket(std::string name, BucketConfig config, ClockFn clock)
    : name_(std::move(name)), config_(config), clock_(std::move(clock)), tokens_(config.capacity) {
    if (!(config_.capacity >= 1.0)) {
        throw ConfigurationError("Rate limit for '" + name_ + "' needs capacity >= 1");
    }
    if (!(config_.refill_per_second >= kMinRefillPerSecond)) {
        throw ConfigurationError("Rate limit for '" + name_ + "' needs a refill rate of at least one token per day");
    }
    if (!clock_) {
        clock_ = SteadyNow;
    }
    last_refill_ = clock_();
}

void TokenBucket::RefillLocked(TimePoint now) {
    if (now <= last_refill_) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(config_.capacity, tokens_ + elapsed * config_.refill_per_second);
    last_refill_ = now;
}

auto TokenBucket::TryAcquire() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(clock_());
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

auto TokenBucket::TimeUntilAvailable() -> Duration {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(clock_());
    if (tokens_ >= 1.0) {
        return Duration::zero();
    }
    double seconds = (1.0 - tokens_) / config_.refill_per_second;
    if (seconds >= std::chrono::duration<double>(kMaxTokenWait).count()) {
        return kMaxTokenWait;
    }
    auto wait = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
    // round up so a caller sleeping exactly this long finds the token
    return wait + Duration(1);
}

auto TokenBucket::Available() -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(clock_());
    return tokens_;
}

} // namespace runscope::resilience
