#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <random>

namespace ferry::concurrency {

// Paces remote calls and backs off when the service starts refusing them.
// Shared by both workers.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RateLimiter(config::ThrottleConfig cfg, Sleeper sleeper = {});

    // Call immediately before every remote call.
    void pace();

    void onSuccess();
    void onFailure(int code);

    [[nodiscard]] unsigned int consecutiveFailures() const;
    [[nodiscard]] unsigned int opsInWindow() const;
    [[nodiscard]] const config::ThrottleConfig& config() const { return cfg_; }

private:
    config::ThrottleConfig cfg_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::mt19937 rng_;
    Clock::time_point windowStart_;
    unsigned int opsInWindow_{0};
    unsigned int consecutiveFailures_{0};

    void sleepFor(std::chrono::milliseconds d) const;
};

} // namespace ferry::concurrency
