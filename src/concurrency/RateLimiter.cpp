#include "concurrency/RateLimiter.hpp"
#include "remote/ErrorCodes.hpp"
#include "logging/LogRegistry.hpp"

#include <thread>

using namespace ferry::concurrency;
using namespace ferry::logging;
using namespace std::chrono;

RateLimiter::RateLimiter(config::ThrottleConfig cfg, Sleeper sleeper)
    : cfg_(cfg),
      sleeper_(std::move(sleeper)),
      rng_(std::random_device{}()),
      windowStart_(Clock::now()) {
    if (!sleeper_) sleeper_ = [](const milliseconds d) { std::this_thread::sleep_for(d); };
}

void RateLimiter::sleepFor(const milliseconds d) const {
    if (d.count() > 0) sleeper_(d);
}

void RateLimiter::pace() {
    milliseconds rest{0}, jitter{0};

    {
        std::scoped_lock lock(mutex_);
        const auto now = Clock::now();
        if (now - windowStart_ >= seconds(cfg_.window_sec)) {
            windowStart_ = now;
            opsInWindow_ = 0;
        }

        if (opsInWindow_ >= cfg_.ops_per_window) {
            rest = seconds(cfg_.window_rest_sec);
            opsInWindow_ = 0;
        }

        std::uniform_int_distribution<unsigned int> dist(cfg_.jitter_ms_min, cfg_.jitter_ms_max);
        jitter = milliseconds(dist(rng_));
    }

    if (rest.count() > 0) {
        LogRegistry::throttle()->info("[RateLimiter] {} calls in window, resting {}s",
                                      cfg_.ops_per_window, cfg_.window_rest_sec);
        sleepFor(rest);
        std::scoped_lock lock(mutex_);
        windowStart_ = Clock::now();
    }

    sleepFor(jitter);

    std::scoped_lock lock(mutex_);
    ++opsInWindow_;
}

void RateLimiter::onSuccess() {
    std::scoped_lock lock(mutex_);
    consecutiveFailures_ = 0;
}

void RateLimiter::onFailure(const int code) {
    bool pause = false;
    unsigned int failures;

    {
        std::scoped_lock lock(mutex_);
        failures = ++consecutiveFailures_;
        if (consecutiveFailures_ >= cfg_.max_consecutive_failures) {
            consecutiveFailures_ = 0;
            pause = true;
        }
    }

    if (code == remote::kTooManyAccesses) {
        LogRegistry::throttle()->warn("[RateLimiter] Link accessed too many times, cooling down {}s",
                                      cfg_.cooldown_on_too_many_accesses_sec);
        sleepFor(seconds(cfg_.cooldown_on_too_many_accesses_sec));
    }

    if (pause) {
        LogRegistry::throttle()->warn("[RateLimiter] {} consecutive failures, pausing {}s",
                                      failures, cfg_.pause_sec_on_failure);
        sleepFor(seconds(cfg_.pause_sec_on_failure));
    }
}

unsigned int RateLimiter::consecutiveFailures() const {
    std::scoped_lock lock(mutex_);
    return consecutiveFailures_;
}

unsigned int RateLimiter::opsInWindow() const {
    std::scoped_lock lock(mutex_);
    return opsInWindow_;
}
