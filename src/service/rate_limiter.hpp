/**
 * Runbox Rate Limiter
 *
 * Per-caller fixed-window counter. A caller may make max_requests
 * calls in each window; the count resets when a call arrives after the
 * window has rolled over.
 */
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <functional>
#include <cstdint>

namespace runbox::service {

struct RateLimitDecision {
    bool allowed = true;
    uint32_t remaining = 0;
    uint64_t retry_after_sec = 0;            // Set when denied
};

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    // max_requests = 0 disables limiting
    RateLimiter(uint32_t max_requests, std::chrono::seconds window,
                TimeSource now = [] { return Clock::now(); });

    RateLimitDecision check(const std::string& caller);

    void reset(const std::string& caller);

    // Drop windows that have already rolled over
    size_t prune();

    uint32_t max_requests() const { return max_requests_; }
    std::chrono::seconds window() const { return window_; }

private:
    struct Window {
        Clock::time_point started;
        uint32_t count = 0;
    };

    uint32_t max_requests_;
    std::chrono::seconds window_;
    TimeSource now_;
    std::unordered_map<std::string, Window> windows_;
    std::mutex mutex_;
};

} // namespace runbox::service
