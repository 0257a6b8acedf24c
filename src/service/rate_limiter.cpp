#include "service/rate_limiter.hpp"

namespace runbox::service {

RateLimiter::RateLimiter(uint32_t max_requests, std::chrono::seconds window, TimeSource now)
    : max_requests_(max_requests)
    , window_(window)
    , now_(std::move(now)) {}

RateLimitDecision RateLimiter::check(const std::string& caller) {
    RateLimitDecision decision;
    if (max_requests_ == 0) {
        return decision;
    }

    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto& w = windows_[caller];
    if (w.count == 0 || now - w.started >= window_) {
        w.started = now;
        w.count = 0;
    }

    if (w.count >= max_requests_) {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(w.started + window_ - now);
        decision.allowed = false;
        decision.retry_after_sec = left.count() > 0 ? static_cast<uint64_t>(left.count()) : 1;
        return decision;
    }

    w.count++;
    decision.remaining = max_requests_ - w.count;
    return decision;
}

void RateLimiter::reset(const std::string& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(caller);
}

size_t RateLimiter::prune() {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.started >= window_) {
            it = windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace runbox::service
