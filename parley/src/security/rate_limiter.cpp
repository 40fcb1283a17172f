#include "../../include/security/rate_limiter.hpp"

namespace parley {

RateLimiter::RateLimiter(int max_attempts, int window_seconds, int ban_seconds, Clock clock)
    : max_attempts_(max_attempts),
      window_seconds_(window_seconds),
      ban_seconds_(ban_seconds),
      clock_(std::move(clock)) {}

RateLimiter::TimePoint RateLimiter::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool RateLimiter::allow(const std::string& key, std::string& ban_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();

    auto& entry = entries_[key];

    if (entry.banned_until.time_since_epoch().count() > 0 && current < entry.banned_until) {
        ban_reason = "temporarily banned";
        return false;
    }

    if (entry.attempts == 0 || (current - entry.first_attempt) >= std::chrono::seconds(window_seconds_)) {
        entry.attempts = 0;
        entry.first_attempt = current;
    }

    if (entry.attempts >= max_attempts_) {
        if (ban_seconds_ > 0) {
            entry.banned_until = current + std::chrono::seconds(ban_seconds_);
        }
        ban_reason = "too many requests";
        return false;
    }

    entry.attempts++;
    ban_reason.clear();
    return true;
}

void RateLimiter::clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

size_t RateLimiter::sweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    size_t removed = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        const bool window_over = (current - it->second.first_attempt) >= std::chrono::seconds(window_seconds_);
        const bool ban_over = current >= it->second.banned_until;
        if (window_over && ban_over) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t RateLimiter::trackedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace parley
