#ifndef PARLEY_RATE_LIMITER_HPP
#define PARLEY_RATE_LIMITER_HPP

#include <string>
#include <unordered_map>
#include <chrono>
#include <functional>
#include <mutex>

namespace parley {

/**
 * Fixed-window request counter keyed by an arbitrary string
 * (source address, or address + event type).
 *
 * At most max_attempts calls to allow() succeed per key per window; further
 * calls are rejected until the window that started with the first call
 * elapses. A non-zero ban_seconds additionally keeps the key rejected for
 * that long after the cap is exceeded.
 */
class RateLimiter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    RateLimiter(int max_attempts = 3, int window_seconds = 60, int ban_seconds = 0,
                Clock clock = Clock());

    bool allow(const std::string& key, std::string& ban_reason);
    void clear(const std::string& key);

    // Drops counters whose window and ban have both elapsed.
    size_t sweepExpired();

    size_t trackedKeys() const;

private:
    struct Entry {
        int attempts = 0;
        TimePoint first_attempt;
        TimePoint banned_until;
    };

    TimePoint now() const;

    int max_attempts_;
    int window_seconds_;
    int ban_seconds_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace parley

#endif // PARLEY_RATE_LIMITER_HPP
