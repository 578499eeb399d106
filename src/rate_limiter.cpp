#include "rate_limiter.hpp"
#include "log.hpp"
#include <thread>

RateLimiter::RateLimiter(int requests_per_window, clock::duration window, clock::duration poll)
: limit_(requests_per_window), window_(window), poll_(poll) {}

bool RateLimiter::try_grant_locked(clock::time_point now) {
    while (!grants_.empty() && now - grants_.front() >= window_) grants_.pop_front();
    if (limit_ > 0 && (int)grants_.size() >= limit_) return false;
    grants_.push_back(now);
    return true;
}

bool RateLimiter::acquire(bool blocking) {
    bool logged = false;
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (try_grant_locked(clock::now())) return true;
        }
        if (!blocking) return false;
        if (!logged) {
            Log::debug()<<"Rate limit of "<<limit_<<" requests reached, waiting for a free slot";
            logged = true;
        }
        std::this_thread::sleep_for(poll_);
    }
}

int RateLimiter::in_window() {
    std::lock_guard<std::mutex> lk(mx_);
    auto now = clock::now();
    while (!grants_.empty() && now - grants_.front() >= window_) grants_.pop_front();
    return (int)grants_.size();
}
