#pragma once
#include <chrono>
#include <deque>
#include <mutex>

// Скользящее окно: не больше N выдач за последние `window`.
class RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    explicit RateLimiter(int requests_per_window,
                         clock::duration window = std::chrono::seconds(60),
                         clock::duration poll   = std::chrono::seconds(5));

    // blocking=true: ждём свободный слот (опрос раз в poll), иначе сразу false
    bool acquire(bool blocking = true);

    int  in_window();

private:
    bool try_grant_locked(clock::time_point now);

private:
    int limit_;
    clock::duration window_;
    clock::duration poll_;
    std::mutex mx_;
    std::deque<clock::time_point> grants_;
};
