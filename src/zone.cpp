#include "zone.hpp"
#include "log.hpp"

SprinklerZone::SprinklerZone(std::shared_ptr<Relay> relay, std::shared_ptr<RainSensor> rain,
                             double rate, bool rain_blocks_bookkeeping, Clock clock)
: relay_(std::move(relay)), rain_(std::move(rain)), rate_(rate),
  rain_blocks_bookkeeping_(rain_blocks_bookkeeping),
  clock_(clock ? std::move(clock) : Clock([]{ return std::time(nullptr); })) {
    if (relay_) relay_->off();
}

void SprinklerZone::on() {
    std::lock_guard<std::mutex> lk(mx_);
    if (state_) return;

    bool rain = rain_ && rain_->is_active();
    if (rain) {
        if (rain_blocks_bookkeeping_) {
            Log::info()<<"Rain detected, skipping zone activation";
            return;
        }
        Log::info()<<"Rain detected, keeping relay off but recording the run";
    } else if (relay_) {
        relay_->on();
    }
    state_ = true;
    last_start_ = clock_();
}

void SprinklerZone::off() {
    std::lock_guard<std::mutex> lk(mx_);
    if (!state_) return;
    if (relay_) relay_->off();
    state_ = false;
    last_stop_ = clock_();
}

bool SprinklerZone::is_active() const {
    std::lock_guard<std::mutex> lk(mx_);
    return state_;
}

std::time_t SprinklerZone::last_run() const {
    std::lock_guard<std::mutex> lk(mx_);
    return last_start_;
}

std::time_t SprinklerZone::last_stop() const {
    std::lock_guard<std::mutex> lk(mx_);
    return last_stop_;
}

std::chrono::seconds SprinklerZone::duration_from_demand(double threshold) const {
    if (rate_ <= 0.0 || threshold <= 0.0) return std::chrono::seconds(0);
    return std::chrono::seconds((long long)(threshold/rate_*3600.0 + 0.5));
}

void SprinklerZone::restore(std::time_t last_start, std::time_t last_stop) {
    std::lock_guard<std::mutex> lk(mx_);
    if (last_start_ == 0) {
        last_start_ = last_start;
        last_stop_  = last_stop;
    }
}
