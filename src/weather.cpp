#include "weather.hpp"
#include "log.hpp"

WeatherGateway::WeatherGateway(std::shared_ptr<WeatherSource> inner,
                               std::shared_ptr<RateLimiter> limiter,
                               std::chrono::seconds ttl)
: inner_(std::move(inner)), limiter_(std::move(limiter)), cache_(ttl) {}

template <typename Fn>
double WeatherGateway::cached(const std::string& key, Fn&& fn) {
    return cache_.memoize(key, [&]() {
        if (limiter_) limiter_->acquire(true);
        Log::debug()<<"Weather request "<<key;
        return fn();
    });
}

double WeatherGateway::current_temperature(const std::string& station) {
    return cached("temperature|"+station, [&]{ return inner_->current_temperature(station); });
}

double WeatherGateway::daily_et(const std::string& station, const EtParams& p) {
    std::string key = "et|"+station+"|"+(p.inches ? "in" : "mm");
    return cached(key, [&]{ return inner_->daily_et(station, p); });
}

double WeatherGateway::precip_today(const std::string& station) {
    return cached("precip|"+station, [&]{ return inner_->precip_today(station); });
}
