#pragma once
#include "errors.hpp"
#include "rate_limiter.hpp"
#include "ttl_cache.hpp"
#include <chrono>
#include <memory>
#include <string>

struct EtParams {
    bool inches{true};                 // false -> мм
};

// Источник погодных данных. Все методы могут бросить UpstreamError.
class WeatherSource {
public:
    virtual ~WeatherSource() = default;

    virtual double current_temperature(const std::string& station) = 0;   // °F
    virtual double daily_et(const std::string& station, const EtParams& p) = 0;
    virtual double precip_today(const std::string& station) = 0;          // дюймы
};

// Обёртка над источником: кэш с TTL + ограничение частоты запросов.
class WeatherGateway : public WeatherSource {
public:
    WeatherGateway(std::shared_ptr<WeatherSource> inner,
                   std::shared_ptr<RateLimiter> limiter,
                   std::chrono::seconds ttl);

    double current_temperature(const std::string& station) override;
    double daily_et(const std::string& station, const EtParams& p) override;
    double precip_today(const std::string& station) override;

    void invalidate() { cache_.clear(); }

private:
    template <typename Fn>
    double cached(const std::string& key, Fn&& fn);

private:
    std::shared_ptr<WeatherSource> inner_;
    std::shared_ptr<RateLimiter> limiter_;
    TtlCache<std::string,double> cache_;
};
