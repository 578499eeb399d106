#pragma once
#include "pm.hpp"
#include "weather.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <string>

// Weather Underground PWS API (api.weather.com) через libcurl.
class WuClient : public WeatherSource {
public:
    explicit WuClient(std::string api_key, long timeout_sec = 30);

    double current_temperature(const std::string& station) override;
    double daily_et(const std::string& station, const EtParams& p) override;
    double precip_today(const std::string& station) override;

    // Разбор ответов вынесен отдельно, чтобы проверять его без сети
    static nlohmann::json current_observation(const std::string& body);
    static DayWeather     day_from_history(const nlohmann::json& current,
                                           const std::string& hourly_body,
                                           std::time_t now);

private:
    std::string get(const std::string& url);
    std::string url(const char* path, const std::string& station) const;

private:
    std::string key_;
    long timeout_;
};
