#include "wu_client.hpp"
#include "log.hpp"
#include "pm.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <mutex>
#include <vector>

using nlohmann::json;

static const char* BASE_URL = "https://api.weather.com/v2/pws";

static size_t curl_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size*nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

WuClient::WuClient(std::string api_key, long timeout_sec)
: key_(std::move(api_key)), timeout_(timeout_sec) {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string WuClient::url(const char* path, const std::string& station) const {
    if (station.empty()) throw UpstreamError("No PWS station configured");
    if (key_.empty())    throw UpstreamError("No API key configured");
    return std::string(BASE_URL)+path+"?stationId="+station+"&format=json&units=e&numericPrecision=decimal&apiKey="+key_;
}

std::string WuClient::get(const std::string& u) {
    CURL* c = curl_easy_init();
    if (!c) throw UpstreamError("curl_easy_init failed");

    std::string body;
    curl_easy_setopt(c, CURLOPT_URL, u.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, (void*)&body);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(c);
    long http_code = 0;
    if (res == CURLE_OK) curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(c);

    if (res != CURLE_OK)
        throw UpstreamError(std::string("Weather request failed: ")+curl_easy_strerror(res));
    if (http_code >= 400)
        throw UpstreamError("Weather service returned HTTP "+std::to_string(http_code));
    if (http_code == 204 || body.empty())
        throw UpstreamError("Weather service returned no data");
    return body;
}

json WuClient::current_observation(const std::string& body) {
    try {
        json j = json::parse(body);
        const json& obs = j.at("observations");
        if (!obs.is_array() || obs.empty()) throw UpstreamError("No current observations");
        return obs.at(0);
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("Malformed current conditions: ")+e.what());
    }
}

// Последние 24 часа почасовых наблюдений -> суточная сводка для Penman-Monteith
DayWeather WuClient::day_from_history(const json& current, const std::string& hourly_body,
                                      std::time_t now) {
    DayWeather w;
    std::vector<double> t, h, u, p, r;
    bool have_solar = true;
    try {
        w.lat  = current.at("lat").get<double>();
        w.elev = current.at("imperial").at("elev").get<double>()*0.3048;   // ft -> m

        json hist = json::parse(hourly_body);
        for (const json& o : hist.at("observations")) {
            std::time_t epoch = o.at("epoch").get<std::time_t>();
            if (epoch < now - 86400) continue;
            const json& imp = o.at("imperial");
            t.push_back(f_to_c(imp.at("tempAvg").get<double>()));
            h.push_back(o.at("humidityAvg").get<double>());
            u.push_back(wind_u2(imp.at("windspeedAvg").get<double>()));
            p.push_back(imp.at("precipTotal").get<double>()*25.4);          // in -> mm
            const json& sr = o.value("solarRadiationHigh", json());
            if (sr.is_number()) r.push_back(sr.get<double>());
            else have_solar = false;
        }
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("Malformed weather history: ")+e.what());
    }
    if (t.empty()) throw UpstreamError("No weather history for the last 24 hours");

    // precipTotal накопительный за день: берём положительные приращения
    double rain = 0.0;
    for (size_t i=1;i<p.size();++i) rain += std::max(0.0, p[i]-p[i-1]);

    w.t_min  = *std::min_element(t.begin(), t.end());
    w.t_max  = *std::max_element(t.begin(), t.end());
    w.rh_min = *std::min_element(h.begin(), h.end());
    w.rh_max = *std::max_element(h.begin(), h.end());
    double us = 0; for (double v : u) us += v;
    w.u2 = us/u.size();
    if (have_solar && !r.empty()) {
        double rs = 0; for (double v : r) rs += v;
        w.solar = rs/r.size();
    }
    w.rain_mm = rain;
    std::tm ut{};
    gmtime_r(&now, &ut);
    w.day_of_year = ut.tm_yday+1;
    return w;
}

double WuClient::current_temperature(const std::string& station) {
    json obs = current_observation(get(url("/observations/current", station)));
    try {
        return obs.at("imperial").at("temp").get<double>();
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("No temperature in observation: ")+e.what());
    }
}

double WuClient::precip_today(const std::string& station) {
    json obs = current_observation(get(url("/observations/current", station)));
    try {
        return obs.at("imperial").at("precipTotal").get<double>();
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("No precipitation in observation: ")+e.what());
    }
}

double WuClient::daily_et(const std::string& station, const EtParams& p) {
    json cur = current_observation(get(url("/observations/current", station)));
    std::string hourly = get(url("/observations/hourly/7day", station));
    DayWeather w = day_from_history(cur, hourly, std::time(nullptr));

    Log::debug()<<"Temperature: "<<w.t_min<<" to "<<w.t_max<<" C";
    Log::debug()<<"Relative humidity: "<<w.rh_min<<"% to "<<w.rh_max<<"%";
    Log::debug()<<"Average wind speed: "<<w.u2<<" m/s";
    Log::debug()<<"Elevation above sea level: "<<w.elev<<" m";
    Log::debug()<<"Total rainfall: "<<w.rain_mm<<" mm";

    double loss = estimate_daily_et(w, p.inches);
    Log::info()<<"ET loss, less rainfall received: "<<loss<<(p.inches ? " in" : " mm");
    return loss;
}
