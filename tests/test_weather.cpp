#include "weather.hpp"
#include "wu_client.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using nlohmann::json;

class GatewayTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWeather> inner{std::make_shared<FakeWeather>()};
    std::shared_ptr<RateLimiter> limiter{std::make_shared<RateLimiter>(100)};
};

TEST_F(GatewayTest, SecondCallServedFromCache) {
    WeatherGateway gw(inner, limiter, std::chrono::seconds(60));
    EXPECT_DOUBLE_EQ(gw.current_temperature("KTEST1"), 60.0);
    inner->temp = 10.0;
    EXPECT_DOUBLE_EQ(gw.current_temperature("KTEST1"), 60.0);
    EXPECT_EQ(inner->temp_calls, 1);
    EXPECT_EQ(limiter->in_window(), 1);
}

TEST_F(GatewayTest, KeysIncludeStationAndParams) {
    WeatherGateway gw(inner, limiter, std::chrono::seconds(60));
    gw.daily_et("KTEST1", EtParams{true});
    gw.daily_et("KTEST1", EtParams{false});
    gw.daily_et("KTEST2", EtParams{true});
    gw.daily_et("KTEST1", EtParams{true});
    EXPECT_EQ(inner->et_calls, 3);

    gw.precip_today("KTEST1");
    gw.current_temperature("KTEST1");
    EXPECT_EQ(inner->precip_calls, 1);
    EXPECT_EQ(inner->temp_calls, 1);
    EXPECT_EQ(limiter->in_window(), 5);
}

TEST_F(GatewayTest, ExpiredEntryIsRefetched) {
    WeatherGateway gw(inner, limiter, std::chrono::seconds(0));
    gw.current_temperature("KTEST1");
    gw.current_temperature("KTEST1");
    EXPECT_EQ(inner->temp_calls, 2);
}

TEST_F(GatewayTest, InvalidateDropsCache) {
    WeatherGateway gw(inner, limiter, std::chrono::seconds(60));
    gw.current_temperature("KTEST1");
    gw.invalidate();
    inner->temp = 70.0;
    EXPECT_DOUBLE_EQ(gw.current_temperature("KTEST1"), 70.0);
}

TEST_F(GatewayTest, FailuresAreNotCached) {
    WeatherGateway gw(inner, limiter, std::chrono::seconds(60));
    inner->fail = true;
    EXPECT_THROW(gw.current_temperature("KTEST1"), UpstreamError);
    inner->fail = false;
    EXPECT_DOUBLE_EQ(gw.current_temperature("KTEST1"), 60.0);
    EXPECT_EQ(inner->temp_calls, 2);
}

TEST_F(GatewayTest, CacheMissWaitsForLimiter) {
    auto slow = std::make_shared<RateLimiter>(1, std::chrono::milliseconds(400), std::chrono::milliseconds(20));
    WeatherGateway gw(inner, slow, std::chrono::seconds(60));
    gw.current_temperature("KTEST1");
    auto t0 = std::chrono::steady_clock::now();
    gw.current_temperature("KTEST1");      // из кэша, без ожидания
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(200));
    gw.precip_today("KTEST1");
    EXPECT_GE(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(350));
}

TEST(TtlCache, MemoizeStoresOnlySuccess) {
    TtlCache<std::string,int> cache(std::chrono::seconds(60));
    int calls = 0;
    EXPECT_THROW(cache.memoize("a", [&]() -> int { ++calls; throw std::runtime_error("x"); }),
                 std::runtime_error);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.memoize("a", [&]{ ++calls; return 7; }), 7);
    EXPECT_EQ(cache.memoize("a", [&]{ ++calls; return 8; }), 7);
    EXPECT_EQ(calls, 2);
}

TEST(WuClient, CurrentObservation) {
    json obs = WuClient::current_observation(
        R"({"observations":[{"stationID":"KTEST1","lat":37.7,"imperial":{"temp":71.5,"elev":52.0}}]})");
    EXPECT_DOUBLE_EQ(obs.at("imperial").at("temp").get<double>(), 71.5);
    EXPECT_EQ(obs.at("stationID").get<std::string>(), "KTEST1");
}

TEST(WuClient, MalformedPayloadIsUpstreamError) {
    EXPECT_THROW(WuClient::current_observation("<html>502</html>"), UpstreamError);
    EXPECT_THROW(WuClient::current_observation(R"({"observations":[]})"), UpstreamError);
    EXPECT_THROW(WuClient::current_observation(R"({"other":1})"), UpstreamError);
}

TEST(WuClient, MissingCredentialsFailBeforeNetwork) {
    WuClient nokey("");
    EXPECT_THROW(nokey.current_temperature("KTEST1"), UpstreamError);
    WuClient nostation("abc");
    EXPECT_THROW(nostation.daily_et("", EtParams{}), UpstreamError);
}

static json hourly(std::time_t epoch, double temp, double rh, double wind, double precip,
                   const json& solar = json(100.0)) {
    json o;
    o["epoch"] = epoch;
    o["humidityAvg"] = rh;
    o["imperial"] = {{"tempAvg", temp}, {"windspeedAvg", wind}, {"precipTotal", precip}};
    if (!solar.is_null()) o["solarRadiationHigh"] = solar;
    return o;
}

TEST(WuClient, DayFromHistoryUsesLast24Hours) {
    const std::time_t now = 1718438400;    // 2024-06-15
    json cur = {{"lat", 50.8}, {"imperial", {{"elev", 328.084}}}};
    json hist;
    hist["observations"] = json::array({
        hourly(now-100000, 200.0, 5.0, 50.0, 5.0),
        hourly(now-7200,   50.0, 80.0,  5.0, 0.2, 100.0),
        hourly(now-3600,   68.0, 40.0, 10.0, 0.0, 300.0),
        hourly(now,        59.0, 60.0,  0.0, 0.1, 200.0),
    });

    DayWeather w = WuClient::day_from_history(cur, hist.dump(), now);
    EXPECT_NEAR(w.t_min, 10.0, 1e-9);
    EXPECT_NEAR(w.t_max, 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(w.rh_min, 40.0);
    EXPECT_DOUBLE_EQ(w.rh_max, 80.0);
    EXPECT_NEAR(w.u2, wind_u2(5.0), 1e-9);
    EXPECT_NEAR(w.elev, 100.0, 1e-3);
    EXPECT_DOUBLE_EQ(w.lat, 50.8);
    EXPECT_NEAR(w.rain_mm, 2.54, 1e-9);    // сброс счётчика в полночь не даёт отрицательных осадков
    ASSERT_TRUE(w.solar.has_value());
    EXPECT_NEAR(*w.solar, 200.0, 1e-9);
    EXPECT_EQ(w.day_of_year, 167);
}

TEST(WuClient, DayFromHistoryWithoutSolarSensor) {
    const std::time_t now = 1718438400;
    json cur = {{"lat", 40.0}, {"imperial", {{"elev", 0.0}}}};
    json hist;
    hist["observations"] = json::array({
        hourly(now-3600, 60.0, 50.0, 3.0, 0.0, json()),
        hourly(now,      70.0, 30.0, 3.0, 0.0, json()),
    });
    DayWeather w = WuClient::day_from_history(cur, hist.dump(), now);
    EXPECT_FALSE(w.solar.has_value());
    EXPECT_DOUBLE_EQ(w.rain_mm, 0.0);
}

TEST(WuClient, DayFromHistoryRejectsEmptyOrBrokenHistory) {
    const std::time_t now = 1718438400;
    json cur = {{"lat", 40.0}, {"imperial", {{"elev", 0.0}}}};
    json old;
    old["observations"] = json::array({hourly(now-200000, 60.0, 50.0, 3.0, 0.0)});
    EXPECT_THROW(WuClient::day_from_history(cur, old.dump(), now), UpstreamError);
    EXPECT_THROW(WuClient::day_from_history(cur, "{", now), UpstreamError);
    EXPECT_THROW(WuClient::day_from_history(json::object(), old.dump(), now), UpstreamError);
}
