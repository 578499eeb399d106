#include "pm.hpp"
#include <gtest/gtest.h>

// FAO-56, пример 18: Уккел (Бельгия), 6 июля
static DayWeather uccle() {
    DayWeather w;
    w.t_min = 12.3;  w.t_max = 21.5;
    w.rh_min = 63;   w.rh_max = 84;
    w.u2 = 2.078;
    w.lat = 50.8;    w.elev = 100;
    w.day_of_year = 187;
    w.solar = 22.07/0.0864;            // МДж/м2/сут -> Вт/м2
    return w;
}

TEST(PenmanMonteith, MatchesFaoExample) {
    EXPECT_NEAR(penman_monteith_et(uccle()), 3.9, 0.15);
}

TEST(PenmanMonteith, ClearSkyWithoutSolarReading) {
    DayWeather w = uccle();
    double measured = penman_monteith_et(w);
    w.solar.reset();
    EXPECT_GT(penman_monteith_et(w), measured);
}

TEST(PenmanMonteith, RainIsSubtractedAndClamped) {
    DayWeather w = uccle();
    double mm = estimate_daily_et(w, false);
    w.rain_mm = 1.0;
    EXPECT_NEAR(estimate_daily_et(w, false), mm-1.0, 1e-9);
    w.rain_mm = 25.0;
    EXPECT_DOUBLE_EQ(estimate_daily_et(w, false), 0.0);
}

TEST(PenmanMonteith, InchesConversion) {
    DayWeather w = uccle();
    EXPECT_NEAR(estimate_daily_et(w, true), estimate_daily_et(w, false)/25.4, 1e-12);
}

TEST(PenmanMonteith, UnitHelpers) {
    EXPECT_DOUBLE_EQ(f_to_c(32.0), 0.0);
    EXPECT_DOUBLE_EQ(f_to_c(212.0), 100.0);
    EXPECT_NEAR(wind_u2(10.0), 4.47, 0.01);
    EXPECT_LT(wind_u2(10.0, 10.0), wind_u2(10.0));
}
