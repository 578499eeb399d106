#pragma once
#include <optional>

// FAO-56 Penman-Monteith, суточная эталонная эвапотранспирация.
struct DayWeather {
    double t_min{0}, t_max{0};         // °C
    double rh_min{0}, rh_max{0};       // %
    double u2{0};                      // ветер на 2 м, м/с
    double lat{0};                     // градусы
    double elev{0};                    // м
    int    day_of_year{1};
    std::optional<double> solar;       // средняя радиация, Вт/м2
    double rain_mm{0};                 // выпавшие осадки за сутки
};

double f_to_c(double tf);
double wind_u2(double mph, double height_m = 2.0);

double penman_monteith_et(const DayWeather& w);                   // мм/сутки
double estimate_daily_et(const DayWeather& w, bool inches = true); // минус осадки, >= 0
