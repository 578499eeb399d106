#include "pm.hpp"
#include <algorithm>
#include <cmath>

static const double PI = 3.14159265358979323846;

double f_to_c(double tf) { return (tf-32.0)*5.0/9.0; }

double wind_u2(double mph, double height_m) {
    return mph*0.447 * 4.87/std::log(67.8*height_m - 5.42);
}

// Давление насыщенного пара, кПа
static double e_sat(double t) { return 0.6108*std::exp(17.27*t/(t+237.3)); }

static double delta(double t_mean) {
    return 4098.0*e_sat(t_mean) / std::pow(t_mean+237.3, 2);
}

static double pressure(double elev) { return 101.3*std::pow((293.0-0.0065*elev)/293.0, 5.26); }

// Внеатмосферная радиация, МДж/м2/сут
static double ra(double lat_deg, int j) {
    double lat = lat_deg*PI/180.0;
    double dr  = 1.0 + 0.033*std::cos(2*PI*j/365.0);
    double d   = 0.409*std::sin(2*PI*j/365.0 - 1.39);
    double ws  = std::acos(std::clamp(-std::tan(lat)*std::tan(d), -1.0, 1.0));
    double r   = ws*std::sin(lat)*std::sin(d) + std::cos(lat)*std::cos(d)*std::sin(ws);
    return 24.0*60.0/PI * 0.0820*dr*r;
}

static double rso(const DayWeather& w) { return (0.75 + 2e-5*w.elev)*ra(w.lat, w.day_of_year); }

double penman_monteith_et(const DayWeather& w) {
    double t_mean = 0.5*w.t_min + 0.5*w.t_max;
    double g  = 0.000665*pressure(w.elev);
    double d  = delta(t_mean);
    double es = 0.5*e_sat(w.t_min) + 0.5*e_sat(w.t_max);
    double ea = 0.5*e_sat(w.t_min)*w.rh_max/100.0 + 0.5*e_sat(w.t_max)*w.rh_min/100.0;

    double rs_clear = rso(w);
    double rs = w.solar ? *w.solar*0.0864 : rs_clear;
    double rns = (1.0-0.23)*rs;
    double t1 = 4.903e-9*(0.5*std::pow(w.t_min+273.16,4) + 0.5*std::pow(w.t_max+273.16,4));
    double t2 = 0.34 - 0.14*std::sqrt(std::max(ea, 0.0));
    double t3 = rs_clear > 0 ? 1.35*rs/rs_clear - 0.35 : 0.0;
    double rn = 0.408*(rns - t1*t2*t3);

    double denom = d + g*(1.0+0.34*w.u2);
    double radiation = d/denom * rn;
    double wind = g/denom * (w.u2*900.0/(t_mean+273.0)) * (es-ea);
    return radiation + wind;
}

double estimate_daily_et(const DayWeather& w, bool inches) {
    double loss = std::max(0.0, penman_monteith_et(w) - w.rain_mm);
    return inches ? loss/25.4 : loss;
}
