#include "loader.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}
static inline std::vector<std::string> split(const std::string& s, char d) {
    std::vector<std::string> out; std::stringstream ss(s); std::string it;
    while (std::getline(ss,it,d)) out.push_back(it);
    return out;
}
static inline bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i)
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    return true;
}

static bool on_off(const std::string& v) {
    return ieq(v,"on") || ieq(v,"yes") || ieq(v,"true") || v=="1";
}

static std::string get(const Ini& ini, const std::string& s, const std::string& k,
                       const std::string& def = "") {
    return ini.has(s,k) ? ini.at(s,k) : def;
}

static int to_int(const std::string& s, int def, const std::string& what) {
    if (s.empty()) return def;
    try {
        size_t n = 0;
        int v = std::stoi(s, &n);
        if (n != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Bad integer for "+what+": "+s);
    }
}

static double to_double(const std::string& s, double def, const std::string& what) {
    if (s.empty()) return def;
    try {
        size_t n = 0;
        double v = std::stod(s, &n);
        if (n != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Bad number for "+what+": "+s);
    }
}

static std::string num(double v) {
    std::ostringstream os;
    os<<std::setprecision(10)<<v;
    return os.str();
}

static const char* on_off_str(bool b) { return b ? "on" : "off"; }

Config config_from_ini(const Ini& ini) {
    Config c;

    // Zones
    for (int z=1; z<=MAX_ZONES; ++z) {
        std::string S = "Zone"+std::to_string(z);
        ZoneConfig zc;
        zc.name    = get(ini, S, "name");
        zc.enabled = on_off(get(ini, S, "enabled", "off"));
        zc.pin     = to_int(get(ini, S, "pin"), -1, S+".pin");
        zc.rate    = to_double(get(ini, S, "rate"), 0.0, S+".rate");
        zc.et      = to_double(get(ini, S, "et"), 0.0, S+".et");
        if (zc.rate < 0) throw std::runtime_error(S+" negative rate");
        c.zones.push_back(std::move(zc));
    }

    // RainSensor
    std::string t = get(ini, "RainSensor", "type", "off");
    if (t.empty() || ieq(t,"off"))  c.rain.type = RainSensorType::Off;
    else if (ieq(t,"hardware"))     c.rain.type = RainSensorType::Hardware;
    else if (ieq(t,"software"))     c.rain.type = RainSensorType::Software;
    else throw std::runtime_error("Unknown rain sensor type: "+t);
    c.rain.pin    = to_int(get(ini, "RainSensor", "pin"), -1, "RainSensor.pin");
    c.rain.precip = to_double(get(ini, "RainSensor", "precip"), 0.0, "RainSensor.precip");
    c.rain.blocks_bookkeeping = on_off(get(ini, "RainSensor", "blocks_bookkeeping", "on"));

    // Schedules
    for (int m=1; m<=12; ++m) {
        std::string S = "Schedule"+std::to_string(m);
        MonthSchedule& ms = c.months[m-1];
        ms.enabled = on_off(get(ini, S, "enabled", "off"));
        std::string start = get(ini, S, "start");
        if (!start.empty()) ms.start_min = LocalClock::hhmm_to_min(start);
        else if (ms.enabled) throw std::runtime_error(S+" enabled without start time");
        ms.threshold = to_double(get(ini, S, "threshold"), 0.0, S+".threshold");
        for (auto& z : split(get(ini, S, "skip"), ',')) {
            auto v = trim(z);
            if (v.empty()) continue;
            int zi = to_int(v, 0, S+".skip");
            if (zi<1 || zi>MAX_ZONES) throw std::runtime_error(S+" skip zone out of range: "+v);
            ms.zones_to_skip.insert(zi);
        }
    }

    // Weather
    c.weather.enabled = on_off(get(ini, "Weather", "enabled", "off"));
    c.weather.key     = get(ini, "Weather", "key");
    c.weather.pws     = get(ini, "Weather", "pws");
    c.weather.requests_per_minute = to_int(get(ini, "Weather", "requests_per_minute"), 10, "Weather.requests_per_minute");
    c.weather.cache_ttl = to_int(get(ini, "Weather", "cache_ttl"), 1800, "Weather.cache_ttl");

    // Controller
    c.max_zones = std::max(0, to_int(get(ini, "Controller", "max_zones"), 0, "Controller.max_zones"));
    c.interval  = std::max(1, to_int(get(ini, "Controller", "interval"), 5, "Controller.interval"));
    c.database  = get(ini, "Controller", "database", c.database);

    return c;
}

Ini config_to_ini(const Config& c) {
    Ini ini;

    for (size_t i=0; i<c.zones.size(); ++i) {
        auto& S = ini.sec["Zone"+std::to_string(i+1)];
        auto& zc = c.zones[i];
        S["name"]    = zc.name;
        S["enabled"] = on_off_str(zc.enabled);
        S["pin"]     = zc.pin > 0 ? std::to_string(zc.pin) : "";
        S["rate"]    = num(zc.rate);
        S["et"]      = num(zc.et);
    }

    auto& R = ini.sec["RainSensor"];
    R["type"]   = c.rain.type==RainSensorType::Hardware ? "hardware"
                : c.rain.type==RainSensorType::Software ? "software" : "off";
    R["pin"]    = c.rain.pin > 0 ? std::to_string(c.rain.pin) : "";
    R["precip"] = num(c.rain.precip);
    R["blocks_bookkeeping"] = on_off_str(c.rain.blocks_bookkeeping);

    for (int m=1; m<=12; ++m) {
        auto& S = ini.sec["Schedule"+std::to_string(m)];
        auto& ms = c.month(m);
        S["enabled"]   = on_off_str(ms.enabled);
        S["start"]     = LocalClock::min_to_hhmm(ms.start_min);
        S["threshold"] = num(ms.threshold);
        std::string skip;
        for (int z : ms.zones_to_skip) { if (!skip.empty()) skip += ","; skip += std::to_string(z); }
        S["skip"] = skip;
    }

    auto& W = ini.sec["Weather"];
    W["enabled"] = on_off_str(c.weather.enabled);
    W["key"]     = c.weather.key;
    W["pws"]     = c.weather.pws;
    W["requests_per_minute"] = std::to_string(c.weather.requests_per_minute);
    W["cache_ttl"] = std::to_string(c.weather.cache_ttl);

    auto& C = ini.sec["Controller"];
    C["max_zones"] = std::to_string(c.max_zones);
    C["interval"]  = std::to_string(c.interval);
    C["database"]  = c.database;

    return ini;
}

Config load_config_ini(const std::string& path) {
    return config_from_ini(read_ini(path));
}

void save_config_ini(const std::string& path, const Config& cfg) {
    write_ini(path, config_to_ini(cfg));
}
