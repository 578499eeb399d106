#include "time_util.hpp"
#include <stdexcept>
#include <cstdio>

std::tm LocalClock::local(std::time_t t) {
    std::tm lt{};
    localtime_r(&t, &lt);
    return lt;
}

int LocalClock::hhmm_to_min(const std::string& hhmm) {
    int h=0,m=0;
    if (std::sscanf(hhmm.c_str(), "%d:%d", &h, &m) != 2)
        throw std::runtime_error("Bad time: "+hhmm);
    if (h<0||h>23||m<0||m>59)
        throw std::runtime_error("Bad time range: "+hhmm);
    return h*60+m;
}

std::string LocalClock::min_to_hhmm(int min_of_day) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", (min_of_day/60)%24, min_of_day%60);
    return buf;
}

std::time_t LocalClock::make_local(int y,int mo,int d,int min_of_day) {
    std::tm tm{};
    tm.tm_year = y-1900; tm.tm_mon = mo-1; tm.tm_mday=d;
    tm.tm_hour = min_of_day/60; tm.tm_min = min_of_day%60; tm.tm_sec=0;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::time_t LocalClock::same_day_at(std::time_t t, int min_of_day) {
    std::tm lt = local(t);
    return make_local(lt.tm_year+1900, lt.tm_mon+1, lt.tm_mday, min_of_day);
}

std::string LocalClock::format(std::time_t t, const char* fmt) {
    std::tm lt = local(t);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return "";
    return buf;
}

// H:MM:SS
std::string LocalClock::duration(long seconds) {
    if (seconds < 0) seconds = 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", seconds/3600, seconds%3600/60, seconds%60);
    return buf;
}
