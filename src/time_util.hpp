#pragma once
#include <ctime>
#include <string>

struct LocalClock {
    static std::tm      local(std::time_t t);
    static int          hhmm_to_min(const std::string& hhmm);
    static std::string  min_to_hhmm(int min_of_day);
    static std::time_t  make_local(int y,int mo,int d,int min_of_day);
    static std::time_t  same_day_at(std::time_t t, int min_of_day);
    static std::string  format(std::time_t t, const char* fmt = "%Y-%m-%d %H:%M:%S");
    static std::string  duration(long seconds);
};
