#pragma once
#include <array>
#include <cstdint>
#include <ctime>
#include <set>
#include <string>
#include <vector>

constexpr int MAX_ZONES = 6;

enum class RainSensorType { Off, Hardware, Software };

struct ZoneConfig {
    std::string name;
    int    pin{-1};                    // -1 = реле не подключено
    bool   enabled{false};
    double rate{0.0};                  // дюйм/час
    double et{0.0};                    // накопленный недолив, дюймы
};

struct RainSensorConfig {
    RainSensorType type{RainSensorType::Off};
    int    pin{-1};
    double precip{0.0};                // порог для software-датчика, дюймы
    bool   blocks_bookkeeping{true};   // дождь блокирует и реле, и учёт запуска
};

// Расписание одного месяца
struct MonthSchedule {
    bool   enabled{false};
    int    start_min{0};               // HH:MM -> минуты с полуночи
    double threshold{0.0};             // ET, при котором зона запускается
    std::set<int> zones_to_skip;
};

struct WeatherConfig {
    bool enabled{false};
    std::string key;
    std::string pws;
    int requests_per_minute{10};
    int cache_ttl{1800};               // секунды
};

struct Config {
    std::vector<ZoneConfig> zones;
    RainSensorConfig rain;
    std::array<MonthSchedule,12> months{};   // [0] = январь
    WeatherConfig weather;
    int max_zones{0};                  // дневной лимит зон, 0 = без лимита
    int interval{5};                   // период опроса, секунды
    std::string database{"pi2o-data.db"};

    const MonthSchedule& month(int m) const { return months.at(m-1); }
};

enum class ZoneStatus { On, Off };

// weatherAdjustment sentinels
constexpr double WX_MANUAL   = -1.0;
constexpr double WX_ET_DRIVEN = -2.0;

// Одна запись истории поливов
struct ScheduleRecord {
    int         zone{0};
    std::time_t start{0};
    std::time_t stop{0};               // 0 пока зона работает
    double      wx_adjust{1.0};

    bool running() const { return stop == 0; }
    bool manual()  const { return wx_adjust > -1.5 && wx_adjust < -0.5; }
};
