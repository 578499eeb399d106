#pragma once
#include "archive.hpp"
#include "config_store.hpp"
#include "zone.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ZoneView {
    int zone{0};
    std::string name;
    bool enabled{false};
    bool active{false};
    double et{0.0};
    std::optional<ScheduleRecord> last;
};

// Операции "фронтенда": ручное управление, сводка, журнал.
// Вызываются не из потока планировщика, поэтому всё идёт через Archive и ConfigStore.
class ZoneControl {
public:
    using Clock = std::function<std::time_t()>;

    ZoneControl(ConfigStore& cfg, std::vector<std::shared_ptr<SprinklerZone>> zones,
                Archive& history, Clock clock = nullptr);

    bool manual_on(int zone);          // false: уже включена или заблокирована дождём
    bool manual_off(int zone);         // false: уже выключена
    int  all_off();                    // при остановке; возвращает число выключенных зон

    std::vector<ZoneView> summary();
    std::vector<ScheduleRecord> log(int days, size_t limit = 25);

    int zone_count() const { return (int)zones_.size(); }

private:
    SprinklerZone& zone(int z);

private:
    ConfigStore& cfg_;
    std::vector<std::shared_ptr<SprinklerZone>> zones_;
    Archive& history_;
    Clock clock_;
};

std::string describe_adjust(double wx_adjust);
