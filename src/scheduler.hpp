#pragma once
#include "archive.hpp"
#include "config_store.hpp"
#include "weather.hpp"
#include "zone.hpp"
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

// Состояние планировщика в памяти; принадлежит потоку планировщика.
struct EngineState {
    bool block_active{false};          // идёт обработка блока
    std::set<int> processed_in_block;  // зоны, решённые в этом блоке
    std::chrono::seconds t_delay{0};   // сдвиг старта из-за холода
    std::time_t updated_et{0};         // последнее начисление ET
    std::time_t last_block_start{0};   // слот, уже открывший блок
};

class ScheduleProcessor {
public:
    using Clock = std::function<std::time_t()>;

    ScheduleProcessor(ConfigStore& cfg,
                      std::vector<std::shared_ptr<SprinklerZone>> zones,
                      Archive& history,
                      WeatherSource* weather,
                      Clock clock = nullptr);
    ~ScheduleProcessor();

    void start();
    void stop();
    bool running() const;

    // Один «тик»: ET, окно расписания, переключение зон
    void step();

    const EngineState& state() const { return st_; }

private:
    void run();
    bool zone_skipped(const Config& c, const MonthSchedule& ms, int zone) const;
    void reset_et(const Config& c, const MonthSchedule& ms);
    void accrue_et(const Config& c, const MonthSchedule& ms, std::time_t now);
    bool temperature_ok(const Config& c, std::time_t t_schedule);
    void enforce_zones(const Config& c, const MonthSchedule& ms, std::time_t now);
    void stop_zone(int z, std::time_t now, std::time_t t_last, const char* why);
    void process_block(const Config& c, const MonthSchedule& ms, std::time_t now);
    std::time_t last_start(int zone, const std::vector<ScheduleRecord>& prev) const;
    void finish_block();

private:
    ConfigStore& cfg_;
    std::vector<std::shared_ptr<SprinklerZone>> zones_;
    Archive& history_;
    WeatherSource* weather_;
    Clock clock_;

    EngineState st_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    bool alive_{false};
    std::thread thread_;
};
