#pragma once
#include "archive.hpp"
#include "config_store.hpp"
#include "control.hpp"
#include "scheduler.hpp"
#include "weather.hpp"
#include "zone.hpp"
#include <memory>
#include <string>
#include <vector>

struct Options {
    std::string config{"pi2o.config"};
    std::string logfile;               // пусто -> stderr
    std::string pidfile;
    bool debug{false};
    bool interactive{false};
    bool help{false};
};

Options parse_options(int argc, char** argv);

std::shared_ptr<WeatherSource> init_weather(const Config& cfg);
std::vector<std::shared_ptr<SprinklerZone>> init_zones(const Config& cfg,
                                                       std::shared_ptr<WeatherSource> weather,
                                                       const std::string& gpio_root = "/sys/class/gpio");

class App {
public:
    int run(int argc, char** argv);
    int run_with_options(const Options& opt);

private:
    void restore_history();
    void shutdown();

private:
    std::unique_ptr<ConfigStore> cfg_;
    std::unique_ptr<Archive> history_;
    std::shared_ptr<WeatherSource> weather_;
    std::vector<std::shared_ptr<SprinklerZone>> zones_;
    std::unique_ptr<ScheduleProcessor> engine_;
    std::unique_ptr<ZoneControl> control_;
};
