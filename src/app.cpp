#include "app.hpp"
#include "interactive.hpp"
#include "loader.hpp"
#include "log.hpp"
#include "relay.hpp"
#include "time_util.hpp"
#include "wu_client.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <getopt.h>
#include <stdexcept>
#include <iostream>
#include <thread>
#include <unistd.h>

static std::atomic_bool g_stop{false};
static void on_signal(int){ g_stop = true; }

static const char* USAGE =
    "irrigod - ET-driven sprinkler controller\n"
    "\n"
    "Usage: irrigod [OPTIONS]\n"
    "\n"
    "Options:\n"
    "-h, --help                  Display this help information\n"
    "-c, --config                Configuration file (default = pi2o.config)\n"
    "-p, --pid-file              File to write the current PID to\n"
    "-d, --debug                 Set the logging to 'debug' level\n"
    "-l, --logfile               Log file (default = stderr)\n"
    "-i, --interactive           Operator console on stdin\n";

Options parse_options(int argc, char** argv) {
    static const option longopts[] = {
        {"help",        no_argument,       nullptr, 'h'},
        {"config",      required_argument, nullptr, 'c'},
        {"pid-file",    required_argument, nullptr, 'p'},
        {"debug",       no_argument,       nullptr, 'd'},
        {"logfile",     required_argument, nullptr, 'l'},
        {"interactive", no_argument,       nullptr, 'i'},
        {nullptr, 0, nullptr, 0}
    };
    Options o;
    optind = 1;
    opterr = 0;
    int ch;
    while ((ch = getopt_long(argc, argv, "hc:p:dl:i", longopts, nullptr)) != -1) {
        switch (ch) {
        case 'h': o.help = true; break;
        case 'c': o.config = optarg; break;
        case 'p': o.pidfile = optarg; break;
        case 'd': o.debug = true; break;
        case 'l': o.logfile = optarg; break;
        case 'i': o.interactive = true; break;
        default:
            throw std::runtime_error(std::string("Unknown or incomplete option: ")+argv[optind-1]);
        }
    }
    if (optind < argc) throw std::runtime_error(std::string("Unexpected argument: ")+argv[optind]);
    return o;
}

std::shared_ptr<WeatherSource> init_weather(const Config& cfg) {
    if (!cfg.weather.enabled) return nullptr;
    auto inner   = std::make_shared<WuClient>(cfg.weather.key);
    auto limiter = std::make_shared<RateLimiter>(cfg.weather.requests_per_minute);
    return std::make_shared<WeatherGateway>(inner, limiter, std::chrono::seconds(cfg.weather.cache_ttl));
}

std::vector<std::shared_ptr<SprinklerZone>> init_zones(const Config& cfg,
                                                       std::shared_ptr<WeatherSource> weather,
                                                       const std::string& gpio_root) {
    std::shared_ptr<RainSensor> rain;
    switch (cfg.rain.type) {
    case RainSensorType::Off:      rain = std::make_shared<NullRainSensor>(); break;
    case RainSensorType::Hardware: rain = std::make_shared<GpioRainSensor>(cfg.rain.pin, gpio_root); break;
    case RainSensorType::Software:
        rain = std::make_shared<SoftRainSensor>(cfg.rain.precip, weather, cfg.weather.pws);
        break;
    }

    std::vector<std::shared_ptr<SprinklerZone>> zones;
    for (auto& zc : cfg.zones) {
        // Реле есть и у выключенной зоны: её можно включить из консоли без рестарта
        zones.push_back(std::make_shared<SprinklerZone>(std::make_shared<GpioRelay>(zc.pin, gpio_root), rain,
                                                        zc.rate, cfg.rain.blocks_bookkeeping));
    }
    return zones;
}

void App::restore_history() {
    std::time_t now = std::time(nullptr);
    for (auto& r : history_->get_data()) {
        if (r.zone < 1 || r.zone > (int)zones_.size()) continue;
        // Полив прервал рестарт: реле уже выключено, закрываем запись
        if (r.running()) {
            Log::warn()<<"Zone "<<r.zone<<" run started "<<LocalClock::format(r.start)<<" LT was interrupted, closing it";
            history_->write_data(now, r.zone, ZoneStatus::Off);
        }
    }
    for (auto& r : history_->get_data(0, true)) {
        if (r.zone < 1 || r.zone > (int)zones_.size()) continue;
        Log::info()<<"Previous run of zone "<<r.zone<<" was on "<<LocalClock::format(r.start)<<" LT";
        zones_[r.zone-1]->restore(r.start, r.running() ? now : r.stop);
    }
}

void App::shutdown() {
    Log::info()<<"Shutting down, please wait...";
    if (engine_) engine_->stop();
    if (control_) {
        try {
            int n = control_->all_off();
            if (n) Log::info()<<"Turned off "<<n<<" active zone(s)";
        } catch (const std::exception& e) {
            Log::error()<<"Cannot record zone shutdown: "<<e.what();
        }
    }
    if (history_) history_->stop();
    if (cfg_) {
        try {
            cfg_->save();
        } catch (const std::exception& e) {
            Log::error()<<"Cannot save configuration: "<<e.what();
        }
    }
}

int App::run_with_options(const Options& opt) {
    Log::set_level(opt.debug ? LogLevel::Debug : LogLevel::Info);
    Log::set_file(opt.logfile);

    if (!opt.pidfile.empty()) {
        std::ofstream f(opt.pidfile);
        if (!f) throw std::runtime_error("Cannot write PID file: "+opt.pidfile);
        f<<getpid()<<"\n";
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Log::info()<<"Starting irrigod with PID "<<getpid();
    Log::info()<<"All dates and times are in UTC except where noted";

    Config cfg = load_config_ini(opt.config);
    Log::info()<<"Loaded configuration from '"<<opt.config<<"'";
    cfg_ = std::make_unique<ConfigStore>(cfg, opt.config);

    history_ = std::make_unique<Archive>(cfg.database, (int)cfg.zones.size());
    history_->start();

    weather_ = init_weather(cfg);
    zones_   = init_zones(cfg, weather_);
    restore_history();

    control_ = std::make_unique<ZoneControl>(*cfg_, zones_, *history_);
    engine_  = std::make_unique<ScheduleProcessor>(*cfg_, zones_, *history_, weather_.get());
    engine_->start();

    if (opt.interactive) {
        run_console(*control_, *cfg_, std::cin, std::cout);
    } else {
        while (!g_stop) std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    shutdown();
    return 0;
}

int App::run(int argc, char** argv) {
    try {
        Options opt = parse_options(argc, argv);
        if (opt.help) { std::cout<<USAGE; return 0; }
        return run_with_options(opt);
    } catch (const std::exception& e) {
        Log::error()<<"Fatal: "<<e.what();
        if (engine_) engine_->stop();
        if (history_) history_->stop();
        return 1;
    }
}
