#include "scheduler.hpp"
#include "log.hpp"
#include "time_util.hpp"
#include <algorithm>

static const double SAFE_TEMPERATURE_F = 35.0;
static const std::chrono::seconds DELAY_STEP{3600};
static const std::chrono::seconds DELAY_MAX{86400};
static const std::time_t START_WINDOW = 60;
static const std::time_t ET_PERIOD    = 86400;

ScheduleProcessor::ScheduleProcessor(ConfigStore& cfg,
                                     std::vector<std::shared_ptr<SprinklerZone>> zones,
                                     Archive& history, WeatherSource* weather, Clock clock)
: cfg_(cfg), zones_(std::move(zones)), history_(history), weather_(weather),
  clock_(clock ? std::move(clock) : Clock([]{ return std::time(nullptr); })) {}

ScheduleProcessor::~ScheduleProcessor() { stop(); }

void ScheduleProcessor::start() {
    if (thread_.joinable()) stop();
    {
        std::lock_guard<std::mutex> lk(mx_);
        alive_ = true;
    }
    thread_ = std::thread(&ScheduleProcessor::run, this);
    Log::info()<<"Started the ScheduleProcessor background thread";
}

void ScheduleProcessor::stop() {
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!alive_ && !thread_.joinable()) return;
        alive_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    Log::info()<<"Stopped the ScheduleProcessor background thread";
}

bool ScheduleProcessor::running() const {
    std::lock_guard<std::mutex> lk(mx_);
    return alive_;
}

void ScheduleProcessor::run() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(mx_);
            auto interval = std::chrono::seconds(cfg_.snapshot().interval);
            cv_.wait_for(lk, interval, [this]{ return !alive_; });
            if (!alive_) return;
        }
        try {
            step();
        } catch (const std::exception& e) {
            Log::error()<<"ScheduleProcessor: "<<e.what();
            Log::debug()<<"  tick at "<<LocalClock::format(clock_())<<" LT abandoned, block_active="
                      <<st_.block_active<<" processed="<<st_.processed_in_block.size();
        } catch (...) {
            Log::error()<<"ScheduleProcessor: unknown exception, tick abandoned";
        }
    }
}

bool ScheduleProcessor::zone_skipped(const Config& c, const MonthSchedule& ms, int zone) const {
    if (zone < 1 || zone > (int)c.zones.size()) return true;
    return !c.zones[zone-1].enabled || ms.zones_to_skip.count(zone);
}

void ScheduleProcessor::reset_et(const Config& c, const MonthSchedule& ms) {
    for (int z=1; z<=(int)c.zones.size(); ++z) {
        if (ms.zones_to_skip.count(z)) continue;
        if (c.zones[z-1].et != 0.0) {
            cfg_.set_zone_et(z, 0.0);
            Log::debug()<<"Zone "<<z<<" - schedule disabled, ET reset";
        }
    }
}

void ScheduleProcessor::accrue_et(const Config& c, const MonthSchedule& ms, std::time_t now) {
    std::tm lt = LocalClock::local(now);
    if (lt.tm_hour != 0) return;
    if (now - st_.updated_et < ET_PERIOD) return;
    if (!weather_ || !c.weather.enabled || c.weather.pws.empty()) return;

    double et = 0.0;
    try {
        et = weather_->daily_et(c.weather.pws, EtParams{});
    } catch (const UpstreamError& e) {
        Log::warn()<<"Cannot get ET from the weather service ("<<e.what()<<"), will retry";
        return;
    }
    for (int z=1; z<=(int)zones_.size(); ++z) {
        if (zone_skipped(c, ms, z)) continue;
        double v = cfg_.add_zone_et(z, et);
        Log::info()<<"Zone "<<z<<" - ET now "<<v<<" in (+"<<et<<")";
    }
    st_.updated_et = now;
}

bool ScheduleProcessor::temperature_ok(const Config& c, std::time_t t_schedule) {
    if (!weather_ || !c.weather.enabled || c.weather.pws.empty()) return true;

    double temp = 0.0;
    try {
        temp = weather_->current_temperature(c.weather.pws);
    } catch (const UpstreamError& e) {
        Log::warn()<<"Cannot get temperature from the weather service ("<<e.what()<<"), skipping check";
        return true;
    }

    if (temp > SAFE_TEMPERATURE_F) {
        if (st_.t_delay.count() > 0)
            Log::info()<<"Resuming schedule after "<<st_.t_delay.count()/3600<<" hour delay";
        st_.t_delay = std::chrono::seconds(0);
        Log::debug()<<"Cleared all weather constraints";
        return true;
    }

    st_.t_delay += DELAY_STEP;
    if (st_.t_delay >= DELAY_MAX) {
        st_.t_delay = std::chrono::seconds(0);
        Log::info()<<"Temperature of "<<temp<<" F is below "<<SAFE_TEMPERATURE_F<<" F all day, skipping today's schedule";
        return false;
    }
    Log::info()<<"Temperature of "<<temp<<" F is below "<<SAFE_TEMPERATURE_F<<" F, delaying schedule for one hour";
    Log::info()<<"New schedule start time will be "<<LocalClock::format(t_schedule+DELAY_STEP.count())<<" LT";
    return false;
}

std::time_t ScheduleProcessor::last_start(int zone, const std::vector<ScheduleRecord>& prev) const {
    std::time_t t = zones_[zone-1]->last_run();
    for (auto& r : prev) {
        if (r.zone == zone) { t = std::max(t, r.start); break; }
    }
    return t;
}

void ScheduleProcessor::finish_block() {
    if (st_.block_active) Log::info()<<"Scheduling block complete";
    st_.block_active = false;
    st_.processed_in_block.clear();
}

void ScheduleProcessor::stop_zone(int z, std::time_t now, std::time_t t_last, const char* why) {
    zones_[z-1]->off();
    Log::info()<<"Zone "<<z<<" - off ("<<why<<")";
    Log::info()<<"  Run Time: "<<LocalClock::duration(now - t_last);
    history_.write_data(now, z, ZoneStatus::Off);
}

void ScheduleProcessor::enforce_zones(const Config& c, const MonthSchedule& ms, std::time_t now) {
    bool any = false;
    for (auto& zone : zones_) any = any || zone->is_active();
    if (!any) return;

    auto prev = history_.get_data(0, true);
    for (int z=1; z<=(int)zones_.size(); ++z) {
        SprinklerZone& zone = *zones_[z-1];
        if (!zone.is_active()) continue;

        bool scheduled = false;
        for (auto& r : prev) if (r.zone == z) { scheduled = r.running(); break; }
        std::time_t t_last = last_start(z, prev);

        if (z > (int)c.zones.size() || !c.zones[z-1].enabled) {
            stop_zone(z, now, t_last, "zone disabled");
        } else if (ms.zones_to_skip.count(z)) {
            stop_zone(z, now, t_last, "zone skipped this month");
        } else if (scheduled && !ms.enabled) {
            stop_zone(z, now, t_last, "schedule disabled");
        } else if (scheduled && !st_.block_active) {
            auto duration = zone.duration_from_demand(ms.threshold);
            if (duration.count() > 0 && now - t_last >= duration.count())
                stop_zone(z, now, t_last, "run time elapsed");
        }
    }
}

void ScheduleProcessor::process_block(const Config& c, const MonthSchedule& ms, std::time_t now) {
    auto prev = history_.get_data(0, true);

    for (int z=1; z<=(int)zones_.size(); ++z) {
        if (zone_skipped(c, ms, z)) continue;
        SprinklerZone& zone = *zones_[z-1];
        const ZoneConfig& zc = c.zones[z-1];
        auto duration = zone.duration_from_demand(ms.threshold);

        if (zone.is_active()) {
            std::time_t t_last = last_start(z, prev);
            if (now - t_last >= duration.count()) {
                stop_zone(z, now, t_last, "run time elapsed");
                continue;
            }
            st_.block_active = true;
            return;
        }

        if (st_.processed_in_block.count(z)) continue;
        if (zc.et < ms.threshold) continue;

        if (duration.count() <= 0) {
            Log::warn()<<"Zone "<<z<<" - zero run duration (rate "<<zc.rate<<", threshold "<<ms.threshold<<"), skipping";
            st_.processed_in_block.insert(z);
            continue;
        }
        if (c.max_zones > 0 && (int)st_.processed_in_block.size() >= c.max_zones) {
            Log::info()<<"Zone "<<z<<" - skipped, daily limit of "<<c.max_zones<<" zones reached";
            st_.processed_in_block.insert(z);
            continue;
        }

        zone.on();
        st_.processed_in_block.insert(z);
        if (!zone.is_active()) {
            Log::info()<<"Zone "<<z<<" - skipped, rain sensor is active";
            continue;
        }
        // Реле уже включено: блок помечаем до записи в архив
        st_.block_active = true;
        Log::info()<<"Zone "<<z<<" - on";
        Log::info()<<"  ET: "<<zc.et<<" in, threshold "<<ms.threshold<<" in";
        Log::info()<<"  Duration: "<<LocalClock::duration(duration.count());
        cfg_.add_zone_et(z, -ms.threshold);
        history_.write_data(now, z, ZoneStatus::On, WX_ET_DRIVEN);
        return;
    }

    if (zones_.empty() || !zones_.back()->is_active()) finish_block();
}

void ScheduleProcessor::step() {
    std::time_t now = clock_();
    Config c = cfg_.snapshot();
    std::tm lt = LocalClock::local(now);
    const MonthSchedule& ms = c.month(lt.tm_mon+1);
    Log::debug()<<"Starting scheduler polling at "<<LocalClock::format(now)<<" LT";

    enforce_zones(c, ms, now);

    if (!ms.enabled) {
        reset_et(c, ms);
        finish_block();
        return;
    }

    accrue_et(c, ms, now);
    if (lt.tm_hour == 0) c = cfg_.snapshot();

    std::time_t t_schedule = LocalClock::same_day_at(now, ms.start_min) + st_.t_delay.count();
    bool entering = !st_.block_active
                 && now >= t_schedule && now - t_schedule < START_WINDOW
                 && st_.last_block_start != t_schedule;
    if (!entering && !st_.block_active) return;

    if (entering) {
        Log::debug()<<"Scheduling block appears to be starting";
        if (!temperature_ok(c, t_schedule)) return;
        st_.last_block_start = t_schedule;
        Log::info()<<"Starting scheduling block for "<<LocalClock::format(now, "%B")
                   <<" (start "<<LocalClock::min_to_hhmm(ms.start_min)<<" LT)";
    }
    process_block(c, ms, now);
}
