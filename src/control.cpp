#include "control.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cmath>

ZoneControl::ZoneControl(ConfigStore& cfg, std::vector<std::shared_ptr<SprinklerZone>> zones,
                         Archive& history, Clock clock)
: cfg_(cfg), zones_(std::move(zones)), history_(history),
  clock_(clock ? std::move(clock) : Clock([]{ return std::time(nullptr); })) {}

SprinklerZone& ZoneControl::zone(int z) {
    if (z < 1 || z > (int)zones_.size())
        throw ValidationError("Invalid zone "+std::to_string(z));
    return *zones_[z-1];
}

bool ZoneControl::manual_on(int z) {
    SprinklerZone& sz = zone(z);
    Config c = cfg_.snapshot();
    if (!c.zones.at(z-1).enabled)
        throw ValidationError("Zone "+std::to_string(z)+" is disabled");
    if (sz.is_active()) return false;

    sz.on();
    if (!sz.is_active()) {
        Log::info()<<"Zone "<<z<<" - manual start blocked by rain sensor";
        return false;
    }
    history_.write_data(clock_(), z, ZoneStatus::On, WX_MANUAL);
    Log::info()<<"Zone "<<z<<" - on (manual)";
    return true;
}

bool ZoneControl::manual_off(int z) {
    SprinklerZone& sz = zone(z);
    if (!sz.is_active()) return false;
    sz.off();
    history_.write_data(clock_(), z, ZoneStatus::Off);
    Log::info()<<"Zone "<<z<<" - off (manual)";
    return true;
}

int ZoneControl::all_off() {
    int n = 0;
    for (int z=1; z<=(int)zones_.size(); ++z) {
        if (manual_off(z)) ++n;
    }
    return n;
}

std::vector<ZoneView> ZoneControl::summary() {
    Config c = cfg_.snapshot();
    auto last = history_.get_data();
    std::vector<ZoneView> out;
    for (int z=1; z<=(int)zones_.size(); ++z) {
        ZoneView v;
        v.zone    = z;
        v.name    = c.zones.at(z-1).name;
        v.enabled = c.zones.at(z-1).enabled;
        v.et      = c.zones.at(z-1).et;
        v.active  = zones_[z-1]->is_active();
        for (auto& r : last) if (r.zone == z) { v.last = r; break; }
        out.push_back(std::move(v));
    }
    return out;
}

std::vector<ScheduleRecord> ZoneControl::log(int days, size_t limit) {
    auto rows = history_.get_data((long)days*24*3600);
    if (rows.size() > limit) rows.resize(limit);
    return rows;
}

std::string describe_adjust(double wx) {
    if (wx >= 0) return std::to_string((int)std::lround(wx*100.0))+"%";
    if (wx > -1.5) return "Manual";
    if (wx > -2.5) return "ET";
    return "Disabled";
}
