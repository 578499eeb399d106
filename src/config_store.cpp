#include "config_store.hpp"
#include "loader.hpp"
#include "log.hpp"
#include <sstream>
#include <stdexcept>

ConfigStore::ConfigStore(Config cfg, std::string path)
: cfg_(std::move(cfg)), path_(std::move(path)) {
    if (cfg_.zones.empty()) cfg_.zones.resize(MAX_ZONES);
}

Config ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mx_);
    return cfg_;
}

std::string ConfigStore::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lk(mx_);
    return config_to_ini(cfg_).at(section, key);
}

int ConfigStore::get_int(const std::string& section, const std::string& key) const {
    std::string v = get(section, key);
    try { return std::stoi(v); }
    catch (const std::logic_error&) { throw std::runtime_error(section+"."+key+" is not an integer: "+v); }
}

double ConfigStore::get_float(const std::string& section, const std::string& key) const {
    std::string v = get(section, key);
    try { return std::stod(v); }
    catch (const std::logic_error&) { throw std::runtime_error(section+"."+key+" is not a number: "+v); }
}

std::vector<std::string> ConfigStore::get_list(const std::string& section, const std::string& key) const {
    std::vector<std::string> out;
    std::stringstream ss(get(section, key));
    std::string it;
    while (std::getline(ss, it, ',')) if (!it.empty()) out.push_back(it);
    return out;
}

void ConfigStore::set(const std::string& section, const std::string& key, const std::string& value) {
    from_map({{section+"-"+key, value}});
}

std::map<std::string,std::string> ConfigStore::as_map() const {
    std::lock_guard<std::mutex> lk(mx_);
    std::map<std::string,std::string> out;
    for (auto& s : config_to_ini(cfg_).sec)
        for (auto& kv : s.second) out[s.first+"-"+kv.first] = kv.second;
    return out;
}

void ConfigStore::from_map(const std::map<std::string,std::string>& m) {
    std::lock_guard<std::mutex> lk(mx_);
    Ini ini = config_to_ini(cfg_);
    for (auto& kv : m) {
        auto pos = kv.first.find('-');
        if (pos == std::string::npos || pos == 0 || pos+1 == kv.first.size())
            throw std::runtime_error("Bad config key: "+kv.first);
        std::string section = kv.first.substr(0, pos);
        if (!ini.sec.count(section)) throw std::runtime_error("Unknown config section: "+section);
        ini.sec[section][kv.first.substr(pos+1)] = kv.second;
    }
    cfg_ = config_from_ini(ini);
}

double ConfigStore::zone_et(int zone) const {
    std::lock_guard<std::mutex> lk(mx_);
    return cfg_.zones.at(zone-1).et;
}

void ConfigStore::set_zone_et(int zone, double et) {
    std::lock_guard<std::mutex> lk(mx_);
    cfg_.zones.at(zone-1).et = et;
    persist_et_locked(zone);
}

// Чтение и запись под одной блокировкой: параллельный set() не теряется
double ConfigStore::add_zone_et(int zone, double delta) {
    std::lock_guard<std::mutex> lk(mx_);
    double& et = cfg_.zones.at(zone-1).et;
    et += delta;
    persist_et_locked(zone);
    return et;
}

void ConfigStore::persist_et_locked(int zone) {
    if (path_.empty()) return;
    try {
        save_locked();
    } catch (const std::runtime_error& e) {
        // Значение остаётся в памяти и будет записано при следующем сохранении
        Log::error()<<"Cannot persist ET for zone "<<zone<<": "<<e.what();
    }
}

void ConfigStore::save() const {
    std::lock_guard<std::mutex> lk(mx_);
    if (path_.empty()) return;
    save_locked();
    Log::info()<<"Saved configuration to '"<<path_<<"'";
}

void ConfigStore::save_locked() const {
    save_config_ini(path_, cfg_);
}
