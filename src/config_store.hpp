#pragma once
#include "model.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Потокобезопасный доступ к конфигурации. Единственный путь записи,
// общий для планировщика и консоли.
class ConfigStore {
public:
    explicit ConfigStore(Config cfg, std::string path = "");

    Config snapshot() const;

    std::string get(const std::string& section, const std::string& key) const;
    int    get_int(const std::string& section, const std::string& key) const;
    double get_float(const std::string& section, const std::string& key) const;
    std::vector<std::string> get_list(const std::string& section, const std::string& key) const;

    // Значение проверяется целиком через загрузчик; при ошибке конфиг не меняется
    void set(const std::string& section, const std::string& key, const std::string& value);

    // Ключи вида "Section-key", как в полях веб-форм
    std::map<std::string,std::string> as_map() const;
    void from_map(const std::map<std::string,std::string>& m);

    double zone_et(int zone) const;
    void   set_zone_et(int zone, double et);   // сразу сохраняет в файл, если он задан
    double add_zone_et(int zone, double delta);

    void save() const;
    const std::string& path() const { return path_; }

private:
    void save_locked() const;
    void persist_et_locked(int zone);

private:
    mutable std::mutex mx_;
    Config cfg_;
    std::string path_;
};
