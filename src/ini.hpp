#pragma once
#include <map>
#include <string>

struct Ini {
    std::map<std::string, std::map<std::string,std::string>> sec;

    bool has(const std::string& s, const std::string& k) const;
    const std::string& at(const std::string& s, const std::string& k) const;
};

Ini  read_ini(const std::string& path);
void write_ini(const std::string& path, const Ini& ini);
