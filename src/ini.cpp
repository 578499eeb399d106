#include "ini.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}

bool Ini::has(const std::string& s, const std::string& k) const {
    auto it = sec.find(s);
    return it != sec.end() && it->second.count(k);
}

const std::string& Ini::at(const std::string& s, const std::string& k) const {
    auto it = sec.find(s);
    if (it == sec.end()) throw std::runtime_error("No section ["+s+"]");
    auto jt = it->second.find(k);
    if (jt == it->second.end()) throw std::runtime_error("No key "+k+" in ["+s+"]");
    return jt->second;
}

Ini read_ini(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open config: "+path);
    Ini ini;
    std::string line, cur;
    while (std::getline(f,line)) {
        line = trim(line);
        if (line.empty() || line[0]==';' || line[0]=='#') continue;
        if (line.front()=='[' && line.back()==']') {
            cur = line.substr(1, line.size()-2);
            ini.sec[cur];
            continue;
        }
        auto pos = line.find('=');
        if (pos==std::string::npos) continue;
        std::string k = trim(line.substr(0,pos));
        std::string v = trim(line.substr(pos+1));
        ini.sec[cur][k]=v;
    }
    return ini;
}

// Пишем во временный файл и переименовываем, чтобы не оставить обрезанный конфиг
void write_ini(const std::string& path, const Ini& ini) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw std::runtime_error("Cannot write config: "+tmp);
        for (auto& s : ini.sec) {
            f<<"["<<s.first<<"]\n";
            for (auto& kv : s.second) f<<kv.first<<" = "<<kv.second<<"\n";
            f<<"\n";
        }
        if (!f) throw std::runtime_error("Write failed: "+tmp);
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0)
        throw std::runtime_error("Cannot replace config: "+path);
}
