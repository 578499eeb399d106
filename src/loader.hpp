#pragma once
#include "ini.hpp"
#include "model.hpp"
#include <string>

Config config_from_ini(const Ini& ini);
Ini    config_to_ini(const Config& cfg);

Config load_config_ini(const std::string& path);
void   save_config_ini(const std::string& path, const Config& cfg);
