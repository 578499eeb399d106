#pragma once
#include "config_store.hpp"
#include "control.hpp"
#include <iosfwd>

// Консоль оператора: status, on N, off N, log [days], et, set S K V, quit.
// Возвращает при quit или конце ввода.
void run_console(ZoneControl& ctl, ConfigStore& cfg, std::istream& in, std::ostream& out);
