#include "interactive.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

static void print_help(std::ostream& out) {
    out<<"Commands:\n"
       <<"  status              zone states and last runs\n"
       <<"  on N | off N        manual zone control\n"
       <<"  log [days]          run history (default 7 days)\n"
       <<"  et                  accumulated ET per zone\n"
       <<"  set SECTION KEY VAL change configuration\n"
       <<"  quit\n";
}

static int ask_zone(std::istringstream& args) {
    int z = 0;
    if (!(args>>z)) throw ValidationError("zone number expected");
    return z;
}

static void print_status(ZoneControl& ctl, std::ostream& out) {
    for (auto& v : ctl.summary()) {
        out<<"Zone "<<v.zone;
        if (!v.name.empty()) out<<" ("<<v.name<<")";
        out<<": "<<(v.active ? "on" : "off");
        if (!v.enabled) out<<" [disabled]";
        if (v.last) {
            std::time_t stop = v.last->running() ? std::time(nullptr) : v.last->stop;
            out<<", last start "<<LocalClock::format(v.last->start)
               <<", run "<<LocalClock::duration(stop - v.last->start)
               <<", adjust "<<describe_adjust(v.last->wx_adjust);
        }
        out<<"\n";
    }
}

static void print_log(ZoneControl& ctl, int days, std::ostream& out) {
    std::time_t now = std::time(nullptr);
    for (auto& r : ctl.log(days)) {
        bool active = r.running();
        long runtime = (long)((active ? now : r.stop) - r.start);
        out<<"Zone "<<r.zone<<"  "<<LocalClock::format(r.start)
           <<"  "<<LocalClock::duration(runtime)<<(active ? " (running)" : "")
           <<"  "<<describe_adjust(r.wx_adjust)<<"\n";
    }
}

void run_console(ZoneControl& ctl, ConfigStore& cfg, std::istream& in, std::ostream& out) {
    print_help(out);
    std::string line;
    for (;;) {
        out<<"> "<<std::flush;
        if (!std::getline(in, line)) return;
        std::istringstream args(line);
        std::string cmd;
        if (!(args>>cmd)) continue;

        try {
            if (cmd=="quit" || cmd=="exit") return;
            else if (cmd=="help") print_help(out);
            else if (cmd=="status") print_status(ctl, out);
            else if (cmd=="on") {
                int z = ask_zone(args);
                out<<"Zone "<<z<<(ctl.manual_on(z) ? " is turned on\n" : " was not turned on\n");
            }
            else if (cmd=="off") {
                int z = ask_zone(args);
                out<<"Zone "<<z<<(ctl.manual_off(z) ? " is turned off\n" : " is already off\n");
            }
            else if (cmd=="log") {
                int days = 7;
                args>>days;
                print_log(ctl, days > 0 ? days : 7, out);
            }
            else if (cmd=="et") {
                for (int z=1; z<=ctl.zone_count(); ++z)
                    out<<"Zone "<<z<<": "<<cfg.zone_et(z)<<" in\n";
            }
            else if (cmd=="set") {
                std::string section, key, value;
                args>>section>>key;
                std::getline(args>>std::ws, value);
                if (section.empty() || key.empty()) throw ValidationError("usage: set SECTION KEY VALUE");
                cfg.set(section, key, value);
                cfg.save();
                out<<section<<"."<<key<<" = "<<cfg.get(section, key)<<"\n";
            }
            else out<<"Unknown command '"<<cmd<<"', try help\n";
        } catch (const std::exception& e) {
            out<<"Error: "<<e.what()<<"\n";
        }
    }
}
