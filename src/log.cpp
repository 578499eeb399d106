#include "log.hpp"
#include <atomic>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sys/stat.h>

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex    g_mx;
static std::string   g_path;
static std::ofstream g_file;
static ino_t         g_inode{0};

static const char* tag(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::Error: return "ERROR   ";
    case LogLevel::Warn:  return "WARNING ";
    case LogLevel::Info:  return "INFO    ";
    case LogLevel::Debug: return "DEBUG   ";
    }
    return "?       ";
}

static void reopen_locked() {
    g_file.close();
    g_file.clear();
    g_inode = 0;
    if (g_path.empty()) return;
    g_file.open(g_path, std::ios::app);
    struct stat st{};
    if (g_file && ::stat(g_path.c_str(), &st) == 0) g_inode = st.st_ino;
}

// Файл могли переместить (logrotate) -> открываем заново
static void check_rotated_locked() {
    if (g_path.empty()) return;
    struct stat st{};
    if (::stat(g_path.c_str(), &st) != 0 || st.st_ino != g_inode) reopen_locked();
}

void Log::set_level(LogLevel lvl) { g_level = lvl; }
LogLevel Log::level() { return g_level; }

void Log::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mx);
    g_path = path;
    reopen_locked();
}

void Log::write(LogLevel lvl, const std::string& msg) {
    std::time_t t = std::time(nullptr);
    std::tm ut{};
    gmtime_r(&t, &ut);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &ut);

    std::lock_guard<std::mutex> lk(g_mx);
    check_rotated_locked();
    std::ostream& os = g_file.is_open() ? static_cast<std::ostream&>(g_file) : std::cerr;
    os<<ts<<" ["<<tag(lvl)<<"] "<<msg<<"\n";
    os.flush();
}
