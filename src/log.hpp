#pragma once
#include <sstream>
#include <string>

enum class LogLevel { Error = 1, Warn = 2, Info = 3, Debug = 4 };

class LogLine;

// Общий журнал: stderr или файл, время в UTC.
//   Log::info()<<"Zone "<<z<<" - on";
struct Log {
    static void set_level(LogLevel lvl);
    static LogLevel level();
    static void set_file(const std::string& path);   // пустой путь -> stderr

    static void write(LogLevel lvl, const std::string& msg);
    static bool enabled(LogLevel lvl) { return lvl <= level(); }

    static LogLine error();
    static LogLine warn();
    static LogLine info();
    static LogLine debug();
};

// Одна строка журнала, пишется целиком в деструкторе
class LogLine {
public:
    explicit LogLine(LogLevel lvl) : lvl_(lvl), on_(Log::enabled(lvl)) {}
    ~LogLine() { if (on_) Log::write(lvl_, os_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (on_) os_<<v;
        return *this;
    }

private:
    LogLevel lvl_;
    bool on_;
    std::ostringstream os_;
};

inline LogLine Log::error() { return LogLine(LogLevel::Error); }
inline LogLine Log::warn()  { return LogLine(LogLevel::Warn); }
inline LogLine Log::info()  { return LogLine(LogLevel::Info); }
inline LogLine Log::debug() { return LogLine(LogLevel::Debug); }
