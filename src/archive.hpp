#pragma once
#include "model.hpp"
#include <condition_variable>
#include <ctime>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct sqlite3;

// История поливов в SQLite. Все запросы выполняет один рабочий поток,
// который единолично владеет соединением; вызывающий ждёт свой future.
class Archive {
public:
    using Clock = std::function<std::time_t()>;

    explicit Archive(std::string path, int zone_count = MAX_ZONES, Clock clock = nullptr);
    ~Archive();

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    void start();                      // идемпотентно; бросает StorageError, если БД не открылась
    void stop();                       // дожидается обработки очереди и останавливает поток
    bool running() const;

    // max_age <= 0: последняя запись по каждой зоне, иначе все записи за max_age секунд.
    // Новые записи первыми.
    std::vector<ScheduleRecord> get_data(long max_age_seconds = 0, bool scheduled_only = false);

    // on: открывает новую запись (закрыв висящую), off: закрывает последнюю открытую.
    // Возвращает false, если off пришёл для зоны без открытой записи.
    bool write_data(std::time_t timestamp, int zone, const std::string& status,
                    std::optional<double> wx_adjust = std::nullopt);
    bool write_data(std::time_t timestamp, int zone, ZoneStatus status,
                    std::optional<double> wx_adjust = std::nullopt);

private:
    using Job = std::function<void(sqlite3*)>;

    template <typename R>
    R submit(const char* what, std::function<R(sqlite3*)> fn);

    void worker(std::promise<void> ready);

private:
    std::string path_;
    int zone_count_;
    Clock clock_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    bool accepting_{false};
    bool stopping_{false};
    std::thread thread_;
};
