#include "archive.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <sqlite3.h>

static const char* SQL_CREATE =
    "CREATE TABLE IF NOT EXISTS pi2o ("
    " dateTimeStart INTEGER NOT NULL,"
    " dateTimeStop  INTEGER NOT NULL DEFAULT 0,"
    " zone          INTEGER NOT NULL,"
    " wxAdjust      REAL    NOT NULL DEFAULT 1.0)";

// Ручной запуск помечен wxAdjust = -1
static const char* SCHEDULED_ONLY = " AND wxAdjust <> -1.0";

// Обёртка над sqlite3_stmt
class Stmt {
public:
    Stmt(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
        if (sqlite3_prepare_v2(db_, sql_.c_str(), -1, &st_, nullptr) != SQLITE_OK) fail();
    }
    ~Stmt() { sqlite3_finalize(st_); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    void bind(int i, sqlite3_int64 v) { if (sqlite3_bind_int64(st_, i, v) != SQLITE_OK) fail(); }
    void bind(int i, double v)        { if (sqlite3_bind_double(st_, i, v) != SQLITE_OK) fail(); }

    bool step() {
        int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW)  return true;
        if (rc == SQLITE_DONE) return false;
        fail();
        return false;
    }

    sqlite3_int64 col_int(int i) const { return sqlite3_column_int64(st_, i); }
    double col_double(int i) const     { return sqlite3_column_double(st_, i); }

private:
    [[noreturn]] void fail() {
        Log::debug()<<"SQL: "<<sql_;
        throw StorageError(sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    std::string sql_;
    sqlite3_stmt* st_{nullptr};
};

static void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        Log::debug()<<"SQL: "<<sql;
        throw StorageError(msg);
    }
}

static ScheduleRecord read_row(const Stmt& st) {
    ScheduleRecord r;
    r.zone      = (int)st.col_int(0);
    r.start     = (std::time_t)st.col_int(1);
    r.stop      = (std::time_t)st.col_int(2);
    r.wx_adjust = st.col_double(3);
    return r;
}

Archive::Archive(std::string path, int zone_count, Clock clock)
: path_(std::move(path)), zone_count_(zone_count),
  clock_(clock ? std::move(clock) : Clock([]{ return std::time(nullptr); })) {}

Archive::~Archive() { stop(); }

void Archive::start() {
    std::future<void> ready;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (thread_.joinable()) return;
        stopping_  = false;
        accepting_ = true;
        std::promise<void> p;
        ready = p.get_future();
        thread_ = std::thread(&Archive::worker, this, std::move(p));
    }
    try {
        ready.get();
    } catch (const StorageError&) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            accepting_ = false;
        }
        thread_.join();
        throw;
    }
    Log::info()<<"Started the archive background thread ("<<path_<<")";
}

void Archive::stop() {
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!thread_.joinable()) return;
        accepting_ = false;
        stopping_  = true;
    }
    cv_.notify_all();
    thread_.join();
    Log::info()<<"Stopped the archive background thread";
}

bool Archive::running() const {
    std::lock_guard<std::mutex> lk(mx_);
    return accepting_;
}

void Archive::worker(std::promise<void> ready) {
    sqlite3* db = nullptr;
    try {
        if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK)
            throw StorageError("Cannot open archive "+path_+": "+sqlite3_errmsg(db));
        sqlite3_busy_timeout(db, 5000);
        exec(db, SQL_CREATE);
    } catch (const StorageError& e) {
        Log::error()<<e.what();
        sqlite3_close(db);
        ready.set_exception(std::current_exception());
        return;
    }
    ready.set_value();

    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(mx_);
            cv_.wait(lk, [this]{ return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;           // stopping_ и очередь пуста
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job(db);
    }
    sqlite3_close(db);
}

template <typename R>
R Archive::submit(const char* what, std::function<R(sqlite3*)> fn) {
    auto p = std::make_shared<std::promise<R>>();
    std::future<R> result = p->get_future();
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!accepting_) throw StorageError("archive not running");
        queue_.push_back([p, what, fn = std::move(fn)](sqlite3* db) {
            // Ответ уходит всегда, даже при ошибке, иначе вызывающий зависнет
            try {
                p->set_value(fn(db));
            } catch (const std::exception& e) {
                Log::error()<<"Archive "<<what<<" failed: "<<e.what();
                p->set_exception(std::current_exception());
            }
        });
    }
    cv_.notify_one();
    return result.get();
}

std::vector<ScheduleRecord> Archive::get_data(long max_age_seconds, bool scheduled_only) {
    std::time_t now = clock_();
    int limit = zone_count_;
    return submit<std::vector<ScheduleRecord>>("read", [=](sqlite3* db) {
        std::string sql;
        if (max_age_seconds <= 0) {
            sql = "SELECT zone, dateTimeStart, dateTimeStop, wxAdjust FROM pi2o p"
                  " WHERE p.rowid = (SELECT q.rowid FROM pi2o q WHERE q.zone = p.zone";
            if (scheduled_only) sql += SCHEDULED_ONLY;
            sql += " ORDER BY q.dateTimeStart DESC, q.rowid DESC LIMIT 1)"
                   " ORDER BY dateTimeStart DESC, zone LIMIT ?1";
        } else {
            sql = "SELECT zone, dateTimeStart, dateTimeStop, wxAdjust FROM pi2o"
                  " WHERE dateTimeStart >= ?1";
            if (scheduled_only) sql += SCHEDULED_ONLY;
            sql += " ORDER BY dateTimeStart DESC, rowid DESC";
        }
        Stmt st(db, sql);
        if (max_age_seconds <= 0) st.bind(1, (sqlite3_int64)limit);
        else                      st.bind(1, (sqlite3_int64)(now - max_age_seconds));

        std::vector<ScheduleRecord> out;
        while (st.step()) out.push_back(read_row(st));
        return out;
    });
}

bool Archive::write_data(std::time_t timestamp, int zone, const std::string& status,
                         std::optional<double> wx_adjust) {
    if (status == "on")  return write_data(timestamp, zone, ZoneStatus::On, wx_adjust);
    if (status == "off") return write_data(timestamp, zone, ZoneStatus::Off, wx_adjust);
    throw ValidationError("Invalid status code '"+status+"'");
}

bool Archive::write_data(std::time_t timestamp, int zone, ZoneStatus status,
                         std::optional<double> wx_adjust) {
    if (zone < 1 || zone > zone_count_)
        throw ValidationError("Invalid zone "+std::to_string(zone));
    if (timestamp <= 0)
        throw ValidationError("Invalid timestamp "+std::to_string((long long)timestamp));
    double wx = wx_adjust.value_or(1.0);

    return submit<bool>(status==ZoneStatus::On ? "write(on)" : "write(off)", [=](sqlite3* db) {
        if (status == ZoneStatus::On) {
            exec(db, "BEGIN IMMEDIATE");
            try {
                // Не больше одной открытой записи на зону
                Stmt close(db, "UPDATE pi2o SET dateTimeStop = ?1 WHERE zone = ?2 AND dateTimeStop = 0");
                close.bind(1, (sqlite3_int64)timestamp);
                close.bind(2, (sqlite3_int64)zone);
                close.step();
                if (sqlite3_changes(db) > 0)
                    Log::warn()<<"Zone "<<zone<<" had an open run, closed it before starting a new one";

                Stmt ins(db, "INSERT INTO pi2o (dateTimeStart, dateTimeStop, zone, wxAdjust) VALUES (?1, 0, ?2, ?3)");
                ins.bind(1, (sqlite3_int64)timestamp);
                ins.bind(2, (sqlite3_int64)zone);
                ins.bind(3, wx);
                ins.step();
                exec(db, "COMMIT");
            } catch (const StorageError&) {
                if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
                    Log::debug()<<"ROLLBACK failed: "<<sqlite3_errmsg(db);
                throw;
            }
            return true;
        }

        Stmt find(db, "SELECT rowid FROM pi2o WHERE zone = ?1 AND dateTimeStop = 0"
                      " ORDER BY dateTimeStart DESC, rowid DESC LIMIT 1");
        find.bind(1, (sqlite3_int64)zone);
        if (!find.step()) {
            Log::debug()<<"Zone "<<zone<<" has no open run to close";
            return false;
        }
        sqlite3_int64 rowid = find.col_int(0);
        Stmt upd(db, "UPDATE pi2o SET dateTimeStop = ?1 WHERE rowid = ?2");
        upd.bind(1, (sqlite3_int64)timestamp);
        upd.bind(2, rowid);
        upd.step();
        return true;
    });
}
