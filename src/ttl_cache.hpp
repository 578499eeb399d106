#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

// Кэш с временем жизни записей. Ошибки (исключения из fn) не кэшируются.
template <typename K, typename V>
class TtlCache {
public:
    using clock = std::chrono::steady_clock;

    explicit TtlCache(clock::duration ttl) : ttl_(ttl) {}

    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = items_.find(key);
        if (it == items_.end()) return std::nullopt;
        if (clock::now() >= it->second.expires) { items_.erase(it); return std::nullopt; }
        return it->second.value;
    }

    void put(const K& key, V value) {
        std::lock_guard<std::mutex> lk(mx_);
        items_[key] = Entry{std::move(value), clock::now() + ttl_};
    }

    template <typename Fn>
    V memoize(const K& key, Fn&& fn) {
        if (auto v = get(key)) return *v;
        V v = fn();
        put(key, v);
        return v;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mx_);
        items_.clear();
    }

private:
    struct Entry {
        V value;
        clock::time_point expires;
    };

    clock::duration ttl_;
    std::mutex mx_;
    std::map<K, Entry> items_;
};
