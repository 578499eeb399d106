#pragma once
#include "relay.hpp"
#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>

// Одна зона полива: реле + (необязательный) датчик дождя.
class SprinklerZone {
public:
    using Clock = std::function<std::time_t()>;

    SprinklerZone(std::shared_ptr<Relay> relay,
                  std::shared_ptr<RainSensor> rain = nullptr,
                  double rate = 0.0,
                  bool rain_blocks_bookkeeping = true,
                  Clock clock = nullptr);

    void on();
    void off();
    bool is_active() const;
    std::time_t last_run() const;
    std::time_t last_stop() const;

    // Время, за которое зона отдаёт threshold при своей норме rate (дюйм/час)
    std::chrono::seconds duration_from_demand(double threshold) const;

    // Восстановление времени последнего запуска из истории после рестарта
    void restore(std::time_t last_start, std::time_t last_stop);

    double rate() const { return rate_; }

private:
    std::shared_ptr<Relay> relay_;
    std::shared_ptr<RainSensor> rain_;
    double rate_;
    bool rain_blocks_bookkeeping_;
    Clock clock_;

    mutable std::mutex mx_;
    bool state_{false};
    std::time_t last_start_{0};
    std::time_t last_stop_{0};
};
