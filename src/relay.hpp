#pragma once
#include <memory>
#include <string>

class WeatherSource;

// Реле, активное по высокому уровню
class Relay {
public:
    virtual ~Relay() = default;
    virtual void on() = 0;
    virtual void off() = 0;
};

class RainSensor {
public:
    virtual ~RainSensor() = default;
    virtual bool is_active() = 0;      // идёт дождь?
};

// GPIO через /sys/class/gpio. pin <= 0 -> реле не подключено, I/O не делаем.
class GpioRelay : public Relay {
public:
    explicit GpioRelay(int pin, std::string sysfs_root = "/sys/class/gpio");
    void on() override;
    void off() override;
    int  pin() const { return pin_; }

private:
    void write_value(const char* v);

    int pin_;
    std::string root_;
};

class NullRainSensor : public RainSensor {
public:
    bool is_active() override { return false; }
};

class GpioRainSensor : public RainSensor {
public:
    explicit GpioRainSensor(int pin, std::string sysfs_root = "/sys/class/gpio");
    bool is_active() override;
    int  read();                       // -1 если пин не задан или не читается

private:
    int pin_;
    std::string root_;
};

// "Программный" датчик: дождь, если за сегодня выпало больше порога
class SoftRainSensor : public RainSensor {
public:
    SoftRainSensor(double cutoff_in, std::shared_ptr<WeatherSource> source, std::string station);
    bool is_active() override;

private:
    double cutoff_;
    std::shared_ptr<WeatherSource> source_;
    std::string station_;
};
