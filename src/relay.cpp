#include "relay.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "weather.hpp"
#include <fstream>

static void sysfs_write(const std::string& path, const std::string& v) {
    std::ofstream f(path);
    if (!f) throw HardwareError("Cannot open "+path);
    f<<v;
    f.flush();
    if (!f) throw HardwareError("Write failed: "+path);
}

static void export_pin(const std::string& root, int pin, const char* direction) {
    std::string dir = root+"/gpio"+std::to_string(pin);
    if (!std::ifstream(dir+"/direction")) sysfs_write(root+"/export", std::to_string(pin));
    sysfs_write(dir+"/direction", direction);
}

GpioRelay::GpioRelay(int pin, std::string sysfs_root)
: pin_(pin), root_(std::move(sysfs_root)) {
    if (pin_ <= 0) return;
    try {
        export_pin(root_, pin_, "out");
    } catch (const HardwareError& e) {
        Log::warn()<<"GPIO "<<pin_<<" setup failed: "<<e.what();
    }
    off();
}

void GpioRelay::write_value(const char* v) {
    if (pin_ <= 0) return;
    try {
        sysfs_write(root_+"/gpio"+std::to_string(pin_)+"/value", v);
    } catch (const HardwareError& e) {
        // Состояние считаем выставленным, планировщик не должен вставать из-за железа
        Log::error()<<"Relay on GPIO "<<pin_<<": "<<e.what();
    }
}

void GpioRelay::on()  { write_value("1"); }
void GpioRelay::off() { write_value("0"); }

GpioRainSensor::GpioRainSensor(int pin, std::string sysfs_root)
: pin_(pin), root_(std::move(sysfs_root)) {
    if (pin_ <= 0) return;
    try {
        export_pin(root_, pin_, "in");
    } catch (const HardwareError& e) {
        Log::warn()<<"GPIO "<<pin_<<" setup failed: "<<e.what();
    }
}

int GpioRainSensor::read() {
    if (pin_ <= 0) return -1;
    std::ifstream f(root_+"/gpio"+std::to_string(pin_)+"/value");
    int v = -1;
    if (!(f>>v)) {
        Log::error()<<"Rain sensor on GPIO "<<pin_<<": read failed";
        return -1;
    }
    return v;
}

bool GpioRainSensor::is_active() { return read() > 0; }

SoftRainSensor::SoftRainSensor(double cutoff_in, std::shared_ptr<WeatherSource> source, std::string station)
: cutoff_(cutoff_in), source_(std::move(source)), station_(std::move(station)) {}

bool SoftRainSensor::is_active() {
    if (!source_) return false;
    try {
        double p = source_->precip_today(station_);
        return p > cutoff_;
    } catch (const UpstreamError& e) {
        Log::warn()<<"Software rain sensor: "<<e.what()<<", assuming no rain";
        return false;
    }
}
