#pragma once
#include <stdexcept>
#include <string>

// Погодный сервис недоступен или вернул мусор. Всегда восстановимо.
struct UpstreamError : std::runtime_error {
    explicit UpstreamError(const std::string& m) : std::runtime_error(m) {}
};

// Неверные аргументы вызова (нарушение контракта вызывающим).
struct ValidationError : std::invalid_argument {
    explicit ValidationError(const std::string& m) : std::invalid_argument(m) {}
};

// Ошибка SQLite внутри архива.
struct StorageError : std::runtime_error {
    explicit StorageError(const std::string& m) : std::runtime_error(m) {}
};

// Ошибка GPIO. Логируется и не пробрасывается дальше реле/датчика.
struct HardwareError : std::runtime_error {
    explicit HardwareError(const std::string& m) : std::runtime_error(m) {}
};
