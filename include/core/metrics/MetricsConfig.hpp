#pragma once
#include <cstddef>
#include <chrono>
#include <string>

namespace mirror {
namespace core {
namespace metrics {

// MetricsConfig: ёмкости историй и параметры агрегации MetricsStore
struct MetricsConfig {
    size_t maxRequestHistory = 10000;          // История запросов
    size_t maxSystemHistory = 1000;            // История системных снимков
    size_t responseTimeTrimThreshold = 1000;   // Порог обрезки списка времён ответа
    size_t responseTimeKeep = 500;             // Сколько последних оставить
    size_t systemAverageWindow = 10;           // Окно усреднения CPU/памяти
    bool validate() const {
        return maxRequestHistory > 0 && maxSystemHistory > 0 &&
               responseTimeKeep > 0 && responseTimeKeep <= responseTimeTrimThreshold &&
               systemAverageWindow > 0;
    }
};

// SamplerConfig: период опроса хоста и отступ при ошибке
struct SamplerConfig {
    std::chrono::seconds interval = std::chrono::seconds(5);
    std::chrono::seconds errorInterval = std::chrono::seconds(10);
    std::string diskMountPoint = "/";          // Точка монтирования для disk usage
    bool validate() const {
        return interval.count() > 0 && errorInterval.count() > 0 && !diskMountPoint.empty();
    }
};

} // namespace metrics
} // namespace core
} // namespace mirror
