#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/metrics/MetricsConfig.hpp"
#include "core/metrics/MetricTypes.hpp"

namespace mirror {
namespace core {
namespace metrics {

// MetricsStore: потокобезопасное хранилище метрик запросов, системы и кэша.
// Один экземпляр на процесс, владеет им корень композиции; HTTP-слой и прокси
// получают ссылку. Все изменения и многополевые чтения идут под одним mutex_,
// поэтому total == hits + misses и размер историй <= ёмкости наблюдаются атомарно.
class MetricsStore {
public:
    explicit MetricsStore(const MetricsConfig& config = MetricsConfig{});
    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    void recordRequest(const RequestMetric& metric); // Запрос
    void recordCacheHit();  // Попадание
    void recordCacheMiss(); // Промах
    void appendSystemSnapshot(const SystemSnapshot& snapshot); // Системный снимок

    RequestStats requestStats(int windowMinutes = 60) const; // Статистика за окно
    SystemStats systemStats() const; // Системная статистика
    CacheStats cacheStats() const;   // Статистика кэша
    std::string exportText() const;  // Prometheus text format
    nlohmann::json toJson(int windowMinutes = 60) const; // Сводка для API

    std::vector<RequestMetric> requestHistory() const; // Копия истории запросов
    std::vector<SystemSnapshot> systemHistory() const; // Копия системной истории
    std::unordered_map<std::string, EndpointCounter> endpointCounters() const;
    MetricsConfig getConfiguration() const { return config_; }

private:
    const MetricsConfig config_;
    mutable std::mutex mutex_;
    std::deque<RequestMetric> requestHistory_;
    std::deque<SystemSnapshot> systemHistory_;
    std::unordered_map<std::string, uint64_t> requestCounts_;
    std::unordered_map<std::string, std::vector<double>> responseTimes_;
    std::unordered_map<std::string, uint64_t> bytesTransferred_;
    uint64_t cacheHits_ = 0;
    uint64_t cacheMisses_ = 0;
    uint64_t cacheTotal_ = 0;
};

} // namespace metrics
} // namespace core
} // namespace mirror
