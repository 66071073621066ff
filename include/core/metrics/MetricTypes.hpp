#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace mirror {
namespace core {
namespace metrics {

using Clock = std::chrono::system_clock;

// RequestMetric: один завершённый HTTP-запрос
struct RequestMetric {
    std::string method;
    std::string path;
    int statusCode = 0;
    double responseTime = 0.0;   // Секунды
    uint64_t bytesSent = 0;      // Тело ответа
    uint64_t bytesReceived = 0;  // Тело запроса
    Clock::time_point timestamp = Clock::now();

    std::string endpointKey() const { return method + " " + path; }
};

// SystemSnapshot: один периодический снимок хоста, счётчики I/O уже как дельты
struct SystemSnapshot {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
    double diskUsagePercent = 0.0;
    uint64_t diskReadBytes = 0;
    uint64_t diskWriteBytes = 0;
    uint64_t networkBytesSent = 0;
    uint64_t networkBytesReceived = 0;
    Clock::time_point timestamp = Clock::now();
};

// EndpointStats: агрегаты по "METHOD path" внутри окна
struct EndpointStats {
    uint64_t count = 0;
    double avgTime = 0.0;
    uint64_t bytes = 0;
    nlohmann::json toJson() const {
        return {{"count", count}, {"avg_time", avgTime}, {"bytes", bytes}};
    }
};

// RequestStats: результат requestStats(window); нулевой, если окно пусто
struct RequestStats {
    uint64_t totalRequests = 0;
    double avgResponseTime = 0.0;
    uint64_t totalBytesTransferred = 0;
    std::map<int, uint64_t> statusCodes;
    std::map<std::string, EndpointStats> endpoints;
    nlohmann::json toJson() const {
        nlohmann::json codes = nlohmann::json::object();
        for (const auto& [code, count] : statusCodes) {
            codes[std::to_string(code)] = count;
        }
        nlohmann::json eps = nlohmann::json::object();
        for (const auto& [key, stats] : endpoints) {
            eps[key] = stats.toJson();
        }
        return {
            {"total_requests", totalRequests},
            {"avg_response_time", avgResponseTime},
            {"total_bytes_transferred", totalBytesTransferred},
            {"status_codes", codes},
            {"endpoints", eps}
        };
    }
};

// SystemStats: последний снимок + усреднённые CPU/память
struct SystemStats {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
    double diskUsagePercent = 0.0;
    uint64_t diskReadBytes = 0;
    uint64_t diskWriteBytes = 0;
    uint64_t networkBytesSent = 0;
    uint64_t networkBytesReceived = 0;
    nlohmann::json toJson() const {
        return {
            {"cpu_percent", cpuPercent},
            {"memory_percent", memoryPercent},
            {"disk_usage_percent", diskUsagePercent},
            {"disk_io", {{"read_bytes", diskReadBytes}, {"write_bytes", diskWriteBytes}}},
            {"network_io", {{"bytes_sent", networkBytesSent}, {"bytes_received", networkBytesReceived}}}
        };
    }
};

// CacheStats: счётчики попаданий/промахов кэша зеркала
struct CacheStats {
    uint64_t totalRequests = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    double hitRatePercent = 0.0;
    nlohmann::json toJson() const {
        return {
            {"total_requests", totalRequests},
            {"cache_hits", cacheHits},
            {"cache_misses", cacheMisses},
            {"hit_rate_percent", hitRatePercent}
        };
    }
};

// EndpointCounter: накопленные за всё время счётчики конечной точки
struct EndpointCounter {
    uint64_t count = 0;
    size_t retainedSamples = 0; // Размер списка времён ответа после обрезки
    uint64_t bytes = 0;
};

} // namespace metrics
} // namespace core
} // namespace mirror
