#include "core/metrics/MetricsStore.hpp"
#include "core/util/Format.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace mirror {
namespace core {
namespace metrics {

namespace {

constexpr int MAX_WINDOW_MINUTES = 100 * 365 * 24 * 60; // 100 лет

void appendFamily(std::ostringstream& out, const char* name, const char* help,
                  const char* type, const std::string& value) {
    out << "# HELP " << name << ' ' << help << '\n'
        << "# TYPE " << name << ' ' << type << '\n'
        << name << ' ' << value;
}

} // namespace

MetricsStore::MetricsStore(const MetricsConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("MetricsStore: invalid MetricsConfig");
    }
    spdlog::info("MetricsStore: создан, requestHistory={}, systemHistory={}",
                 config_.maxRequestHistory, config_.maxSystemHistory);
}

void MetricsStore::recordRequest(const RequestMetric& metric) {
    const std::string endpoint = metric.endpointKey();
    std::lock_guard<std::mutex> lock(mutex_);
    requestHistory_.push_back(metric);
    while (requestHistory_.size() > config_.maxRequestHistory) {
        requestHistory_.pop_front();
    }

    ++requestCounts_[endpoint];

    auto& times = responseTimes_[endpoint];
    if (times.size() > config_.responseTimeTrimThreshold) {
        times.erase(times.begin(), times.end() - static_cast<std::ptrdiff_t>(config_.responseTimeKeep));
    }
    times.push_back(metric.responseTime);

    bytesTransferred_[endpoint] += metric.bytesSent + metric.bytesReceived;
}

void MetricsStore::recordCacheHit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cacheHits_;
    ++cacheTotal_;
}

void MetricsStore::recordCacheMiss() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cacheMisses_;
    ++cacheTotal_;
}

void MetricsStore::appendSystemSnapshot(const SystemSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    systemHistory_.push_back(snapshot);
    while (systemHistory_.size() > config_.maxSystemHistory) {
        systemHistory_.pop_front();
    }
}

RequestStats MetricsStore::requestStats(int windowMinutes) const {
    // Окно приходит из HTTP-слоя: ограничиваем, чтобы now - window не переполнял Clock::duration
    const int window = std::clamp(windowMinutes, 0, MAX_WINDOW_MINUTES);
    const auto cutoff = Clock::now() - std::chrono::minutes(window);

    std::vector<RequestMetric> recent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& req : requestHistory_) {
            if (req.timestamp >= cutoff) {
                recent.push_back(req);
            }
        }
    }

    RequestStats stats;
    if (recent.empty()) {
        return stats;
    }

    double totalTime = 0.0;
    std::map<std::string, double> endpointTime;
    for (const auto& req : recent) {
        const uint64_t bytes = req.bytesSent + req.bytesReceived;
        totalTime += req.responseTime;
        stats.totalBytesTransferred += bytes;
        ++stats.statusCodes[req.statusCode];

        const std::string key = req.endpointKey();
        auto& ep = stats.endpoints[key];
        ++ep.count;
        ep.bytes += bytes;
        endpointTime[key] += req.responseTime;
    }
    stats.totalRequests = recent.size();
    stats.avgResponseTime = totalTime / static_cast<double>(recent.size());
    for (auto& [key, ep] : stats.endpoints) {
        ep.avgTime = endpointTime[key] / static_cast<double>(ep.count);
    }
    return stats;
}

SystemStats MetricsStore::systemStats() const {
    std::vector<SystemSnapshot> window;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t n = std::min(config_.systemAverageWindow, systemHistory_.size());
        window.assign(systemHistory_.end() - static_cast<std::ptrdiff_t>(n), systemHistory_.end());
    }

    SystemStats stats;
    if (window.empty()) {
        return stats;
    }

    const auto& latest = window.back();
    double cpu = 0.0;
    double memory = 0.0;
    for (const auto& snapshot : window) {
        cpu += snapshot.cpuPercent;
        memory += snapshot.memoryPercent;
    }
    stats.cpuPercent = cpu / static_cast<double>(window.size());
    stats.memoryPercent = memory / static_cast<double>(window.size());
    stats.diskUsagePercent = latest.diskUsagePercent;
    stats.diskReadBytes = latest.diskReadBytes;
    stats.diskWriteBytes = latest.diskWriteBytes;
    stats.networkBytesSent = latest.networkBytesSent;
    stats.networkBytesReceived = latest.networkBytesReceived;
    return stats;
}

CacheStats MetricsStore::cacheStats() const {
    CacheStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.totalRequests = cacheTotal_;
        stats.cacheHits = cacheHits_;
        stats.cacheMisses = cacheMisses_;
    }
    if (stats.totalRequests > 0) {
        stats.hitRatePercent = static_cast<double>(stats.cacheHits) /
                               static_cast<double>(stats.totalRequests) * 100.0;
    }
    return stats;
}

std::string MetricsStore::exportText() const {
    const auto requests = requestStats(60);
    const auto system = systemStats();
    const auto cache = cacheStats();

    std::ostringstream out;
    appendFamily(out, "mirror_http_requests_total", "Total number of HTTP requests", "counter",
                 std::to_string(requests.totalRequests));
    out << '\n';
    appendFamily(out, "mirror_http_request_duration_seconds", "Average HTTP request duration", "gauge",
                 util::formatFixed(requests.avgResponseTime, 4));
    out << '\n';
    appendFamily(out, "mirror_http_bytes_transferred_total", "Total bytes transferred", "counter",
                 std::to_string(requests.totalBytesTransferred));
    out << '\n';
    appendFamily(out, "mirror_system_cpu_percent", "CPU usage percentage", "gauge",
                 util::formatFixed(system.cpuPercent, 2));
    out << '\n';
    appendFamily(out, "mirror_system_memory_percent", "Memory usage percentage", "gauge",
                 util::formatFixed(system.memoryPercent, 2));
    out << '\n';
    appendFamily(out, "mirror_system_disk_usage_percent", "Disk usage percentage", "gauge",
                 util::formatFixed(system.diskUsagePercent, 2));
    out << '\n';
    appendFamily(out, "mirror_cache_requests_total", "Total cache requests", "counter",
                 std::to_string(cache.totalRequests));
    out << '\n';
    appendFamily(out, "mirror_cache_hits_total", "Total cache hits", "counter",
                 std::to_string(cache.cacheHits));
    out << '\n';
    appendFamily(out, "mirror_cache_misses_total", "Total cache misses", "counter",
                 std::to_string(cache.cacheMisses));
    out << '\n';
    appendFamily(out, "mirror_cache_hit_rate_percent", "Cache hit rate percentage", "gauge",
                 util::formatFixed(cache.hitRatePercent, 2));
    return out.str();
}

nlohmann::json MetricsStore::toJson(int windowMinutes) const {
    return {
        {"requests", requestStats(windowMinutes).toJson()},
        {"system", systemStats().toJson()},
        {"cache", cacheStats().toJson()},
        {"timestamp", util::isoTimestamp(Clock::now())}
    };
}

std::vector<RequestMetric> MetricsStore::requestHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {requestHistory_.begin(), requestHistory_.end()};
}

std::vector<SystemSnapshot> MetricsStore::systemHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {systemHistory_.begin(), systemHistory_.end()};
}

std::unordered_map<std::string, EndpointCounter> MetricsStore::endpointCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, EndpointCounter> result;
    for (const auto& [endpoint, count] : requestCounts_) {
        auto& counter = result[endpoint];
        counter.count = count;
        auto times = responseTimes_.find(endpoint);
        counter.retainedSamples = times != responseTimes_.end() ? times->second.size() : 0;
        auto bytes = bytesTransferred_.find(endpoint);
        counter.bytes = bytes != bytesTransferred_.end() ? bytes->second : 0;
    }
    return result;
}

} // namespace metrics
} // namespace core
} // namespace mirror
