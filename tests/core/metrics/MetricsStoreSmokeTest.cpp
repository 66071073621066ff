#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/metrics/MetricsStore.hpp"

#include <spdlog/spdlog.h>

using namespace mirror::core::metrics;

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

RequestMetric makeRequest(const std::string& path, int status, double seconds,
                          uint64_t sent = 0, uint64_t received = 0) {
    RequestMetric metric;
    metric.method = "GET";
    metric.path = path;
    metric.statusCode = status;
    metric.responseTime = seconds;
    metric.bytesSent = sent;
    metric.bytesReceived = received;
    return metric;
}

SystemSnapshot makeSnapshot(double cpu, double memory) {
    SystemSnapshot snapshot;
    snapshot.cpuPercent = cpu;
    snapshot.memoryPercent = memory;
    snapshot.diskUsagePercent = 40.0;
    return snapshot;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

void smokeTestMetricsStore() {
    std::cout << "Testing MetricsStore basic operations...\n";

    MetricsStore store;
    auto config = store.getConfiguration();
    assert(config.maxRequestHistory == 10000);
    assert(config.maxSystemHistory == 1000);
    assert(store.requestHistory().empty());
    assert(store.systemHistory().empty());

    MetricsConfig broken;
    broken.responseTimeKeep = 2000; // больше порога
    bool thrown = false;
    try {
        MetricsStore invalid(broken);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] MetricsStore smoke test\n";
}

void testCacheCounters() {
    std::cout << "Testing MetricsStore cache counters...\n";

    MetricsStore store;
    auto empty = store.cacheStats();
    assert(empty.totalRequests == 0);
    assert(near(empty.hitRatePercent, 0.0));

    for (int i = 0; i < 3; ++i) store.recordCacheHit();
    store.recordCacheMiss();

    auto stats = store.cacheStats();
    assert(stats.totalRequests == 4);
    assert(stats.cacheHits == 3);
    assert(stats.cacheMisses == 1);
    assert(stats.totalRequests == stats.cacheHits + stats.cacheMisses);
    assert(near(stats.hitRatePercent, 75.0));

    std::cout << "[OK] MetricsStore cache counters test\n";
}

void testRequestHistoryCapacity() {
    std::cout << "Testing MetricsStore request history capacity...\n";

    MetricsConfig config;
    config.maxRequestHistory = 3;
    MetricsStore store(config);
    for (int i = 0; i < 5; ++i) {
        store.recordRequest(makeRequest("/t" + std::to_string(i), 200, 0.1));
    }

    auto history = store.requestHistory();
    assert(history.size() == 3);
    assert(history[0].path == "/t2");
    assert(history[1].path == "/t3");
    assert(history[2].path == "/t4");

    // Накопленные счётчики не зависят от вытеснения из истории
    auto counters = store.endpointCounters();
    assert(counters.size() == 5);
    assert(counters["GET /t0"].count == 1);

    std::cout << "[OK] MetricsStore request history capacity test\n";
}

void testRequestStatsWindow() {
    std::cout << "Testing MetricsStore request stats window...\n";

    MetricsStore store;
    auto old = makeRequest("/old", 500, 9.0, 1000, 1000);
    old.timestamp = Clock::now() - std::chrono::hours(2);
    store.recordRequest(old);
    store.recordRequest(makeRequest("/api/models", 200, 0.2, 100, 10));
    store.recordRequest(makeRequest("/api/models", 404, 0.4, 50, 0));
    store.recordRequest(makeRequest("/files", 200, 0.6, 0, 0));

    auto stats = store.requestStats(60);
    assert(stats.totalRequests == 3);
    assert(near(stats.avgResponseTime, 0.4));
    assert(stats.totalBytesTransferred == 160);
    assert(stats.statusCodes.size() == 2);
    assert(stats.statusCodes[200] == 2);
    assert(stats.statusCodes[404] == 1);
    assert(stats.statusCodes.count(500) == 0);

    const auto& models = stats.endpoints.at("GET /api/models");
    assert(models.count == 2);
    assert(near(models.avgTime, 0.3));
    assert(models.bytes == 160);
    assert(stats.endpoints.count("GET /old") == 0);

    // Окно в три часа захватывает старый запрос
    auto wide = store.requestStats(180);
    assert(wide.totalRequests == 4);

    // Экстремальные окна не переполняют арифметику времени
    assert(store.requestStats(std::numeric_limits<int>::max()).totalRequests == 4);
    assert(store.requestStats(std::numeric_limits<int>::min()).totalRequests == 0);

    auto json = stats.toJson();
    assert(json["status_codes"]["200"] == 2);
    assert(json["endpoints"]["GET /files"]["count"] == 1);

    std::cout << "[OK] MetricsStore request stats window test\n";
}

void testEmptyStats() {
    std::cout << "Testing MetricsStore empty stats...\n";

    MetricsStore store;
    auto requests = store.requestStats();
    assert(requests.totalRequests == 0);
    assert(near(requests.avgResponseTime, 0.0));
    assert(requests.statusCodes.empty());
    assert(requests.endpoints.empty());

    auto system = store.systemStats();
    assert(near(system.cpuPercent, 0.0));
    assert(near(system.memoryPercent, 0.0));
    assert(system.networkBytesSent == 0);

    std::cout << "[OK] MetricsStore empty stats test\n";
}

void testResponseTimeTrim() {
    std::cout << "Testing MetricsStore response time trimming...\n";

    MetricsConfig config;
    config.responseTimeTrimThreshold = 4;
    config.responseTimeKeep = 2;
    MetricsStore store(config);

    for (int i = 0; i < 5; ++i) {
        store.recordRequest(makeRequest("/trim", 200, 0.1));
    }
    assert(store.endpointCounters()["GET /trim"].retainedSamples == 5);

    // Шестой запрос: 5 > 4, остаются последние 2 плюс новый
    store.recordRequest(makeRequest("/trim", 200, 0.1));
    auto counter = store.endpointCounters()["GET /trim"];
    assert(counter.retainedSamples == 3);
    assert(counter.count == 6);

    std::cout << "[OK] MetricsStore response time trimming test\n";
}

void testSystemStatsAveraging() {
    std::cout << "Testing MetricsStore system stats averaging...\n";

    MetricsConfig config;
    config.maxSystemHistory = 12;
    MetricsStore store(config);

    // 15 снимков: в истории 12, усредняются последние 10 (cpu 5..14)
    for (int i = 0; i < 15; ++i) {
        auto snapshot = makeSnapshot(static_cast<double>(i), 50.0);
        snapshot.networkBytesSent = static_cast<uint64_t>(i);
        store.appendSystemSnapshot(snapshot);
    }
    assert(store.systemHistory().size() == 12);

    auto stats = store.systemStats();
    assert(near(stats.cpuPercent, 9.5));
    assert(near(stats.memoryPercent, 50.0));
    assert(near(stats.diskUsagePercent, 40.0));
    assert(stats.networkBytesSent == 14);

    MetricsStore small;
    small.appendSystemSnapshot(makeSnapshot(10.0, 20.0));
    small.appendSystemSnapshot(makeSnapshot(30.0, 40.0));
    auto two = small.systemStats();
    assert(near(two.cpuPercent, 20.0));
    assert(near(two.memoryPercent, 30.0));

    std::cout << "[OK] MetricsStore system stats averaging test\n";
}

void testExportText() {
    std::cout << "Testing MetricsStore text export...\n";

    MetricsStore store;
    store.recordRequest(makeRequest("/a", 200, 0.25, 100, 20));
    store.recordCacheHit();
    store.recordCacheMiss();
    store.appendSystemSnapshot(makeSnapshot(12.5, 33.333));

    const std::string text = store.exportText();
    assert(text.back() != '\n');

    auto lines = splitLines(text);
    assert(lines.size() == 30);
    assert(lines[0] == "# HELP mirror_http_requests_total Total number of HTTP requests");
    assert(lines[1] == "# TYPE mirror_http_requests_total counter");
    assert(lines[2] == "mirror_http_requests_total 1");
    assert(lines[5] == "mirror_http_request_duration_seconds 0.2500");
    assert(lines[8] == "mirror_http_bytes_transferred_total 120");
    assert(lines[10] == "# TYPE mirror_system_cpu_percent gauge");
    assert(lines[11] == "mirror_system_cpu_percent 12.50");
    assert(lines[14] == "mirror_system_memory_percent 33.33");
    assert(lines[17] == "mirror_system_disk_usage_percent 40.00");
    assert(lines[20] == "mirror_cache_requests_total 2");
    assert(lines[23] == "mirror_cache_hits_total 1");
    assert(lines[26] == "mirror_cache_misses_total 1");
    assert(lines[29] == "mirror_cache_hit_rate_percent 50.00");

    auto json = store.toJson();
    assert(json["requests"]["total_requests"] == 1);
    assert(json["cache"]["cache_hits"] == 1);
    assert(json["system"]["disk_io"].contains("read_bytes"));
    assert(json["timestamp"].is_string());

    std::cout << "[OK] MetricsStore text export test\n";
}

int main() {
    try {
        smokeTestMetricsStore();
        testCacheCounters();
        testRequestHistoryCapacity();
        testRequestStatsWindow();
        testEmptyStats();
        testResponseTimeTrim();
        testSystemStatsAveraging();
        testExportText();

        spdlog::shutdown();
        std::cout << "All MetricsStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
