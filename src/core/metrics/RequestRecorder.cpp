#include "core/metrics/RequestRecorder.hpp"
#include "core/metrics/MetricsStore.hpp"
#include "core/util/Format.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace mirror {
namespace core {
namespace metrics {

RequestRecorder::RequestRecorder(MetricsStore& store) : store_(store) {}

std::string RequestRecorder::normalizePath(const std::string& rawPath) {
    auto end = rawPath.find_first_of("?#");
    std::string path = rawPath.substr(0, end);
    if (path.empty()) {
        path = "/";
    }
    return path;
}

bool RequestRecorder::record(const std::string& method,
                             const std::string& path,
                             int statusCode,
                             std::chrono::duration<double> elapsed,
                             std::optional<uint64_t> bytesReceived,
                             std::optional<uint64_t> bytesSent) noexcept {
    try {
        const double seconds = elapsed.count();
        if (!std::isfinite(seconds) || seconds < 0.0) {
            throw std::invalid_argument("response time must be a finite non-negative value");
        }
        RequestMetric metric;
        metric.method = util::toUpper(method);
        metric.path = normalizePath(path);
        metric.statusCode = statusCode;
        metric.responseTime = seconds;
        metric.bytesReceived = bytesReceived.value_or(0);
        metric.bytesSent = bytesSent.value_or(0);
        metric.timestamp = Clock::now();
        store_.recordRequest(metric);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("RequestRecorder: failed to record metrics for {} {}: {}", method, path, e.what());
    } catch (...) {
        spdlog::warn("RequestRecorder: failed to record metrics for {} {}: unknown error", method, path);
    }
    return false;
}

bool RequestRecorder::recordCacheHit() noexcept {
    try {
        store_.recordCacheHit();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("RequestRecorder: failed to record cache hit: {}", e.what());
    }
    return false;
}

bool RequestRecorder::recordCacheMiss() noexcept {
    try {
        store_.recordCacheMiss();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("RequestRecorder: failed to record cache miss: {}", e.what());
    }
    return false;
}

RequestRecorder::Scope RequestRecorder::begin(const std::string& method, const std::string& path,
                                              std::optional<uint64_t> bytesReceived) {
    return Scope(*this, method, path, bytesReceived);
}

RequestRecorder::Scope::Scope(RequestRecorder& recorder, std::string method, std::string path,
                              std::optional<uint64_t> bytesReceived)
    : recorder_(recorder),
      method_(std::move(method)),
      path_(std::move(path)),
      bytesReceived_(bytesReceived),
      start_(std::chrono::steady_clock::now()) {}

bool RequestRecorder::Scope::finish(int statusCode, std::optional<uint64_t> bytesSent) noexcept {
    if (finished_) {
        return false;
    }
    finished_ = true;
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    return recorder_.record(method_, path_, statusCode, elapsed, bytesReceived_, bytesSent);
}

} // namespace metrics
} // namespace core
} // namespace mirror
