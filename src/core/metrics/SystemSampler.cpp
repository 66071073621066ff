#include "core/metrics/SystemSampler.hpp"
#include "core/metrics/MetricsStore.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace mirror {
namespace core {
namespace metrics {

namespace {

uint64_t counterDelta(uint64_t current, uint64_t previous) {
    // Счётчик мог сброситься (перезапуск интерфейса), отрицательных дельт не бывает
    return current >= previous ? current - previous : 0;
}

} // namespace

SystemSampler::SystemSampler(MetricsStore& store, std::unique_ptr<SystemProbe> probe,
                             const SamplerConfig& config)
    : store_(store), probe_(std::move(probe)), config_(config) {
    if (!probe_) {
        throw std::invalid_argument("SystemSampler: probe is null");
    }
    if (!config_.validate()) {
        throw std::invalid_argument("SystemSampler: invalid SamplerConfig");
    }
}

SystemSampler::~SystemSampler() {
    stop();
}

void SystemSampler::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        spdlog::warn("SystemSampler: уже запущен");
        return;
    }
    stopRequested_.store(false, std::memory_order_release);
    samplingThread_ = std::thread([this] { samplingThreadFunc(); });
    spdlog::info("SystemSampler: запущен, интервал {}s, при ошибке {}s",
                 config_.interval.count(), config_.errorInterval.count());
}

void SystemSampler::stop() {
    // Один join на поток: stop() зовут и обработчик завершения, и деструктор
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    stopRequested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        waitCv_.notify_all();
    }
    if (samplingThread_.joinable()) {
        samplingThread_.join();
    }
    running_.store(false, std::memory_order_release);
    spdlog::info("SystemSampler: остановлен, тиков={}, ошибок={}", completedTicks(), failedTicks());
}

bool SystemSampler::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

SystemSnapshot SystemSampler::sampleOnce() {
    SystemSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(sampleMutex_);
        const HostReading current = probe_->read();
        snapshot.cpuPercent = current.cpuPercent;
        snapshot.memoryPercent = current.memoryPercent;
        snapshot.diskUsagePercent = current.diskUsagePercent;
        if (hasBaseline_) {
            snapshot.diskReadBytes = counterDelta(current.diskReadBytes, baseline_.diskReadBytes);
            snapshot.diskWriteBytes = counterDelta(current.diskWriteBytes, baseline_.diskWriteBytes);
            snapshot.networkBytesSent = counterDelta(current.networkBytesSent, baseline_.networkBytesSent);
            snapshot.networkBytesReceived = counterDelta(current.networkBytesReceived, baseline_.networkBytesReceived);
        }
        baseline_ = current;
        hasBaseline_ = true;
        snapshot.timestamp = Clock::now();
    }
    store_.appendSystemSnapshot(snapshot);
    completedTicks_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("SystemSampler: cpu={:.2f}% mem={:.2f}% disk={:.2f}% io r/w={}/{} net s/r={}/{}",
                  snapshot.cpuPercent, snapshot.memoryPercent, snapshot.diskUsagePercent,
                  snapshot.diskReadBytes, snapshot.diskWriteBytes,
                  snapshot.networkBytesSent, snapshot.networkBytesReceived);
    return snapshot;
}

bool SystemSampler::waitFor(std::chrono::seconds interval) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, interval, [this] { return stopRequested_.load(std::memory_order_acquire); });
    return !stopRequested_.load(std::memory_order_acquire);
}

void SystemSampler::samplingThreadFunc() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    spdlog::debug("SystemSampler: поток стартует (thread_id={})", oss.str());

    while (!stopRequested_.load(std::memory_order_acquire)) {
        std::chrono::seconds next = config_.interval;
        try {
            sampleOnce();
        } catch (const std::exception& e) {
            failedTicks_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("SystemSampler: ошибка сбора системных метрик: {}", e.what());
            next = config_.errorInterval;
        }
        if (!waitFor(next)) break;
    }

    spdlog::debug("SystemSampler: поток завершён (thread_id={})", oss.str());
}

} // namespace metrics
} // namespace core
} // namespace mirror
