#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include "core/metrics/MetricsConfig.hpp"
#include "core/metrics/MetricTypes.hpp"
#include "core/metrics/SystemProbe.hpp"

namespace mirror {
namespace core {
namespace metrics {

class MetricsStore;

// SystemSampler: фоновый опрос хоста с фиксированным периодом.
// Накопительные счётчики диска и сети превращаются в дельты за интервал:
// на первом тике базы нет и дельты равны 0, база обновляется на каждом тике.
// Ошибка чтения логируется, следующий тик ждёт errorInterval; поток не падает.
class SystemSampler {
public:
    SystemSampler(MetricsStore& store, std::unique_ptr<SystemProbe> probe,
                  const SamplerConfig& config = SamplerConfig{});
    ~SystemSampler(); // Останавливает поток
    SystemSampler(const SystemSampler&) = delete;
    SystemSampler& operator=(const SystemSampler&) = delete;

    void start(); // Запуск фонового потока
    void stop();  // Остановка и join
    bool isRunning() const;

    // Один синхронный тик: чтение, дельты, запись в хранилище. Ошибки probe пробрасываются.
    SystemSnapshot sampleOnce();

    size_t completedTicks() const { return completedTicks_.load(std::memory_order_relaxed); }
    size_t failedTicks() const { return failedTicks_.load(std::memory_order_relaxed); }

private:
    void samplingThreadFunc();
    bool waitFor(std::chrono::seconds interval); // false, если пришёл stop

    MetricsStore& store_;
    std::unique_ptr<SystemProbe> probe_;
    const SamplerConfig config_;

    std::mutex sampleMutex_; // Сериализует probe и базу
    bool hasBaseline_ = false;
    HostReading baseline_;

    std::mutex lifecycleMutex_; // start()/stop()
    std::thread samplingThread_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<size_t> completedTicks_{0};
    std::atomic<size_t> failedTicks_{0};
};

} // namespace metrics
} // namespace core
} // namespace mirror
