#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mirror {
namespace core {
namespace metrics {

class MetricsStore;

// RequestRecorder: точка интеграции с HTTP-слоем: ровно один вызов на
// завершённый запрос. Любая ошибка записи логируется и не выходит наружу,
// чтобы сбор метрик не мог сломать обслуживаемый запрос.
class RequestRecorder {
public:
    explicit RequestRecorder(MetricsStore& store);

    // Отсутствующие размеры тел (стриминг, пустое тело) учитываются как 0.
    // Возвращает false, если запись не удалась.
    bool record(const std::string& method,
                const std::string& path,
                int statusCode,
                std::chrono::duration<double> elapsed,
                std::optional<uint64_t> bytesReceived = std::nullopt,
                std::optional<uint64_t> bytesSent = std::nullopt) noexcept;

    bool recordCacheHit() noexcept;
    bool recordCacheMiss() noexcept;

    // Путь без query/fragment; пустой путь становится "/"
    static std::string normalizePath(const std::string& rawPath);

    // Scope: таймер запроса; finish() записывает метрику один раз
    class Scope {
    public:
        Scope(RequestRecorder& recorder, std::string method, std::string path,
              std::optional<uint64_t> bytesReceived = std::nullopt);
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        bool finish(int statusCode, std::optional<uint64_t> bytesSent = std::nullopt) noexcept;
        bool finished() const { return finished_; }
    private:
        RequestRecorder& recorder_;
        std::string method_;
        std::string path_;
        std::optional<uint64_t> bytesReceived_;
        std::chrono::steady_clock::time_point start_;
        bool finished_ = false;
    };

    Scope begin(const std::string& method, const std::string& path,
                std::optional<uint64_t> bytesReceived = std::nullopt);

private:
    MetricsStore& store_;
};

} // namespace metrics
} // namespace core
} // namespace mirror
