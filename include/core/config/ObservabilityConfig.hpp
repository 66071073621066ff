#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/inventory/CacheInventory.hpp"
#include "core/logging/Logging.hpp"
#include "core/metrics/MetricsConfig.hpp"

namespace mirror {
namespace core {
namespace config {

// ObservabilityConfig: конфигурация процесса из JSON, все ключи необязательны
struct ObservabilityConfig {
    inventory::CacheLayout cache;       // cache_root, repo_prefix
    metrics::MetricsConfig metrics;     // "metrics"
    metrics::SamplerConfig sampler;     // "sampler"
    logging::LoggingConfig logging;     // "logging"
    std::chrono::seconds reportInterval = std::chrono::seconds(60);

    bool validate() const {
        return cache.validate() && metrics.validate() && sampler.validate() &&
               logging.validate() && reportInterval.count() > 0;
    }

    nlohmann::json toJson() const;
    static ObservabilityConfig fromJson(const nlohmann::json& j); // Ошибки типов пробрасываются

    // Бросает std::runtime_error: файл не открыт, JSON битый, validate() == false
    static ObservabilityConfig loadFromFile(const std::string& filename);
    // Ошибку логирует и возвращает значения по умолчанию
    static ObservabilityConfig loadOrDefault(const std::string& filename);
};

} // namespace config
} // namespace core
} // namespace mirror
