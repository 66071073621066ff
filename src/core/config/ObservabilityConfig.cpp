#include "core/config/ObservabilityConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace mirror {
namespace core {
namespace config {

nlohmann::json ObservabilityConfig::toJson() const {
    nlohmann::json j;
    j["cache_root"] = cache.root.string();
    j["repo_prefix"] = cache.repoPrefix;
    j["metrics"] = {
        {"max_request_history", metrics.maxRequestHistory},
        {"max_system_history", metrics.maxSystemHistory},
        {"response_time_trim_threshold", metrics.responseTimeTrimThreshold},
        {"response_time_keep", metrics.responseTimeKeep},
        {"system_average_window", metrics.systemAverageWindow}
    };
    j["sampler"] = {
        {"interval_seconds", sampler.interval.count()},
        {"error_interval_seconds", sampler.errorInterval.count()},
        {"disk_mount_point", sampler.diskMountPoint}
    };
    j["logging"] = {
        {"level", logging.level},
        {"file_path", logging.filePath},
        {"max_file_size", logging.maxFileSize},
        {"max_files", logging.maxFiles}
    };
    j["report_interval_seconds"] = reportInterval.count();
    return j;
}

ObservabilityConfig ObservabilityConfig::fromJson(const nlohmann::json& j) {
    ObservabilityConfig config;
    if (j.contains("cache_root")) config.cache.root = j["cache_root"].get<std::string>();
    if (j.contains("repo_prefix")) config.cache.repoPrefix = j["repo_prefix"].get<std::string>();

    if (j.contains("metrics")) {
        const auto& m = j["metrics"];
        config.metrics.maxRequestHistory = m.value("max_request_history", config.metrics.maxRequestHistory);
        config.metrics.maxSystemHistory = m.value("max_system_history", config.metrics.maxSystemHistory);
        config.metrics.responseTimeTrimThreshold =
            m.value("response_time_trim_threshold", config.metrics.responseTimeTrimThreshold);
        config.metrics.responseTimeKeep = m.value("response_time_keep", config.metrics.responseTimeKeep);
        config.metrics.systemAverageWindow = m.value("system_average_window", config.metrics.systemAverageWindow);
    }

    if (j.contains("sampler")) {
        const auto& s = j["sampler"];
        if (s.contains("interval_seconds")) {
            config.sampler.interval = std::chrono::seconds(s["interval_seconds"].get<long long>());
        }
        if (s.contains("error_interval_seconds")) {
            config.sampler.errorInterval = std::chrono::seconds(s["error_interval_seconds"].get<long long>());
        }
        config.sampler.diskMountPoint = s.value("disk_mount_point", config.sampler.diskMountPoint);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = l.value("level", config.logging.level);
        config.logging.filePath = l.value("file_path", config.logging.filePath);
        config.logging.maxFileSize = l.value("max_file_size", config.logging.maxFileSize);
        config.logging.maxFiles = l.value("max_files", config.logging.maxFiles);
    }

    if (j.contains("report_interval_seconds")) {
        config.reportInterval = std::chrono::seconds(j["report_interval_seconds"].get<long long>());
    }
    return config;
}

ObservabilityConfig ObservabilityConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }
    ObservabilityConfig config;
    try {
        nlohmann::json j;
        file >> j;
        config = fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + filename + ": " + e.what());
    }
    if (!config.validate()) {
        throw std::runtime_error("Config file " + filename + " has out-of-range values");
    }
    return config;
}

ObservabilityConfig ObservabilityConfig::loadOrDefault(const std::string& filename) {
    try {
        auto config = loadFromFile(filename);
        spdlog::info("[Config] Loaded from {}", filename);
        return config;
    } catch (const std::exception& e) {
        spdlog::warn("[Config] {}: falling back to defaults", e.what());
    }
    return ObservabilityConfig{};
}

} // namespace config
} // namespace core
} // namespace mirror
