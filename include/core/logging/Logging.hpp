#pragma once
#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>

namespace mirror {
namespace core {
namespace logging {

// LoggingConfig: уровень и ротация файла логов
struct LoggingConfig {
    std::string level = "info";
    std::string filePath = "logs/mirrorscope.log"; // Пусто: только консоль
    size_t maxFileSize = 1024 * 1024 * 5;          // 5 MB
    size_t maxFiles = 2;
    bool validate() const {
        return filePath.empty() || (maxFileSize > 0 && maxFiles > 0);
    }
};

// "debug" -> spdlog::level::debug; неизвестная строка -> info
spdlog::level::level_enum parseLevel(const std::string& level);

// Логгер по умолчанию "mirrorscope": цветная консоль + rotating file sink
void initializeLogging(const LoggingConfig& config);

} // namespace logging
} // namespace core
} // namespace mirror
