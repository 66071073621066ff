#include "core/logging/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace mirror {
namespace core {
namespace logging {

namespace {
const char* const LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
}

spdlog::level::level_enum parseLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str возвращает off для незнакомых строк
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

void initializeLogging(const LoggingConfig& config) {
    const auto level = parseLevel(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(); // stdout занят отчётом --once
    consoleSink->set_pattern(LOG_PATTERN);
    sinks.push_back(consoleSink);

    if (!config.filePath.empty()) {
        try {
            const auto parent = std::filesystem::path(config.filePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);
        } catch (const std::exception& e) {
            // Файловый лог необязателен, консоль остаётся
            std::cerr << "Failed to open log file " << config.filePath << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("mirrorscope", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized: level={}, file='{}'",
                 spdlog::level::to_string_view(level), config.filePath);
}

} // namespace logging
} // namespace core
} // namespace mirror
