#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mirror {
namespace core {
namespace inventory {

// FileTimes: atime/mtime из stat(2); std::filesystem не отдаёт atime
struct FileTimes {
    std::chrono::system_clock::time_point lastAccess;
    std::chrono::system_clock::time_point lastModified;
};

std::optional<FileTimes> readFileTimes(const std::filesystem::path& path);

// Обход всех файлов поддерева. Нечитаемые каталоги пропускаются целиком,
// в симлинки на каталоги не заходим. Колбэк получает путь и размер файла.
void forEachFile(const std::filesystem::path& root,
                 const std::function<void(const std::filesystem::path&, uint64_t)>& visit);

uint64_t folderSize(const std::filesystem::path& root);  // Рекурсивная сумма байт
uint64_t countFiles(const std::filesystem::path& root);  // Рекурсивное число файлов
uint64_t countRepos(const std::filesystem::path& categoryDir); // Каталоги <org>/<repo>

bool isDirectory(const std::filesystem::path& path); // Без исключений

} // namespace inventory
} // namespace core
} // namespace mirror
