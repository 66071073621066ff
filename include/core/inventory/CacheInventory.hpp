#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mirror {
namespace core {
namespace inventory {

// CacheLayout: где лежат категории кэша зеркала.
// Репозиторные категории: <root>/<repoPrefix>/<category>/<org>/<repo>,
// плоские (files, lfs): <root>/<category>, на репозитории не раскладываются.
struct CacheLayout {
    std::filesystem::path root = "./repos";
    std::string repoPrefix;  // "" или, как у olah, "api"
    std::vector<std::string> repoCategories = {"models", "datasets", "spaces"};
    std::vector<std::string> flatCategories = {"files", "lfs"};

    std::filesystem::path categoryDir(const std::string& category) const;
    std::vector<std::string> allCategories() const; // Сначала репозиторные
    bool isRepoCategory(const std::string& category) const;
    bool validate() const {
        return !root.empty() && !repoCategories.empty();
    }
};

enum class SortKey { Size, LastAccess, LastModified, Name };
enum class SortOrder { Ascending, Descending };

// Неизвестные значения: size / desc, как у маршрута по умолчанию
SortKey parseSortKey(const std::string& value);
SortOrder parseSortOrder(const std::string& value);

struct RepoQuery {
    std::optional<std::string> repoType; // Пусто: все репозиторные категории
    std::optional<size_t> limit;         // Обрезать после сортировки; 0 или пусто: без ограничения
    SortKey sortBy = SortKey::Size;
    SortOrder sortOrder = SortOrder::Descending;
};

struct GitInfo {
    std::string branch;     // Имя ветки или первые 8 символов хеша
    bool isGitRepo = true;
};

// RepoRecord: один закэшированный репозиторий, выводится заново при каждом скане
struct RepoRecord {
    std::string repoType;
    std::string org;
    std::string repo;
    std::string fullName;   // org/repo
    uint64_t size = 0;
    std::string sizeHuman;
    std::chrono::system_clock::time_point lastModified;
    std::chrono::system_clock::time_point lastAccess;
    std::filesystem::path path;
    // Только для repoDetails
    std::optional<uint64_t> fileCount;
    std::optional<GitInfo> gitInfo;
    std::optional<std::string> description;
    bool detailed = false;

    nlohmann::json toJson() const;
};

struct CategoryStats {
    uint64_t size = 0;
    std::string sizeHuman;
    uint64_t fileCount = 0;
    uint64_t repoCount = 0;
    nlohmann::json toJson() const;
};

struct CacheOverview {
    uint64_t totalSize = 0;
    std::string totalSizeHuman;
    uint64_t totalFiles = 0;
    std::map<std::string, CategoryStats> repoCounts; // Только существующие категории
    std::map<std::string, std::string> cacheDirs;
    std::string lastUpdated;
    nlohmann::json toJson() const;
};

// EfficiencyReport: свежесть доступа к файлам.
// recent: atime моложе 7 дней; old: старше 30 дней. Корзины не дополняют друг
// друга: файлы с доступом 7-30 дней назад не попадают ни в одну.
struct EfficiencyReport {
    uint64_t totalSize = 0;
    std::string totalSizeHuman;
    uint64_t totalFiles = 0;
    uint64_t recentAccessCount = 0;
    uint64_t oldAccessCount = 0;
    double accessEfficiency = 0.0; // recent / total * 100, 0 без файлов
    std::string lastUpdated;
    nlohmann::json toJson() const;
};

constexpr auto RECENT_ACCESS_WINDOW = std::chrono::hours(24 * 7);
constexpr auto STALE_ACCESS_WINDOW = std::chrono::hours(24 * 30);
constexpr size_t DESCRIPTION_MAX_CHARS = 200;

// CacheInventory: сканер дерева кэша без состояния: каждый вызов заново
// читает файловую систему. Ошибки доступа гасятся по каталогам, результат
// частичный, но всегда корректный.
class CacheInventory {
public:
    explicit CacheInventory(CacheLayout layout);

    CacheOverview overview() const;
    std::vector<RepoRecord> listRepos(const RepoQuery& query = RepoQuery{}) const;
    std::optional<RepoRecord> repoDetails(const std::string& repoType,
                                          const std::string& org,
                                          const std::string& repo) const;
    std::vector<RepoRecord> search(const std::string& query,
                                   const std::optional<std::string>& repoType = std::nullopt) const;
    EfficiencyReport efficiency() const;

    const CacheLayout& layout() const { return layout_; }

    static std::optional<GitInfo> readGitInfo(const std::filesystem::path& repoPath);
    static std::string readDescription(const std::filesystem::path& repoPath);

private:
    std::optional<RepoRecord> buildRecord(const std::string& repoType, const std::string& org,
                                          const std::string& repo, const std::filesystem::path& repoPath,
                                          bool detailed) const;
    std::vector<std::string> categoriesFor(const std::optional<std::string>& repoType) const;

    CacheLayout layout_;
};

} // namespace inventory
} // namespace core
} // namespace mirror
