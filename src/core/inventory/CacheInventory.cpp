#include "core/inventory/CacheInventory.hpp"
#include "core/inventory/DiskUtils.hpp"
#include "core/util/Format.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace mirror {
namespace core {
namespace inventory {

namespace {

const char* const README_VARIANTS[] = {"README.md", "readme.md", "README.txt", "readme.txt"};
const std::string HEAD_REF_PREFIX = "ref: refs/heads/";
constexpr size_t SHORT_HASH_LENGTH = 8;

// Проверяет UTF-8 и возвращает первые maxChars кодовых точек; nullopt, если текст битый
std::optional<std::string> utf8Prefix(const std::string& bytes, size_t maxChars) {
    size_t i = 0;
    size_t chars = 0;
    size_t cut = std::string::npos;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        if (lead < 0x80) len = 1;
        else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) len = 4;
        else return std::nullopt;
        if (i + len > bytes.size()) return std::nullopt;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) return std::nullopt;
        }
        if (len == 3) {
            const auto second = static_cast<unsigned char>(bytes[i + 1]);
            if (lead == 0xE0 && second < 0xA0) return std::nullopt;  // Overlong
            if (lead == 0xED && second >= 0xA0) return std::nullopt; // Суррогаты
        } else if (len == 4) {
            const auto second = static_cast<unsigned char>(bytes[i + 1]);
            if (lead == 0xF0 && second < 0x90) return std::nullopt;
            if (lead == 0xF4 && second >= 0x90) return std::nullopt;
        }
        if (chars == maxChars && cut == std::string::npos) {
            cut = i;
        }
        ++chars;
        i += len;
    }
    return cut == std::string::npos ? bytes : bytes.substr(0, cut);
}

std::optional<std::string> readWholeFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) return std::nullopt;
    return content;
}

bool isSafeComponent(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

template <typename Key>
void sortRecords(std::vector<RepoRecord>& repos, SortOrder order, Key key) {
    if (order == SortOrder::Descending) {
        std::stable_sort(repos.begin(), repos.end(),
                         [&key](const RepoRecord& a, const RepoRecord& b) { return key(b) < key(a); });
    } else {
        std::stable_sort(repos.begin(), repos.end(),
                         [&key](const RepoRecord& a, const RepoRecord& b) { return key(a) < key(b); });
    }
}

} // namespace

fs::path CacheLayout::categoryDir(const std::string& category) const {
    if (isRepoCategory(category) && !repoPrefix.empty()) {
        return root / repoPrefix / category;
    }
    return root / category;
}

std::vector<std::string> CacheLayout::allCategories() const {
    std::vector<std::string> result = repoCategories;
    result.insert(result.end(), flatCategories.begin(), flatCategories.end());
    return result;
}

bool CacheLayout::isRepoCategory(const std::string& category) const {
    return std::find(repoCategories.begin(), repoCategories.end(), category) != repoCategories.end();
}

SortKey parseSortKey(const std::string& value) {
    const auto key = util::toLower(value);
    if (key == "last_access") return SortKey::LastAccess;
    if (key == "last_modified") return SortKey::LastModified;
    if (key == "name") return SortKey::Name;
    return SortKey::Size;
}

SortOrder parseSortOrder(const std::string& value) {
    return util::toLower(value) == "asc" ? SortOrder::Ascending : SortOrder::Descending;
}

nlohmann::json RepoRecord::toJson() const {
    nlohmann::json j = {
        {"repo_type", repoType},
        {"org", org},
        {"repo", repo},
        {"full_name", fullName},
        {"size", size},
        {"size_human", sizeHuman},
        {"last_modified", util::isoTimestamp(lastModified)},
        {"last_access", util::isoTimestamp(lastAccess)},
        {"path", path.string()}
    };
    if (detailed) {
        j["file_count"] = fileCount.value_or(0);
        if (gitInfo) {
            j["git_info"] = {{"branch", gitInfo->branch}, {"is_git_repo", gitInfo->isGitRepo}};
        } else {
            j["git_info"] = nullptr;
        }
        j["description"] = description.value_or("");
    }
    return j;
}

nlohmann::json CategoryStats::toJson() const {
    return {
        {"size", size},
        {"size_human", sizeHuman},
        {"file_count", fileCount},
        {"repo_count", repoCount}
    };
}

nlohmann::json CacheOverview::toJson() const {
    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [category, stats] : repoCounts) {
        counts[category] = stats.toJson();
    }
    return {
        {"total_size", totalSize},
        {"total_size_human", totalSizeHuman},
        {"total_files", totalFiles},
        {"repo_counts", counts},
        {"cache_dirs", cacheDirs},
        {"last_updated", lastUpdated}
    };
}

nlohmann::json EfficiencyReport::toJson() const {
    return {
        {"total_size", totalSize},
        {"total_size_human", totalSizeHuman},
        {"total_files", totalFiles},
        {"recent_access_count", recentAccessCount},
        {"old_access_count", oldAccessCount},
        {"access_efficiency", accessEfficiency},
        {"last_updated", lastUpdated}
    };
}

CacheInventory::CacheInventory(CacheLayout layout) : layout_(std::move(layout)) {
    if (!layout_.validate()) {
        throw std::invalid_argument("CacheInventory: invalid CacheLayout");
    }
    spdlog::debug("CacheInventory: root={}, repoPrefix='{}'", layout_.root.string(), layout_.repoPrefix);
}

CacheOverview CacheInventory::overview() const {
    CacheOverview result;
    for (const auto& category : layout_.allCategories()) {
        const auto dir = layout_.categoryDir(category);
        result.cacheDirs[category] = dir.string();
        if (!isDirectory(dir)) {
            continue;
        }
        CategoryStats stats;
        forEachFile(dir, [&stats](const fs::path&, uint64_t size) {
            stats.size += size;
            ++stats.fileCount;
        });
        stats.sizeHuman = util::humanReadableBytes(stats.size);
        stats.repoCount = countRepos(dir);
        result.totalSize += stats.size;
        result.totalFiles += stats.fileCount;
        result.repoCounts[category] = stats;
    }
    result.totalSizeHuman = util::humanReadableBytes(result.totalSize);
    result.lastUpdated = util::isoTimestamp(std::chrono::system_clock::now());
    return result;
}

std::vector<std::string> CacheInventory::categoriesFor(const std::optional<std::string>& repoType) const {
    if (!repoType) {
        return layout_.repoCategories;
    }
    if (!layout_.isRepoCategory(*repoType)) {
        spdlog::debug("CacheInventory: unknown repo type '{}'", *repoType);
        return {};
    }
    return {*repoType};
}

std::vector<RepoRecord> CacheInventory::listRepos(const RepoQuery& query) const {
    std::vector<RepoRecord> repos;
    for (const auto& category : categoriesFor(query.repoType)) {
        const auto dir = layout_.categoryDir(category);
        std::error_code ec;
        fs::directory_iterator orgIt(dir, ec);
        if (ec) continue;
        for (fs::directory_iterator end; orgIt != end; orgIt.increment(ec)) {
            if (ec) break;
            std::error_code orgEc;
            if (!orgIt->is_directory(orgEc) || orgEc) continue;
            const auto orgPath = orgIt->path();
            fs::directory_iterator repoIt(orgPath, orgEc);
            if (orgEc) {
                spdlog::debug("CacheInventory: пропущен {}: {}", orgPath.string(), orgEc.message());
                continue;
            }
            for (; repoIt != end; repoIt.increment(orgEc)) {
                if (orgEc) break;
                std::error_code repoEc;
                if (!repoIt->is_directory(repoEc) || repoEc) continue;
                auto record = buildRecord(category, orgPath.filename().string(),
                                          repoIt->path().filename().string(), repoIt->path(), false);
                if (record) {
                    repos.push_back(std::move(*record));
                }
            }
        }
    }

    switch (query.sortBy) {
    case SortKey::Size:
        sortRecords(repos, query.sortOrder, [](const RepoRecord& r) { return r.size; });
        break;
    case SortKey::LastAccess:
        sortRecords(repos, query.sortOrder, [](const RepoRecord& r) { return r.lastAccess; });
        break;
    case SortKey::LastModified:
        sortRecords(repos, query.sortOrder, [](const RepoRecord& r) { return r.lastModified; });
        break;
    case SortKey::Name:
        sortRecords(repos, query.sortOrder, [](const RepoRecord& r) { return r.fullName; });
        break;
    }

    if (query.limit && *query.limit > 0 && repos.size() > *query.limit) {
        repos.resize(*query.limit);
    }
    return repos;
}

std::optional<RepoRecord> CacheInventory::repoDetails(const std::string& repoType,
                                                      const std::string& org,
                                                      const std::string& repo) const {
    if (!layout_.isRepoCategory(repoType) || !isSafeComponent(org) || !isSafeComponent(repo)) {
        return std::nullopt;
    }
    const auto repoPath = layout_.categoryDir(repoType) / org / repo;
    if (!isDirectory(repoPath)) {
        return std::nullopt;
    }
    return buildRecord(repoType, org, repo, repoPath, true);
}

std::vector<RepoRecord> CacheInventory::search(const std::string& query,
                                               const std::optional<std::string>& repoType) const {
    RepoQuery listQuery;
    listQuery.repoType = repoType;
    const auto needle = util::toLower(query);

    std::vector<RepoRecord> results;
    for (auto& repo : listRepos(listQuery)) {
        if (util::toLower(repo.fullName).find(needle) != std::string::npos) {
            results.push_back(std::move(repo));
            continue;
        }
        const auto description = readDescription(repo.path);
        if (!description.empty() && util::toLower(description).find(needle) != std::string::npos) {
            repo.description = description;
            results.push_back(std::move(repo));
        }
    }
    return results;
}

EfficiencyReport CacheInventory::efficiency() const {
    EfficiencyReport report;
    const auto now = std::chrono::system_clock::now();
    for (const auto& category : layout_.allCategories()) {
        const auto dir = layout_.categoryDir(category);
        if (!isDirectory(dir)) {
            continue;
        }
        forEachFile(dir, [&](const fs::path& file, uint64_t size) {
            report.totalSize += size;
            ++report.totalFiles;
            auto times = readFileTimes(file);
            if (!times) return;
            const auto age = now - times->lastAccess;
            if (age < RECENT_ACCESS_WINDOW) {
                ++report.recentAccessCount;
            } else if (age > STALE_ACCESS_WINDOW) {
                ++report.oldAccessCount;
            }
        });
    }
    if (report.totalFiles > 0) {
        report.accessEfficiency = static_cast<double>(report.recentAccessCount) /
                                  static_cast<double>(report.totalFiles) * 100.0;
    }
    report.totalSizeHuman = util::humanReadableBytes(report.totalSize);
    report.lastUpdated = util::isoTimestamp(now);
    return report;
}

std::optional<RepoRecord> CacheInventory::buildRecord(const std::string& repoType, const std::string& org,
                                                      const std::string& repo, const fs::path& repoPath,
                                                      bool detailed) const {
    auto times = readFileTimes(repoPath);
    if (!times) {
        spdlog::debug("CacheInventory: stat failed for {}", repoPath.string());
        return std::nullopt;
    }
    RepoRecord record;
    record.repoType = repoType;
    record.org = org;
    record.repo = repo;
    record.fullName = org + "/" + repo;
    record.lastModified = times->lastModified;
    record.lastAccess = times->lastAccess;
    record.path = repoPath;

    uint64_t files = 0;
    forEachFile(repoPath, [&](const fs::path&, uint64_t size) {
        record.size += size;
        ++files;
    });
    record.sizeHuman = util::humanReadableBytes(record.size);

    if (detailed) {
        record.detailed = true;
        record.fileCount = files;
        record.gitInfo = readGitInfo(repoPath);
        record.description = readDescription(repoPath);
    }
    return record;
}

std::optional<GitInfo> CacheInventory::readGitInfo(const fs::path& repoPath) {
    const auto headFile = repoPath / ".git" / "HEAD";
    auto content = readWholeFile(headFile);
    if (!content) {
        return std::nullopt;
    }
    const auto head = util::trim(*content);
    GitInfo info;
    if (head.compare(0, HEAD_REF_PREFIX.size(), HEAD_REF_PREFIX) == 0) {
        info.branch = head.substr(HEAD_REF_PREFIX.size());
    } else {
        info.branch = head.substr(0, SHORT_HASH_LENGTH);
    }
    return info;
}

std::string CacheInventory::readDescription(const fs::path& repoPath) {
    for (const char* name : README_VARIANTS) {
        const auto readme = repoPath / name;
        std::error_code ec;
        if (!fs::is_regular_file(readme, ec) || ec) continue;
        auto content = readWholeFile(readme);
        if (!content) continue;
        auto prefix = utf8Prefix(*content, DESCRIPTION_MAX_CHARS);
        if (!prefix) {
            spdlog::debug("CacheInventory: {} is not valid UTF-8", readme.string());
            continue;
        }
        return util::trim(*prefix);
    }
    return "";
}

} // namespace inventory
} // namespace core
} // namespace mirror
