#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include "core/inventory/CacheInventory.hpp"
#include "core/inventory/DiskUtils.hpp"

#include <spdlog/spdlog.h>

using namespace mirror::core::inventory;
namespace fs = std::filesystem;

namespace {

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// Подменяет atime файла, mtime не трогает
void setAccessAge(const fs::path& path, std::chrono::hours age) {
    const auto when = std::chrono::system_clock::now() - age;
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(secs);
    times[0].tv_nsec = 0;
    times[1].tv_sec = 0;
    times[1].tv_nsec = UTIME_OMIT;
    int rc = ::utimensat(AT_FDCWD, path.c_str(), times, 0);
    assert(rc == 0);
    (void)rc;
}

// models/test-org/test-model (1000 байт), datasets/test-org/test-dataset (500 байт),
// models/other/big-model (3000 байт), files/ с одним файлом
fs::path buildCacheTree(const std::string& name) {
    const fs::path root = fs::temp_directory_path() / name;
    fs::remove_all(root);
    writeFile(root / "models" / "test-org" / "test-model" / "weights.bin", std::string(900, 'w'));
    writeFile(root / "models" / "test-org" / "test-model" / "README.md",
              std::string(" A small test model for the mirror.\n") + std::string(64, '-'));
    writeFile(root / "models" / "test-org" / "test-model" / ".git" / "HEAD", "ref: refs/heads/main\n");
    writeFile(root / "models" / "other" / "big-model" / "shard-1.bin", std::string(2000, 'a'));
    writeFile(root / "models" / "other" / "big-model" / "shard-2.bin", std::string(1000, 'b'));
    writeFile(root / "models" / "other" / "big-model" / ".git" / "HEAD",
              "3f786850e387550fdab836ed7e6dc881de23001b\n");
    writeFile(root / "datasets" / "test-org" / "test-dataset" / "data.csv", std::string(500, 'd'));
    writeFile(root / "files" / "loose.bin", std::string(10, 'f'));
    return root;
}

CacheLayout layoutFor(const fs::path& root) {
    CacheLayout layout;
    layout.root = root;
    return layout;
}

} // namespace

void smokeTestCacheInventory() {
    std::cout << "Testing CacheInventory construction and layout...\n";

    CacheLayout layout;
    assert(layout.root == fs::path("./repos"));
    assert(layout.categoryDir("models") == fs::path("./repos/models"));
    layout.repoPrefix = "api";
    assert(layout.categoryDir("models") == fs::path("./repos/api/models"));
    assert(layout.categoryDir("files") == fs::path("./repos/files"));
    assert(layout.allCategories().size() == 5);
    assert(!layout.isRepoCategory("lfs"));

    CacheLayout broken;
    broken.root.clear();
    bool thrown = false;
    try {
        CacheInventory inventory(broken);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    assert(parseSortKey("last_access") == SortKey::LastAccess);
    assert(parseSortKey("NAME") == SortKey::Name);
    assert(parseSortKey("bogus") == SortKey::Size);
    assert(parseSortOrder("asc") == SortOrder::Ascending);
    assert(parseSortOrder("whatever") == SortOrder::Descending);

    std::cout << "[OK] CacheInventory smoke test\n";
}

void testOverview() {
    std::cout << "Testing CacheInventory overview...\n";

    const auto root = buildCacheTree("mirrorscope_inventory_overview");
    CacheInventory inventory(layoutFor(root));
    auto overview = inventory.overview();

    assert(overview.repoCounts.size() == 3); // models, datasets, files
    assert(overview.repoCounts.at("models").repoCount == 2);
    assert(overview.repoCounts.at("datasets").repoCount == 1);
    assert(overview.repoCounts.at("datasets").size == 500);
    assert(overview.repoCounts.at("datasets").fileCount == 1);
    assert(overview.repoCounts.count("spaces") == 0);
    assert(overview.repoCounts.at("files").size == 10);
    assert(overview.cacheDirs.size() == 5);

    const uint64_t modelsSize = overview.repoCounts.at("models").size;
    assert(overview.totalSize == modelsSize + 500 + 10);
    assert(overview.totalFiles == overview.repoCounts.at("models").fileCount + 2);
    assert(!overview.lastUpdated.empty());

    auto json = overview.toJson();
    assert(json["repo_counts"]["datasets"]["repo_count"] == 1);
    assert(json["total_size_human"].is_string());

    assert(folderSize(root / "datasets") == 500);
    assert(countFiles(root / "models" / "other") == 3);
    assert(countRepos(root / "models") == 2);

    fs::remove_all(root);
    std::cout << "[OK] CacheInventory overview test\n";
}

void testListRepos() {
    std::cout << "Testing CacheInventory listRepos...\n";

    const auto root = buildCacheTree("mirrorscope_inventory_list");
    CacheInventory inventory(layoutFor(root));

    auto all = inventory.listRepos();
    assert(all.size() == 3);
    assert(all[0].fullName == "other/big-model"); // По размеру, по убыванию
    assert(all[2].fullName == "test-org/test-dataset");
    assert(all[0].size >= all[1].size && all[1].size >= all[2].size);
    assert(!all[0].detailed);
    assert(!all[0].fileCount);

    RepoQuery modelsOnly;
    modelsOnly.repoType = "models";
    auto models = inventory.listRepos(modelsOnly);
    assert(models.size() == 2);
    for (const auto& repo : models) {
        assert(repo.repoType == "models");
    }

    RepoQuery byName;
    byName.sortBy = SortKey::Name;
    byName.sortOrder = SortOrder::Ascending;
    byName.limit = 2;
    auto named = inventory.listRepos(byName);
    assert(named.size() == 2);
    assert(named[0].fullName == "other/big-model");
    assert(named[1].fullName == "test-org/test-dataset");

    RepoQuery none;
    none.limit = 0; // 0 не ограничивает выборку
    assert(inventory.listRepos(none).size() == inventory.listRepos(RepoQuery{}).size());
    assert(!inventory.listRepos(none).empty());

    RepoQuery unknown;
    unknown.repoType = "files";
    assert(inventory.listRepos(unknown).empty());

    fs::remove_all(root);
    std::cout << "[OK] CacheInventory listRepos test\n";
}

void testRepoDetails() {
    std::cout << "Testing CacheInventory repoDetails...\n";

    const auto root = buildCacheTree("mirrorscope_inventory_details");
    CacheInventory inventory(layoutFor(root));

    auto details = inventory.repoDetails("models", "test-org", "test-model");
    assert(details);
    assert(details->detailed);
    assert(details->fullName == "test-org/test-model");
    assert(details->fileCount && *details->fileCount == 3);
    assert(details->gitInfo);
    assert(details->gitInfo->branch == "main");
    assert(details->gitInfo->isGitRepo);
    assert(details->description);
    assert(details->description->compare(0, 34, "A small test model for the mirror.") == 0);

    auto big = inventory.repoDetails("models", "other", "big-model");
    assert(big && big->gitInfo);
    assert(big->gitInfo->branch == "3f786850");

    auto dataset = inventory.repoDetails("datasets", "test-org", "test-dataset");
    assert(dataset);
    assert(!dataset->gitInfo);
    assert(dataset->description && dataset->description->empty());
    auto json = dataset->toJson();
    assert(json["git_info"].is_null());
    assert(json["file_count"] == 1);

    assert(!inventory.repoDetails("models", "test-org", "missing"));
    assert(!inventory.repoDetails("files", "test-org", "test-model"));
    assert(!inventory.repoDetails("models", "..", "test-org"));

    fs::remove_all(root);
    std::cout << "[OK] CacheInventory repoDetails test\n";
}

void testReadDescription() {
    std::cout << "Testing CacheInventory readDescription...\n";

    const fs::path repo = fs::temp_directory_path() / "mirrorscope_readme";
    fs::remove_all(repo);

    writeFile(repo / "README.md", std::string(300, 'x'));
    assert(CacheInventory::readDescription(repo).size() == DESCRIPTION_MAX_CHARS);

    // Кириллица: 200 кодовых точек, а не 200 байт
    std::string cyrillic;
    for (int i = 0; i < 250; ++i) cyrillic += "ж";
    writeFile(repo / "README.md", cyrillic);
    assert(CacheInventory::readDescription(repo).size() == DESCRIPTION_MAX_CHARS * 2);

    // Битый README пропускается, берётся следующий вариант
    writeFile(repo / "README.md", std::string("\xff\xfe broken"));
    writeFile(repo / "readme.txt", "fallback text");
    assert(CacheInventory::readDescription(repo) == "fallback text");

    fs::remove(repo / "readme.txt");
    assert(CacheInventory::readDescription(repo).empty());

    fs::remove_all(repo);
    std::cout << "[OK] CacheInventory readDescription test\n";
}

void testSearch() {
    std::cout << "Testing CacheInventory search...\n";

    const auto root = buildCacheTree("mirrorscope_inventory_search");
    CacheInventory inventory(layoutFor(root));

    assert(inventory.search("test").size() == 2);
    assert(inventory.search("TEST").size() == 2);
    assert(inventory.search("nonexistent").empty());
    assert(inventory.search("test", std::string("datasets")).size() == 1);

    // Совпадение только по описанию
    auto byDescription = inventory.search("small test model");
    assert(byDescription.size() == 1);
    assert(byDescription[0].fullName == "test-org/test-model");
    assert(byDescription[0].description);

    fs::remove_all(root);
    std::cout << "[OK] CacheInventory search test\n";
}

void testEfficiency() {
    std::cout << "Testing CacheInventory efficiency...\n";

    const fs::path root = fs::temp_directory_path() / "mirrorscope_inventory_efficiency";
    fs::remove_all(root);
    const auto dir = root / "models" / "org" / "repo";
    writeFile(dir / "fresh.bin", std::string(100, 'a'));
    writeFile(dir / "middle.bin", std::string(100, 'b'));
    writeFile(dir / "stale.bin", std::string(100, 'c'));
    writeFile(root / "lfs" / "old-object", std::string(100, 'd'));
    setAccessAge(dir / "fresh.bin", std::chrono::hours(24));
    setAccessAge(dir / "middle.bin", std::chrono::hours(24 * 15));
    setAccessAge(dir / "stale.bin", std::chrono::hours(24 * 60));
    setAccessAge(root / "lfs" / "old-object", std::chrono::hours(24 * 90));

    CacheInventory inventory(layoutFor(root));
    auto report = inventory.efficiency();
    assert(report.totalFiles == 4);
    assert(report.totalSize == 400);
    assert(report.recentAccessCount == 1);
    assert(report.oldAccessCount == 2);
    // Файл с доступом 15 дней назад не попадает ни в одну корзину
    assert(report.recentAccessCount + report.oldAccessCount < report.totalFiles);
    assert(report.accessEfficiency > 24.999 && report.accessEfficiency < 25.001);

    fs::remove_all(root);

    CacheInventory empty(layoutFor(fs::temp_directory_path() / "mirrorscope_inventory_missing"));
    auto nothing = empty.efficiency();
    assert(nothing.totalFiles == 0);
    assert(nothing.accessEfficiency == 0.0);

    std::cout << "[OK] CacheInventory efficiency test\n";
}

void testMissingRoot() {
    std::cout << "Testing CacheInventory with a missing root...\n";

    const fs::path root = fs::temp_directory_path() / "mirrorscope_inventory_missing";
    fs::remove_all(root);
    CacheInventory inventory(layoutFor(root));

    auto overview = inventory.overview();
    assert(overview.totalSize == 0);
    assert(overview.totalFiles == 0);
    assert(overview.repoCounts.empty());
    assert(overview.cacheDirs.size() == 5);
    assert(inventory.listRepos().empty());
    assert(inventory.search("anything").empty());

    std::cout << "[OK] CacheInventory missing root test\n";
}

int main() {
    try {
        smokeTestCacheInventory();
        testOverview();
        testListRepos();
        testRepoDetails();
        testReadDescription();
        testSearch();
        testEfficiency();
        testMissingRoot();

        spdlog::shutdown();
        std::cout << "All CacheInventory tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
