#include "core/inventory/DiskUtils.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace mirror {
namespace core {
namespace inventory {

namespace {

std::chrono::system_clock::time_point fromTimespec(const struct timespec& ts) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

} // namespace

std::optional<FileTimes> readFileTimes(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    FileTimes times;
#if defined(__APPLE__)
    times.lastAccess = fromTimespec(st.st_atimespec);
    times.lastModified = fromTimespec(st.st_mtimespec);
#else
    times.lastAccess = fromTimespec(st.st_atim);
    times.lastModified = fromTimespec(st.st_mtim);
#endif
    return times;
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void forEachFile(const fs::path& root,
                 const std::function<void(const fs::path&, uint64_t)>& visit) {
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            spdlog::debug("DiskUtils: пропущен каталог {}: {}", dir.string(), ec.message());
            continue;
        }
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;
            std::error_code statEc;
            auto linkStatus = entry.symlink_status(statEc);
            if (statEc) continue;
            if (fs::is_directory(linkStatus)) {
                pending.push_back(entry.path());
                continue;
            }
            // Симлинк считается файлом, если указывает на обычный файл
            if (!entry.is_regular_file(statEc) || statEc) continue;
            auto size = entry.file_size(statEc);
            if (statEc) size = 0;
            visit(entry.path(), static_cast<uint64_t>(size));
        }
        if (ec) {
            spdlog::debug("DiskUtils: обход {} прерван: {}", dir.string(), ec.message());
        }
    }
}

uint64_t folderSize(const fs::path& root) {
    uint64_t total = 0;
    forEachFile(root, [&total](const fs::path&, uint64_t size) { total += size; });
    return total;
}

uint64_t countFiles(const fs::path& root) {
    uint64_t count = 0;
    forEachFile(root, [&count](const fs::path&, uint64_t) { ++count; });
    return count;
}

uint64_t countRepos(const fs::path& categoryDir) {
    uint64_t count = 0;
    std::error_code ec;
    fs::directory_iterator orgIt(categoryDir, ec);
    if (ec) return 0;
    for (fs::directory_iterator end; orgIt != end; orgIt.increment(ec)) {
        if (ec) break;
        if (!orgIt->is_directory(ec) || ec) {
            ec.clear();
            continue;
        }
        std::error_code repoEc;
        fs::directory_iterator repoIt(orgIt->path(), repoEc);
        if (repoEc) continue;
        for (; repoIt != end; repoIt.increment(repoEc)) {
            if (repoEc) break;
            std::error_code dirEc;
            if (repoIt->is_directory(dirEc) && !dirEc) {
                ++count;
            }
        }
    }
    return count;
}

} // namespace inventory
} // namespace core
} // namespace mirror
