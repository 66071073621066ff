#include "core/metrics/SystemProbe.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <sys/statvfs.h>

namespace mirror {
namespace core {
namespace metrics {

namespace {

// Секторы в /proc/diskstats всегда по 512 байт, независимо от устройства
constexpr uint64_t DISKSTATS_SECTOR_SIZE = 512;
constexpr auto CPU_PRIME_INTERVAL = std::chrono::seconds(1);

std::ifstream openProcFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    return file;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool allDigits(const std::string& value, size_t from) {
    if (from >= value.size()) return false;
    for (size_t i = from; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

// Запасное правило без sysfs: sda -> sda1, nvme0n1 -> nvme0n1p1, mmcblk0 -> mmcblk0p1.
// dm-N и mdN разделов в таком виде не имеют.
bool looksLikePartitionOf(const std::string& device, const std::string& disk) {
    if (startsWith(device, "dm-") || startsWith(device, "md")) return false;
    if (device.size() <= disk.size() || !startsWith(device, disk)) return false;
    if (std::isdigit(static_cast<unsigned char>(disk.back()))) {
        return device[disk.size()] == 'p' && allDigits(device, disk.size() + 1);
    }
    return allDigits(device, disk.size());
}

} // namespace

LinuxSystemProbe::LinuxSystemProbe(std::string diskMountPoint, std::string procRoot, std::string sysRoot)
    : diskMountPoint_(std::move(diskMountPoint)),
      procRoot_(std::move(procRoot)),
      sysRoot_(std::move(sysRoot)) {}

bool LinuxSystemProbe::isPartition(const std::string& device, const std::vector<std::string>& disks) const {
    const auto sysDevice = std::filesystem::path(sysRoot_) / "class" / "block" / device;
    std::error_code ec;
    if (std::filesystem::exists(sysDevice, ec)) {
        return std::filesystem::exists(sysDevice / "partition", ec);
    }
    for (const auto& disk : disks) {
        if (looksLikePartitionOf(device, disk)) return true;
    }
    return false;
}

HostReading LinuxSystemProbe::read() {
    HostReading reading;
    reading.cpuPercent = readCpuPercent();
    reading.memoryPercent = readMemoryPercent();
    reading.diskUsagePercent = readDiskUsagePercent();
    auto [diskRead, diskWrite] = readDiskIo();
    reading.diskReadBytes = diskRead;
    reading.diskWriteBytes = diskWrite;
    auto [netSent, netRecv] = readNetworkIo();
    reading.networkBytesSent = netSent;
    reading.networkBytesReceived = netRecv;
    return reading;
}

std::pair<uint64_t, uint64_t> LinuxSystemProbe::readCpuTimes() const {
    auto file = openProcFile(procRoot_ + "/stat");
    std::string line;
    while (std::getline(file, line)) {
        if (!startsWith(line, "cpu ")) continue;
        std::istringstream ss(line);
        std::string label;
        uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
        ss >> label >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
        if (ss.fail() && !ss.eof()) {
            throw std::runtime_error("Malformed cpu line in " + procRoot_ + "/stat");
        }
        uint64_t idleTime = idle + iowait;
        uint64_t totalTime = user + nice + system + idle + iowait + irq + softirq + steal;
        return {totalTime, idleTime};
    }
    throw std::runtime_error("No aggregate cpu line in " + procRoot_ + "/stat");
}

double LinuxSystemProbe::readCpuPercent() {
    if (!hasCpuBaseline_) {
        // Первый замер: базы нет, меряем на коротком интервале
        auto [total, idle] = readCpuTimes();
        lastCpuTotal_ = total;
        lastCpuIdle_ = idle;
        hasCpuBaseline_ = true;
        std::this_thread::sleep_for(CPU_PRIME_INTERVAL);
    }
    auto [total, idle] = readCpuTimes();
    double usage = 0.0;
    if (total > lastCpuTotal_) {
        uint64_t totalDiff = total - lastCpuTotal_;
        uint64_t idleDiff = idle >= lastCpuIdle_ ? idle - lastCpuIdle_ : 0;
        if (idleDiff > totalDiff) idleDiff = totalDiff;
        usage = static_cast<double>(totalDiff - idleDiff) * 100.0 / static_cast<double>(totalDiff);
    }
    lastCpuTotal_ = total;
    lastCpuIdle_ = idle;
    return usage;
}

double LinuxSystemProbe::readMemoryPercent() const {
    auto file = openProcFile(procRoot_ + "/meminfo");
    std::unordered_map<std::string, uint64_t> memInfo;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream ss(line);
        std::string key;
        uint64_t value = 0;
        ss >> key >> value;
        if (!key.empty() && key.back() == ':') {
            memInfo[key.substr(0, key.size() - 1)] = value;
        }
    }
    uint64_t total = memInfo["MemTotal"];
    if (total == 0) {
        throw std::runtime_error("MemTotal missing in " + procRoot_ + "/meminfo");
    }
    uint64_t available = 0;
    if (memInfo.count("MemAvailable")) {
        available = memInfo["MemAvailable"];
    } else {
        // Старые ядра без MemAvailable
        available = memInfo["MemFree"] + memInfo["Buffers"] + memInfo["Cached"];
    }
    if (available > total) available = total;
    return static_cast<double>(total - available) * 100.0 / static_cast<double>(total);
}

double LinuxSystemProbe::readDiskUsagePercent() const {
    struct statvfs buf;
    if (statvfs(diskMountPoint_.c_str(), &buf) != 0) {
        throw std::runtime_error("statvfs failed for " + diskMountPoint_);
    }
    uint64_t total = static_cast<uint64_t>(buf.f_blocks) * buf.f_frsize;
    uint64_t freeBytes = static_cast<uint64_t>(buf.f_bfree) * buf.f_frsize;
    if (total == 0) return 0.0;
    return static_cast<double>(total - freeBytes) * 100.0 / static_cast<double>(total);
}

std::pair<uint64_t, uint64_t> LinuxSystemProbe::readDiskIo() const {
    auto file = openProcFile(procRoot_ + "/diskstats");
    uint64_t readBytes = 0;
    uint64_t writeBytes = 0;
    std::vector<std::string> disks;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream ss(line);
        unsigned major = 0, minor = 0;
        std::string name;
        uint64_t readsCompleted = 0, readsMerged = 0, sectorsRead = 0, msReading = 0;
        uint64_t writesCompleted = 0, writesMerged = 0, sectorsWritten = 0;
        ss >> major >> minor >> name >> readsCompleted >> readsMerged >> sectorsRead >> msReading
           >> writesCompleted >> writesMerged >> sectorsWritten;
        if (ss.fail() || name.empty()) continue;
        if (startsWith(name, "loop") || startsWith(name, "ram")) continue;
        if (isPartition(name, disks)) continue;
        disks.push_back(name);
        readBytes += sectorsRead * DISKSTATS_SECTOR_SIZE;
        writeBytes += sectorsWritten * DISKSTATS_SECTOR_SIZE;
    }
    return {readBytes, writeBytes};
}

std::pair<uint64_t, uint64_t> LinuxSystemProbe::readNetworkIo() const {
    auto file = openProcFile(procRoot_ + "/net/dev");
    uint64_t sent = 0;
    uint64_t received = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue; // Заголовки
        std::istringstream nameStream(line.substr(0, colon));
        std::string ifName;
        nameStream >> ifName;
        if (ifName.empty() || ifName == "lo") continue;
        std::istringstream ss(line.substr(colon + 1));
        uint64_t fields[9] = {};
        for (auto& field : fields) {
            ss >> field;
        }
        if (ss.fail()) continue;
        received += fields[0];
        sent += fields[8];
    }
    return {sent, received};
}

std::unique_ptr<SystemProbe> createSystemProbe(const std::string& diskMountPoint) {
#ifdef __linux__
    return std::make_unique<LinuxSystemProbe>(diskMountPoint);
#else
    spdlog::error("SystemProbe: host sampling is only implemented for Linux");
    throw std::runtime_error("SystemProbe: unsupported platform");
#endif
}

} // namespace metrics
} // namespace core
} // namespace mirror
