#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mirror {
namespace core {
namespace metrics {

// HostReading: сырые показания хоста; I/O счётчики накопительные с момента загрузки
struct HostReading {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
    double diskUsagePercent = 0.0;
    uint64_t diskReadBytes = 0;
    uint64_t diskWriteBytes = 0;
    uint64_t networkBytesSent = 0;
    uint64_t networkBytesReceived = 0;
};

// SystemProbe: источник показаний хоста. При ошибке чтения бросает std::runtime_error.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;
    virtual HostReading read() = 0;
};

// LinuxSystemProbe: /proc/stat, /proc/meminfo, /proc/diskstats, /proc/net/dev, statvfs.
// Диск: только целые устройства, разделы определяются по <sysRoot>/class/block/<dev>/partition.
// Сеть: все интерфейсы, кроме loopback "lo".
class LinuxSystemProbe : public SystemProbe {
public:
    explicit LinuxSystemProbe(std::string diskMountPoint = "/", std::string procRoot = "/proc",
                              std::string sysRoot = "/sys");
    ~LinuxSystemProbe() override = default;
    HostReading read() override;

private:
    double readCpuPercent();
    double readMemoryPercent() const;
    double readDiskUsagePercent() const;
    std::pair<uint64_t, uint64_t> readDiskIo() const;    // {read, write}
    std::pair<uint64_t, uint64_t> readNetworkIo() const; // {sent, received}
    std::pair<uint64_t, uint64_t> readCpuTimes() const;  // {total, idle}
    bool isPartition(const std::string& device, const std::vector<std::string>& disks) const;

    std::string diskMountPoint_;
    std::string procRoot_;
    std::string sysRoot_;
    // Для расчёта загрузки CPU между вызовами
    bool hasCpuBaseline_ = false;
    uint64_t lastCpuTotal_ = 0;
    uint64_t lastCpuIdle_ = 0;
};

std::unique_ptr<SystemProbe> createSystemProbe(const std::string& diskMountPoint = "/");

} // namespace metrics
} // namespace core
} // namespace mirror
