#include <iostream>
#include <memory>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

#include "core/config/ObservabilityConfig.hpp"
#include "core/inventory/CacheInventory.hpp"
#include "core/logging/Logging.hpp"
#include "core/metrics/MetricsStore.hpp"
#include "core/metrics/SystemProbe.hpp"
#include "core/metrics/SystemSampler.hpp"
#include "core/util/Format.hpp"

using namespace mirror::core;

// Global state for graceful shutdown
std::atomic<bool> g_running{true};
std::unique_ptr<metrics::MetricsStore> g_store;
std::unique_ptr<metrics::SystemSampler> g_sampler;
std::unique_ptr<inventory::CacheInventory> g_inventory;

struct CommandLine {
    std::string configPath;
    std::string cacheRoot;
    bool once = false;
    bool help = false;
};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--once] [--cache-root <dir>]\n"
              << "  --config <file>     JSON configuration\n"
              << "  --once              sample once, print a report and exit\n"
              << "  --cache-root <dir>  override cache_root from the configuration\n";
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--once") {
            cmd.once = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--config" || arg == "--cache-root") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            (arg == "--config" ? cmd.configPath : cmd.cacheRoot) = argv[++i];
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cmd;
}

config::ObservabilityConfig loadConfiguration(const CommandLine& cmd) {
    config::ObservabilityConfig cfg;
    if (!cmd.configPath.empty()) {
        cfg = config::ObservabilityConfig::loadFromFile(cmd.configPath);
    }
    if (!cmd.cacheRoot.empty()) {
        cfg.cache.root = cmd.cacheRoot;
    }
    if (!cfg.validate()) {
        throw std::invalid_argument("Invalid configuration");
    }
    return cfg;
}

void initializeComponents(const config::ObservabilityConfig& cfg) {
    spdlog::info("Initializing components...");
    try {
        g_store = std::make_unique<metrics::MetricsStore>(cfg.metrics);
        spdlog::info("[init] MetricsStore: request history {}, system history {}",
                     cfg.metrics.maxRequestHistory, cfg.metrics.maxSystemHistory);

        g_sampler = std::make_unique<metrics::SystemSampler>(
            *g_store, metrics::createSystemProbe(cfg.sampler.diskMountPoint), cfg.sampler);
        spdlog::info("[init] SystemSampler: interval {}s, mount point '{}'",
                     cfg.sampler.interval.count(), cfg.sampler.diskMountPoint);

        g_inventory = std::make_unique<inventory::CacheInventory>(cfg.cache);
        spdlog::info("[init] CacheInventory: root '{}'", cfg.cache.root.string());
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize components: {}", e.what());
        throw;
    }
}

void logSummary() {
    const auto overview = g_inventory->overview();
    const auto system = g_store->systemStats();
    const auto cache = g_store->cacheStats();
    spdlog::info("[summary] cache {} in {} files, {} categories",
                 overview.totalSizeHuman, overview.totalFiles, overview.repoCounts.size());
    for (const auto& [category, stats] : overview.repoCounts) {
        spdlog::info("[summary]   {}: {} repos, {}", category, stats.repoCount, stats.sizeHuman);
    }
    spdlog::info("[summary] cpu {}%, memory {}%, disk {}%, net +{}/-{}",
                 util::formatFixed(system.cpuPercent, 1),
                 util::formatFixed(system.memoryPercent, 1),
                 util::formatFixed(system.diskUsagePercent, 1),
                 util::humanReadableBytes(system.networkBytesReceived),
                 util::humanReadableBytes(system.networkBytesSent));
    spdlog::info("[summary] cache requests {}, hit rate {}%",
                 cache.totalRequests, util::formatFixed(cache.hitRatePercent, 2));
}

int runOnce() {
    g_sampler->sampleOnce();
    nlohmann::json report;
    report["overview"] = g_inventory->overview().toJson();
    report["efficiency"] = g_inventory->efficiency().toJson();
    report["metrics"] = g_store->toJson();
    std::cout << report.dump(2) << std::endl;
    std::cout << g_store->exportText() << std::endl;
    return 0;
}

void runServiceLoop(std::chrono::seconds reportInterval) {
    spdlog::info("Starting service loop, summary every {}s", reportInterval.count());
    g_sampler->start();
    auto lastReport = std::chrono::steady_clock::now();
    while (g_running) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now - lastReport >= reportInterval) {
                logSummary();
                lastReport = now;
            }
        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Service loop stopped");
}

void shutdown() {
    spdlog::info("Initiating graceful shutdown...");
    if (g_sampler) {
        g_sampler->stop();
        spdlog::info("Sampler stopped after {} ticks ({} failed)",
                     g_sampler->completedTicks(), g_sampler->failedTicks());
    }
    g_sampler.reset();
    g_inventory.reset();
    g_store.reset();
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    config::ObservabilityConfig cfg;
    try {
        cmd = parseCommandLine(argc, argv);
        if (cmd.help) {
            printUsage(argv[0]);
            return 0;
        }
        cfg = loadConfiguration(cmd);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        logging::initializeLogging(cfg.logging);
        spdlog::info("=== mirrorscope starting ===");

        initializeComponents(cfg);

        int rc = 0;
        if (cmd.once) {
            rc = runOnce();
        } else {
            runServiceLoop(cfg.reportInterval);
        }

        shutdown();
        spdlog::info("=== mirrorscope stopped ===");
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        shutdown();
        return 1;
    }
}
