#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

#include "objcache/core/cache/CacheClient.hpp"
#include "objcache/core/cache/CacheConfig.hpp"
#include "objcache/core/logging/Logger.hpp"
#include "objcache/core/persistence/PersistenceCodec.hpp"

using namespace objcache::core;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " inspect <snapshot-file>   check a snapshot and print its header\n"
              << "  " << argv0 << " stats <config.json>       restore a cache from its snapshots and print stats\n";
}

int inspectSnapshot(const std::string& path) {
    persistence::PersistenceCodec codec;
    persistence::SnapshotHeader header;
    auto result = codec.inspect(path, header);
    nlohmann::json out = {
        {"path", path},
        {"status", persistence::statusName(result.status)},
        {"message", result.message},
        {"version", header.version},
        {"compressed", header.compressed},
        {"entryCount", header.entryCount},
        {"validEntries", result.entries}
    };
    std::cout << out.dump(2) << std::endl;
    return result.ok() ? 0 : 2;
}

int printStats(const std::string& configPath) {
    auto config = cache::CacheConfig::loadFromFile(configPath);
    cache::CacheClient client(config);
    auto result = client.restore();
    nlohmann::json out = {
        {"config", config.toJson()},
        {"restore", {
            {"status", persistence::statusName(result.status)},
            {"path", result.path},
            {"entries", result.entries},
            {"message", result.message}
        }},
        {"stats", client.stats().toJson()}
    };
    std::cout << out.dump(2) << std::endl;
    return result.ok() || result.status == persistence::SnapshotStatus::Disabled ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 3) {
        printUsage(argv[0]);
        return 1;
    }
    logging::LogConfig logConfig;
    logConfig.console = false;
    logConfig.logPath = "logs/objcache-tool.log";
    logging::initialize(logConfig);

    const std::string command = argv[1];
    try {
        if (command == "inspect") {
            return inspectSnapshot(argv[2]);
        }
        if (command == "stats") {
            return printStats(argv[2]);
        }
    } catch (const std::exception& e) {
        logging::getLogger()->error("objcache-tool: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    printUsage(argv[0]);
    return 1;
}
