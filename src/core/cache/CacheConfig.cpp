#include "objcache/core/cache/CacheConfig.hpp"
#include "objcache/core/logging/Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace objcache {
namespace core {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    return {
        {"capacity_bytes", capacityBytes},
        {"object_max_bytes", objectMaxBytes},
        {"compression_codec", compressionCodec},
        {"compression_min_bytes", compressionMinBytes},
        {"protected_ratio", protectedRatio},
        {"promotion_threshold", promotionThreshold},
        {"warm_frequency_threshold", warmFrequencyThreshold},
        {"persist_dir", persistDir},
        {"persist_prefix", persistPrefix},
        {"persist_file_count", persistFileCount},
        {"persist_compress", persistCompress}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    config.capacityBytes = j.value("capacity_bytes", config.capacityBytes);
    config.objectMaxBytes = j.value("object_max_bytes", config.objectMaxBytes);
    config.compressionCodec = j.value("compression_codec", config.compressionCodec);
    config.compressionMinBytes = j.value("compression_min_bytes", config.compressionMinBytes);
    config.protectedRatio = j.value("protected_ratio", config.protectedRatio);
    config.promotionThreshold = j.value("promotion_threshold", config.promotionThreshold);
    config.warmFrequencyThreshold = j.value("warm_frequency_threshold", config.warmFrequencyThreshold);
    // persist_dir: null == "none"
    if (j.contains("persist_dir") && !j["persist_dir"].is_null()) {
        config.persistDir = j["persist_dir"].get<std::string>();
    }
    config.persistPrefix = j.value("persist_prefix", config.persistPrefix);
    config.persistFileCount = j.value("persist_file_count", config.persistFileCount);
    config.persistCompress = j.value("persist_compress", config.persistCompress);
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        logging::getLogger()->error("CacheConfig: parse error in {}: {}", path, e.what());
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    auto config = fromJson(j);
    logging::getLogger()->info("CacheConfig: loaded {} (capacity={}, codec={}, persistDir='{}')",
                               path, config.capacityBytes, config.compressionCodec, config.persistDir);
    return config;
}

} // namespace cache
} // namespace core
} // namespace objcache
