#include "objcache/core/cache/StatsCollector.hpp"

namespace objcache {
namespace core {
namespace cache {

nlohmann::json CacheStats::toJson() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"sets", sets},
        {"ratio", ratio},
        {"promotions", promotions},
        {"demotions", demotions},
        {"evictions", evictions},
        {"rejections", rejections},
        {"entries", entries},
        {"bytes", bytes},
        {"protectedBytes", protectedBytes},
        {"capacity", capacity},
        {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
    };
}

void StatsCollector::reset() {
    hits_ = misses_ = sets_ = 0;
    promotions_ = demotions_ = evictions_ = rejections_ = 0;
}

CacheStats StatsCollector::snapshot(size_t entries, size_t bytes, size_t protectedBytes, size_t capacity) const {
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.sets = sets_;
    stats.promotions = promotions_;
    stats.demotions = demotions_;
    stats.evictions = evictions_;
    stats.rejections = rejections_;
    stats.entries = entries;
    stats.bytes = bytes;
    stats.protectedBytes = protectedBytes;
    stats.capacity = capacity;
    auto total = hits_ + misses_;
    stats.ratio = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    stats.lastUpdate = std::chrono::steady_clock::now();
    return stats;
}

} // namespace cache
} // namespace core
} // namespace objcache
