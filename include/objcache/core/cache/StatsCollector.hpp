#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace objcache {
namespace core {
namespace cache {

// CacheStats — снимок счётчиков бакета
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t promotions = 0;  // Probation -> Protected
    uint64_t demotions = 0;   // Protected -> Probation
    uint64_t evictions = 0;
    uint64_t rejections = 0;  // Отказы в записи (слишком большие значения)
    size_t entries = 0;
    size_t bytes = 0;         // Резидентные байты
    size_t protectedBytes = 0;
    size_t capacity = 0;
    double ratio = 0.0;       // hits / (hits + misses)
    std::chrono::steady_clock::time_point lastUpdate;

    nlohmann::json toJson() const;
};

// StatsCollector — счётчики операций; вызывается под мьютексом бакета
class StatsCollector {
public:
    void recordHit() { ++hits_; }
    void recordMiss() { ++misses_; }
    void recordSet() { ++sets_; }
    void recordPromotion() { ++promotions_; }
    void recordDemotion() { ++demotions_; }
    void recordEviction() { ++evictions_; }
    void recordRejection() { ++rejections_; }
    void reset();
    CacheStats snapshot(size_t entries, size_t bytes, size_t protectedBytes, size_t capacity) const;

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t sets_ = 0;
    uint64_t promotions_ = 0;
    uint64_t demotions_ = 0;
    uint64_t evictions_ = 0;
    uint64_t rejections_ = 0;
};

} // namespace cache
} // namespace core
} // namespace objcache
