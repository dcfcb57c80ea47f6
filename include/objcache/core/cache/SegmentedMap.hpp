#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <shared_mutex>
#include <cstdint>
#include "objcache/core/cache/CacheConfig.hpp"
#include "objcache/core/cache/Entry.hpp"
#include "objcache/core/cache/StatsCollector.hpp"

namespace objcache {
namespace core {
namespace cache {

// SegmentedMap — бакет: сегментированный LRU (Probation + Protected) с бюджетом в байтах.
// Записи лежат в арене и адресуются индексом слота; каждый сегмент организован как интрузивный
// двусвязный список по индексам (head = MRU, tail = LRU).
// Новые записи попадают в Probation; попадание в Probation переводит запись в Protected;
// переполнение Protected демотирует его хвост в Probation; вытеснение только с хвоста Probation.
// Все мутации и счётчики под одним мьютексом бакета.
class SegmentedMap {
public:
    explicit SegmentedMap(const CacheConfig& config, std::string name = "bucket0");
    SegmentedMap(const SegmentedMap&) = delete;
    SegmentedMap& operator=(const SegmentedMap&) = delete;

    std::optional<Bytes> get(const std::string& key); // Получить (с продвижением)
    std::unordered_map<std::string, Bytes> getMulti(const std::vector<std::string>& keys); // Пакетное чтение
    bool set(const std::string& key, Bytes value); // false — значение больше capacity
    bool remove(const std::string& key); // Удалить
    // Удалить, только если значение не менялось с момента чтения
    bool removeIfUnchanged(const std::string& key, const Bytes& expected);
    void clear(); // Очистить

    // Диагностика: без статистики и без изменения порядка
    bool contains(const std::string& key) const;
    std::optional<Segment> segmentOf(const std::string& key) const;
    std::optional<uint64_t> frequencyOf(const std::string& key) const;
    std::vector<std::string> keys(Segment segment) const; // От MRU к LRU

    size_t size() const; // Кол-во записей
    size_t bytes() const; // Резидентные байты
    size_t protectedBytes() const;
    size_t capacity() const { return capacity_; }
    size_t protectedLimit() const { return protectedLimit_; }
    const std::string& name() const { return name_; }

    // Копия всех записей: Protected, затем Probation, каждый от MRU к LRU
    std::vector<SnapshotRecord> snapshot() const;
    // Массовая вставка при загрузке снапшота; возвращает число вставленных записей.
    // Существующие ключи не перезаписываются, не влезающие в бюджет записи пропускаются.
    size_t restore(const std::vector<SnapshotRecord>& records, uint64_t warmFrequencyThreshold);

    CacheStats stats() const;
    void resetStats();

private:
    struct SegmentList {
        SlotIndex head = NO_SLOT;
        SlotIndex tail = NO_SLOT;
        size_t count = 0;
        size_t bytes = 0;
    };

    SegmentList& listFor(Segment segment);
    const SegmentList& listFor(Segment segment) const;
    void linkFront(SlotIndex slot, Segment segment);
    void linkBack(SlotIndex slot, Segment segment);
    void unlink(SlotIndex slot);
    void moveToFront(SlotIndex slot);
    SlotIndex allocate();
    void drop(SlotIndex slot);
    size_t totalBytes() const { return probation_.bytes + protected_.bytes; }

    std::optional<SlotIndex> findSlot(const std::string& key) const;
    void recordHit(SlotIndex slot);
    void rebalanceProtected();
    void evictForSpace(SlotIndex keep);
    void appendRecords(const SegmentList& list, std::vector<SnapshotRecord>& out) const;

    const std::string name_;
    const size_t capacity_;
    const size_t protectedLimit_;
    const uint32_t promotionThreshold_;

    std::vector<Entry> slots_;
    std::vector<SlotIndex> freeSlots_;
    std::unordered_map<std::string, SlotIndex> index_;
    SegmentList probation_;
    SegmentList protected_;
    StatsCollector stats_;
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace objcache
