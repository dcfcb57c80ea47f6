#include "objcache/core/cache/SegmentedMap.hpp"
#include "objcache/core/logging/Logger.hpp"
#include <cassert>
#include <mutex>
#include <stdexcept>

namespace objcache {
namespace core {
namespace cache {

const char* segmentName(Segment segment) {
    return segment == Segment::Protected ? "protected" : "probation";
}

SegmentedMap::SegmentedMap(const CacheConfig& config, std::string name)
    : name_(std::move(name))
    , capacity_(config.capacityBytes)
    , protectedLimit_(config.protectedLimit())
    , promotionThreshold_(config.promotionThreshold) {
    if (capacity_ == 0 || promotionThreshold_ == 0) {
        throw std::invalid_argument("SegmentedMap: capacity and promotion threshold must be positive");
    }
    logging::getLogger()->debug("SegmentedMap '{}': capacity={}, protectedLimit={}, promotionThreshold={}",
                                name_, capacity_, protectedLimit_, promotionThreshold_);
}

// --- интрузивные списки ---

SegmentedMap::SegmentList& SegmentedMap::listFor(Segment segment) {
    return segment == Segment::Protected ? protected_ : probation_;
}

const SegmentedMap::SegmentList& SegmentedMap::listFor(Segment segment) const {
    return segment == Segment::Protected ? protected_ : probation_;
}

void SegmentedMap::linkFront(SlotIndex slot, Segment segment) {
    Entry& entry = slots_[slot];
    SegmentList& list = listFor(segment);
    entry.segment = segment;
    entry.prev = NO_SLOT;
    entry.next = list.head;
    if (list.head != NO_SLOT) {
        slots_[list.head].prev = slot;
    } else {
        list.tail = slot;
    }
    list.head = slot;
    ++list.count;
    list.bytes += entry.rawSize;
}

void SegmentedMap::linkBack(SlotIndex slot, Segment segment) {
    Entry& entry = slots_[slot];
    SegmentList& list = listFor(segment);
    entry.segment = segment;
    entry.next = NO_SLOT;
    entry.prev = list.tail;
    if (list.tail != NO_SLOT) {
        slots_[list.tail].next = slot;
    } else {
        list.head = slot;
    }
    list.tail = slot;
    ++list.count;
    list.bytes += entry.rawSize;
}

void SegmentedMap::unlink(SlotIndex slot) {
    Entry& entry = slots_[slot];
    SegmentList& list = listFor(entry.segment);
    if (entry.prev != NO_SLOT) {
        slots_[entry.prev].next = entry.next;
    } else {
        list.head = entry.next;
    }
    if (entry.next != NO_SLOT) {
        slots_[entry.next].prev = entry.prev;
    } else {
        list.tail = entry.prev;
    }
    entry.prev = entry.next = NO_SLOT;
    assert(list.count > 0 && list.bytes >= entry.rawSize);
    --list.count;
    list.bytes -= entry.rawSize;
}

void SegmentedMap::moveToFront(SlotIndex slot) {
    Segment segment = slots_[slot].segment;
    if (listFor(segment).head == slot) return;
    unlink(slot);
    linkFront(slot, segment);
}

SlotIndex SegmentedMap::allocate() {
    if (!freeSlots_.empty()) {
        SlotIndex slot = freeSlots_.back();
        freeSlots_.pop_back();
        return slot;
    }
    if (slots_.size() >= static_cast<size_t>(NO_SLOT)) {
        throw std::length_error("SegmentedMap: slot arena exhausted");
    }
    slots_.emplace_back();
    return static_cast<SlotIndex>(slots_.size() - 1);
}

void SegmentedMap::drop(SlotIndex slot) {
    unlink(slot);
    Entry& entry = slots_[slot];
    index_.erase(entry.key);
    // Освобождаем память payload сразу, слот уходит в free list
    entry = Entry{};
    freeSlots_.push_back(slot);
}

std::optional<SlotIndex> SegmentedMap::findSlot(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

// --- политика ---

void SegmentedMap::recordHit(SlotIndex slot) {
    Entry& entry = slots_[slot];
    ++entry.frequency;
    entry.readSinceWrite = true;
    stats_.recordHit();
    if (entry.segment == Segment::Probation && entry.frequency >= promotionThreshold_) {
        unlink(slot);
        linkFront(slot, Segment::Protected);
        stats_.recordPromotion();
        rebalanceProtected();
    } else {
        moveToFront(slot);
    }
}

void SegmentedMap::rebalanceProtected() {
    while (protected_.bytes > protectedLimit_ && protected_.tail != NO_SLOT) {
        SlotIndex demoted = protected_.tail;
        unlink(demoted);
        linkFront(demoted, Segment::Probation);
        stats_.recordDemotion();
    }
}

void SegmentedMap::evictForSpace(SlotIndex keep) {
    while (totalBytes() > capacity_) {
        SlotIndex victim = probation_.tail;
        if (victim == NO_SLOT || victim == keep) {
            // В Probation нет никого, кроме записываемой записи: хвост Protected
            // сначала проходит через Probation и вытесняется уже оттуда
            SlotIndex demoted = protected_.tail;
            if (demoted == NO_SLOT || demoted == keep) break;
            unlink(demoted);
            linkBack(demoted, Segment::Probation);
            stats_.recordDemotion();
            victim = demoted;
        }
        logging::getLogger()->debug("SegmentedMap '{}': evict key={} size={} freq={}",
                                    name_, slots_[victim].key, slots_[victim].rawSize, slots_[victim].frequency);
        drop(victim);
        stats_.recordEviction();
    }
    assert(totalBytes() <= capacity_);
}

// --- операции ---

std::optional<Bytes> SegmentedMap::get(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto slot = findSlot(key);
    if (!slot) {
        stats_.recordMiss();
        return std::nullopt;
    }
    recordHit(*slot);
    return slots_[*slot].value;
}

std::unordered_map<std::string, Bytes> SegmentedMap::getMulti(const std::vector<std::string>& keys) {
    std::unordered_map<std::string, Bytes> result;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& key : keys) {
        auto slot = findSlot(key);
        if (!slot) {
            stats_.recordMiss();
            continue;
        }
        recordHit(*slot);
        result[key] = slots_[*slot].value;
    }
    return result;
}

bool SegmentedMap::set(const std::string& key, Bytes value) {
    const size_t size = value.size();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = findSlot(key);
    if (size > capacity_) {
        // Старое значение не должно пережить отклонённую перезапись
        if (existing) {
            drop(*existing);
        }
        stats_.recordRejection();
        logging::getLogger()->debug("SegmentedMap '{}': rejected key={} size={} capacity={}",
                                    name_, key, size, capacity_);
        return false;
    }
    stats_.recordSet();

    SlotIndex slot;
    if (existing) {
        slot = *existing;
        Entry& entry = slots_[slot];
        SegmentList& list = listFor(entry.segment);
        list.bytes = list.bytes - entry.rawSize + size;
        entry.value = std::move(value);
        entry.rawSize = size;
        entry.readSinceWrite = false;
        moveToFront(slot);
        if (entry.segment == Segment::Protected) {
            rebalanceProtected();
        }
    } else {
        slot = allocate();
        Entry& entry = slots_[slot];
        entry.key = key;
        entry.value = std::move(value);
        entry.rawSize = size;
        entry.frequency = 0;
        entry.readSinceWrite = false;
        index_.emplace(key, slot);
        linkFront(slot, Segment::Probation);
    }
    evictForSpace(slot);
    return true;
}

bool SegmentedMap::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto slot = findSlot(key);
    if (!slot) return false;
    drop(*slot);
    return true;
}

bool SegmentedMap::removeIfUnchanged(const std::string& key, const Bytes& expected) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto slot = findSlot(key);
    if (!slot || slots_[*slot].value != expected) return false;
    drop(*slot);
    return true;
}

void SegmentedMap::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    slots_.clear();
    freeSlots_.clear();
    index_.clear();
    probation_ = SegmentList{};
    protected_ = SegmentList{};
    logging::getLogger()->debug("SegmentedMap '{}': cleared", name_);
}

bool SegmentedMap::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.count(key) > 0;
}

std::optional<Segment> SegmentedMap::segmentOf(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto slot = findSlot(key);
    if (!slot) return std::nullopt;
    return slots_[*slot].segment;
}

std::optional<uint64_t> SegmentedMap::frequencyOf(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto slot = findSlot(key);
    if (!slot) return std::nullopt;
    return slots_[*slot].frequency;
}

std::vector<std::string> SegmentedMap::keys(Segment segment) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    const SegmentList& list = listFor(segment);
    result.reserve(list.count);
    for (SlotIndex slot = list.head; slot != NO_SLOT; slot = slots_[slot].next) {
        result.push_back(slots_[slot].key);
    }
    return result;
}

size_t SegmentedMap::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.size();
}

size_t SegmentedMap::bytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalBytes();
}

size_t SegmentedMap::protectedBytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return protected_.bytes;
}

void SegmentedMap::appendRecords(const SegmentList& list, std::vector<SnapshotRecord>& out) const {
    for (SlotIndex slot = list.head; slot != NO_SLOT; slot = slots_[slot].next) {
        const Entry& entry = slots_[slot];
        out.push_back(SnapshotRecord{entry.key, entry.value, entry.frequency, entry.segment, entry.readSinceWrite});
    }
}

std::vector<SnapshotRecord> SegmentedMap::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SnapshotRecord> records;
    records.reserve(index_.size());
    appendRecords(protected_, records);
    appendRecords(probation_, records);
    return records;
}

size_t SegmentedMap::restore(const std::vector<SnapshotRecord>& records, uint64_t warmFrequencyThreshold) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t inserted = 0;
    size_t skipped = 0;
    for (const auto& record : records) {
        const size_t size = record.value.size();
        if (index_.count(record.key) > 0 || totalBytes() + size > capacity_) {
            ++skipped;
            continue;
        }
        bool warm = record.frequency > warmFrequencyThreshold
            && protected_.bytes + size <= protectedLimit_;
        SlotIndex slot = allocate();
        Entry& entry = slots_[slot];
        entry.key = record.key;
        entry.value = record.value;
        entry.rawSize = size;
        entry.frequency = record.frequency;
        entry.readSinceWrite = record.frequency > 0;
        index_.emplace(record.key, slot);
        // Записи идут от MRU к LRU, поэтому добавляем в хвост
        linkBack(slot, warm ? Segment::Protected : Segment::Probation);
        ++inserted;
    }
    logging::getLogger()->debug("SegmentedMap '{}': restored {} records ({} skipped), protected={} probation={}",
                                name_, inserted, skipped, protected_.count, probation_.count);
    return inserted;
}

CacheStats SegmentedMap::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stats_.snapshot(index_.size(), totalBytes(), protected_.bytes, capacity_);
}

void SegmentedMap::resetStats() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    stats_.reset();
}

} // namespace cache
} // namespace core
} // namespace objcache
