#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace objcache {
namespace core {
namespace cache {

using Bytes = std::vector<uint8_t>;

// Сегмент, в котором живёт запись
enum class Segment : uint8_t {
    Probation,
    Protected
};

const char* segmentName(Segment segment);

// Индекс записи в арене SegmentedMap
using SlotIndex = uint32_t;
constexpr SlotIndex NO_SLOT = UINT32_MAX;

// Entry — запись кэша; prev/next — интрузивный список сегмента.
// Поколение закодировано в самом ключе (см. CacheClient::encodeKey)
struct Entry {
    std::string key;
    Bytes value;
    size_t rawSize = 0;          // Учитывается в бюджете (длина value)
    uint64_t frequency = 0;      // +1 на каждое попадание
    Segment segment = Segment::Probation;
    bool readSinceWrite = false; // Было ли чтение после последнего set
    SlotIndex prev = NO_SLOT;
    SlotIndex next = NO_SLOT;
};

// SnapshotRecord — копия записи вне блокировки (для снапшотов и диагностики)
struct SnapshotRecord {
    std::string key;
    Bytes value;
    uint64_t frequency = 0;
    Segment segment = Segment::Probation;
    bool readSinceWrite = false;
};

} // namespace cache
} // namespace core
} // namespace objcache
