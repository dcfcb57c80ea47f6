#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "objcache/core/cache/Entry.hpp"
#include "objcache/core/cache/SegmentedMap.hpp"
#include "objcache/core/compression/Codec.hpp"

namespace objcache {
namespace core {
namespace persistence {

using cache::Bytes;
using cache::SnapshotRecord;

// Результат операции со снапшотом; исключения наружу не выходят
enum class SnapshotStatus {
    Ok,
    Disabled,        // Персистентность выключена конфигурацией
    NotFound,        // Файла нет
    IoError,         // Ошибка открытия/записи/переименования
    Corrupt,         // Магия, контрольная сумма или структура записей
    VersionMismatch  // Неизвестная версия формата
};

const char* statusName(SnapshotStatus status);

struct SnapshotResult {
    SnapshotStatus status = SnapshotStatus::Ok;
    std::string path;
    size_t entries = 0;     // Записано / загружено записей
    std::string message;
    bool ok() const { return status == SnapshotStatus::Ok; }
};

struct SnapshotHeader {
    uint32_t version = 0;
    bool compressed = false;
    uint64_t entryCount = 0;
};

// PersistenceCodec — бинарный снапшот бакета.
//   magic(8) | u32 version | u8 compressed | u64 count
//   область записей: count x [u32 klen][key][u32 vlen][value][u64 frequency] (zlib при compressed=1)
//   SHA-256 области записей в том виде, в каком она лежит в файле (32 байта)
// Все числа little-endian. Загрузка по принципу всё или ничего: любая ошибка проверки отвергает весь файл.
class PersistenceCodec {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;
    static constexpr size_t MAGIC_SIZE = 8;
    static constexpr size_t HEADER_SIZE = MAGIC_SIZE + 4 + 1 + 8;
    static constexpr size_t CHECKSUM_SIZE = 32;

    using RecordFilter = std::function<bool(const SnapshotRecord&)>;

    // maxCompressedRegion: область записей больше этого размера пишется несжатой,
    // тот же предел действует при разжатии
    explicit PersistenceCodec(bool compress = false,
                              uint32_t maxCompressedRegion = compression::ZlibCodec::DEFAULT_MAX_DECOMPRESSED);

    Bytes encode(const std::vector<SnapshotRecord>& records) const; // Образ файла
    // Проверка и разбор образа; records заполняется только при Ok
    SnapshotResult decode(const Bytes& image, std::vector<SnapshotRecord>& records,
                          SnapshotHeader* header = nullptr) const;

    // Сохранить записи, прочитанные после последней записи (и прошедшие filter).
    // Пишет во временный файл и переименовывает поверх path только после успешной записи.
    SnapshotResult save(const cache::SegmentedMap& bucket, const std::string& path,
                        const RecordFilter& filter = RecordFilter()) const;
    // Загрузить снапшот в бакет; при любой ошибке бакет не изменяется
    SnapshotResult load(cache::SegmentedMap& bucket, const std::string& path,
                        uint64_t warmFrequencyThreshold) const;
    // Прочитать и проверить файл без загрузки
    SnapshotResult inspect(const std::string& path, SnapshotHeader& header) const;

private:
    SnapshotResult readFile(const std::string& path, Bytes& image) const;
    bool compress_;
    uint32_t maxCompressedRegion_;
};

} // namespace persistence
} // namespace core
} // namespace objcache
