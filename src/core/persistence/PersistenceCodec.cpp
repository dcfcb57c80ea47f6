#include "objcache/core/persistence/PersistenceCodec.hpp"
#include "objcache/core/compression/Codec.hpp"
#include "objcache/core/logging/Logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace objcache {
namespace core {
namespace persistence {

namespace {

// Уникальный суффикс временного файла для одновременных save в один path
std::atomic<uint64_t> tmpCounter{0};

const uint8_t MAGIC[PersistenceCodec::MAGIC_SIZE] = {'O', 'C', 'S', 'N', 'A', 'P', 0, 0};
// Минимальный размер записи: klen + vlen + frequency
constexpr size_t MIN_RECORD_SIZE = 4 + 4 + 8;

void putU32(Bytes& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
}

void putU64(Bytes& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
}

// Чтение с проверкой границ
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    size_t remaining() const { return size_ - pos_; }
    bool u32(uint32_t& value) {
        if (remaining() < 4) return false;
        value = 0;
        for (int i = 0; i < 4; ++i) value |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
        pos_ += 4;
        return true;
    }
    bool u64(uint64_t& value) {
        if (remaining() < 8) return false;
        value = 0;
        for (int i = 0; i < 8; ++i) value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        pos_ += 8;
        return true;
    }
    bool bytes(size_t count, const uint8_t*& out) {
        if (remaining() < count) return false;
        out = data_ + pos_;
        pos_ += count;
        return true;
    }
private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

void sha256(const uint8_t* data, size_t size, uint8_t* digest) {
    SHA256(data, size, digest);
}

SnapshotResult fail(SnapshotStatus status, const std::string& path, std::string message) {
    SnapshotResult result;
    result.status = status;
    result.path = path;
    result.message = std::move(message);
    return result;
}

} // namespace

const char* statusName(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::Ok: return "ok";
        case SnapshotStatus::Disabled: return "disabled";
        case SnapshotStatus::NotFound: return "not_found";
        case SnapshotStatus::IoError: return "io_error";
        case SnapshotStatus::Corrupt: return "corrupt";
        case SnapshotStatus::VersionMismatch: return "version_mismatch";
    }
    return "unknown";
}

PersistenceCodec::PersistenceCodec(bool compress, uint32_t maxCompressedRegion)
    : compress_(compress), maxCompressedRegion_(maxCompressedRegion) {}

Bytes PersistenceCodec::encode(const std::vector<SnapshotRecord>& records) const {
    Bytes region;
    for (const auto& record : records) {
        putU32(region, static_cast<uint32_t>(record.key.size()));
        region.insert(region.end(), record.key.begin(), record.key.end());
        putU32(region, static_cast<uint32_t>(record.value.size()));
        region.insert(region.end(), record.value.begin(), record.value.end());
        putU64(region, record.frequency);
    }

    bool compressed = false;
    if (compress_) {
        compression::ZlibCodec zlib(6, maxCompressedRegion_);
        if (auto packed = zlib.compress(region)) {
            region = std::move(*packed);
            compressed = true;
        } else {
            logging::getLogger()->warn("PersistenceCodec: region of {} bytes not compressed (limit {}), writing uncompressed",
                                       region.size(), maxCompressedRegion_);
        }
    }

    Bytes image;
    image.reserve(HEADER_SIZE + region.size() + CHECKSUM_SIZE);
    image.insert(image.end(), MAGIC, MAGIC + MAGIC_SIZE);
    putU32(image, FORMAT_VERSION);
    image.push_back(compressed ? 1 : 0);
    putU64(image, records.size());
    image.insert(image.end(), region.begin(), region.end());
    uint8_t digest[CHECKSUM_SIZE];
    sha256(region.data(), region.size(), digest);
    image.insert(image.end(), digest, digest + CHECKSUM_SIZE);
    return image;
}

SnapshotResult PersistenceCodec::decode(const Bytes& image, std::vector<SnapshotRecord>& records,
                                        SnapshotHeader* header) const {
    if (image.size() < HEADER_SIZE + CHECKSUM_SIZE) {
        return fail(SnapshotStatus::Corrupt, "", "file too short");
    }
    if (std::memcmp(image.data(), MAGIC, MAGIC_SIZE) != 0) {
        return fail(SnapshotStatus::Corrupt, "", "bad magic");
    }
    Reader headerReader(image.data() + MAGIC_SIZE, HEADER_SIZE - MAGIC_SIZE);
    SnapshotHeader parsed;
    uint32_t version = 0;
    uint64_t count = 0;
    const uint8_t* flag = nullptr;
    if (!headerReader.u32(version) || !headerReader.bytes(1, flag) || !headerReader.u64(count)) {
        return fail(SnapshotStatus::Corrupt, "", "truncated header");
    }
    parsed.version = version;
    parsed.compressed = *flag == 1;
    parsed.entryCount = count;
    if (header) *header = parsed;
    if (version != FORMAT_VERSION) {
        return fail(SnapshotStatus::VersionMismatch, "", "unsupported format version " + std::to_string(version));
    }
    if (*flag > 1) {
        return fail(SnapshotStatus::Corrupt, "", "bad compression flag");
    }

    // Контрольная сумма проверяется до разбора любой записи
    const uint8_t* regionBegin = image.data() + HEADER_SIZE;
    const size_t regionSize = image.size() - HEADER_SIZE - CHECKSUM_SIZE;
    uint8_t digest[CHECKSUM_SIZE];
    sha256(regionBegin, regionSize, digest);
    if (std::memcmp(digest, regionBegin + regionSize, CHECKSUM_SIZE) != 0) {
        return fail(SnapshotStatus::Corrupt, "", "checksum mismatch");
    }

    Bytes inflated;
    const uint8_t* data = regionBegin;
    size_t size = regionSize;
    if (parsed.compressed) {
        compression::ZlibCodec zlib(6, maxCompressedRegion_);
        auto unpacked = zlib.decompress(Bytes(regionBegin, regionBegin + regionSize));
        if (!unpacked) {
            return fail(SnapshotStatus::Corrupt, "", "cannot decompress record region");
        }
        inflated = std::move(*unpacked);
        data = inflated.data();
        size = inflated.size();
    }

    if (count > size / MIN_RECORD_SIZE) {
        return fail(SnapshotStatus::Corrupt, "", "entry count inconsistent with file size");
    }
    std::vector<SnapshotRecord> parsedRecords;
    parsedRecords.reserve(static_cast<size_t>(count));
    Reader reader(data, size);
    for (uint64_t i = 0; i < count; ++i) {
        uint32_t keyLen = 0;
        uint32_t valueLen = 0;
        const uint8_t* keyBytes = nullptr;
        const uint8_t* valueBytes = nullptr;
        SnapshotRecord record;
        if (!reader.u32(keyLen) || !reader.bytes(keyLen, keyBytes)
            || !reader.u32(valueLen) || !reader.bytes(valueLen, valueBytes)
            || !reader.u64(record.frequency)) {
            return fail(SnapshotStatus::Corrupt, "", "record " + std::to_string(i) + " exceeds file size");
        }
        record.key.assign(reinterpret_cast<const char*>(keyBytes), keyLen);
        record.value.assign(valueBytes, valueBytes + valueLen);
        record.readSinceWrite = true;
        parsedRecords.push_back(std::move(record));
    }
    if (reader.remaining() != 0) {
        return fail(SnapshotStatus::Corrupt, "", "trailing bytes after last record");
    }

    records = std::move(parsedRecords);
    SnapshotResult result;
    result.entries = records.size();
    return result;
}

SnapshotResult PersistenceCodec::save(const cache::SegmentedMap& bucket, const std::string& path,
                                      const RecordFilter& filter) const {
    auto start = std::chrono::steady_clock::now();
    // Копия под мьютексом бакета; кодирование и I/O без него
    std::vector<SnapshotRecord> records = bucket.snapshot();
    const size_t total = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&filter](const SnapshotRecord& record) {
                                     return !record.readSinceWrite || (filter && !filter(record));
                                 }),
                  records.end());
    Bytes image = encode(records);

    const std::string tmpPath = path + ".tmp." + std::to_string(tmpCounter.fetch_add(1));
    try {
        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                return fail(SnapshotStatus::IoError, path, "cannot open " + tmpPath);
            }
            file.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
            file.flush();
            if (!file) {
                file.close();
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                return fail(SnapshotStatus::IoError, path, "write failed for " + tmpPath);
            }
        }
        std::filesystem::rename(tmpPath, path);
    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        logging::getLogger()->error("PersistenceCodec: cannot save {}: {}", path, e.what());
        return fail(SnapshotStatus::IoError, path, e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logging::getLogger()->info("PersistenceCodec: saved {} of {} entries from '{}' to {} ({} bytes, {} ms)",
                               records.size(), total, bucket.name(), path, image.size(), duration);
    SnapshotResult result;
    result.path = path;
    result.entries = records.size();
    return result;
}

SnapshotResult PersistenceCodec::readFile(const std::string& path, Bytes& image) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail(SnapshotStatus::NotFound, path, "no such file");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fail(SnapshotStatus::IoError, path, "cannot open " + path);
    }
    image.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return fail(SnapshotStatus::IoError, path, "read failed for " + path);
    }
    SnapshotResult result;
    result.path = path;
    return result;
}

SnapshotResult PersistenceCodec::load(cache::SegmentedMap& bucket, const std::string& path,
                                      uint64_t warmFrequencyThreshold) const {
    auto start = std::chrono::steady_clock::now();
    Bytes image;
    SnapshotResult result = readFile(path, image);
    if (!result.ok()) {
        return result;
    }
    std::vector<SnapshotRecord> records;
    result = decode(image, records);
    result.path = path;
    if (!result.ok()) {
        logging::getLogger()->warn("PersistenceCodec: rejected snapshot {} ({}): {}",
                                   path, statusName(result.status), result.message);
        return result;
    }
    // Разбор закончен целиком, только теперь трогаем живой бакет
    result.entries = bucket.restore(records, warmFrequencyThreshold);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logging::getLogger()->info("PersistenceCodec: loaded {} of {} entries into '{}' from {} ({} ms)",
                               result.entries, records.size(), bucket.name(), path, duration);
    return result;
}

SnapshotResult PersistenceCodec::inspect(const std::string& path, SnapshotHeader& header) const {
    Bytes image;
    SnapshotResult result = readFile(path, image);
    if (!result.ok()) {
        return result;
    }
    std::vector<SnapshotRecord> records;
    result = decode(image, records, &header);
    result.path = path;
    return result;
}

} // namespace persistence
} // namespace core
} // namespace objcache
