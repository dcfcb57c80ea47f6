#include "objcache/core/cache/CacheClient.hpp"
#include "objcache/core/compression/Codec.hpp"
#include "objcache/core/logging/Logger.hpp"
#include "objcache/core/persistence/SnapshotStore.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace objcache {
namespace core {
namespace cache {

using compression::Codec;
using compression::CodecTag;
using persistence::SnapshotResult;
using persistence::SnapshotStatus;

// Реализация PIMPL
struct CacheClient::Impl {
    const CacheConfig config;
    SegmentedMap bucket0;
    std::shared_ptr<Codec> codec;
    std::array<std::shared_ptr<Codec>, 2> decoders;
    persistence::PersistenceCodec snapshotCodec;
    std::unique_ptr<persistence::SnapshotStore> store;
    std::string generation;
    std::string keyPrefix;
    mutable std::shared_mutex generationMutex;
    std::mutex saveMutex; // Один save за раз: выбор слота и запись файла
    std::atomic<uint64_t> oversized{0}; // Отказы по objectMaxBytes

    Impl(const CacheConfig& cfg, std::string gen)
        : config(cfg)
        , bucket0(cfg, "bucket0")
        , codec(compression::makeCodec(cfg.compressionCodec))
        , decoders{compression::codecForTag(static_cast<uint8_t>(CodecTag::None)),
                   compression::codecForTag(static_cast<uint8_t>(CodecTag::Zlib))}
        , snapshotCodec(cfg.persistCompress)
        , generation(std::move(gen)) {
        keyPrefix = encodeKey(generation, "");
        if (config.persistenceEnabled()) {
            store = std::make_unique<persistence::SnapshotStore>(
                config.persistDir, config.persistPrefix, bucket0.name(), config.persistFileCount);
        }
    }

    std::string bucketKey(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(generationMutex);
        return keyPrefix + key;
    }

    // Первый байт: тег кодека; сжатая форма хранится, только если она меньше исходной
    Bytes encodeValue(const Bytes& value) const {
        if (codec->tag() != CodecTag::None && value.size() >= config.compressionMinBytes) {
            if (auto packed = codec->compress(value)) {
                if (packed->size() < value.size()) {
                    Bytes stored;
                    stored.reserve(packed->size() + 1);
                    stored.push_back(static_cast<uint8_t>(codec->tag()));
                    stored.insert(stored.end(), packed->begin(), packed->end());
                    return stored;
                }
            }
        }
        Bytes stored;
        stored.reserve(value.size() + 1);
        stored.push_back(static_cast<uint8_t>(CodecTag::None));
        stored.insert(stored.end(), value.begin(), value.end());
        return stored;
    }

    std::optional<Bytes> decodeValue(const Bytes& stored) const {
        if (stored.empty() || stored[0] >= decoders.size()) {
            return std::nullopt;
        }
        if (stored[0] == static_cast<uint8_t>(CodecTag::None)) {
            return Bytes(stored.begin() + 1, stored.end());
        }
        return decoders[stored[0]]->decompress(Bytes(stored.begin() + 1, stored.end()));
    }

    // Конкурентно записанное новое значение не трогаем
    void dropDamaged(const std::string& bucketKey, const Bytes& stored) {
        logging::getLogger()->error("CacheClient: cannot decode stored value for key={}, dropping it", bucketKey);
        bucket0.removeIfUnchanged(bucketKey, stored);
    }
};

CacheClient::CacheClient(const CacheConfig& config, std::string generation) {
    if (!config.validate()) {
        throw std::invalid_argument("CacheClient: invalid cache configuration");
    }
    pImpl = std::make_unique<Impl>(config, std::move(generation));
    logging::getLogger()->info("CacheClient created: capacity={}, objectMax={}, codec={}, persistDir='{}', files={}",
                               config.capacityBytes, config.objectMaxBytes, config.compressionCodec,
                               config.persistDir, config.persistFileCount);
}

CacheClient::~CacheClient() = default;

std::string CacheClient::encodeKey(const std::string& generation, const std::string& key) {
    return std::to_string(generation.size()) + ":" + generation + key;
}

std::optional<Bytes> CacheClient::get(const std::string& key) {
    const std::string bucketKey = pImpl->bucketKey(key);
    auto stored = pImpl->bucket0.get(bucketKey);
    if (!stored) {
        return std::nullopt;
    }
    // Разжатие вне мьютекса бакета
    auto value = pImpl->decodeValue(*stored);
    if (!value) {
        pImpl->dropDamaged(bucketKey, *stored);
    }
    return value;
}

bool CacheClient::set(const std::string& key, const Bytes& value) {
    Bytes stored = pImpl->encodeValue(value);
    const std::string bucketKey = pImpl->bucketKey(key);
    if (stored.size() - 1 > pImpl->config.objectMaxBytes) {
        // Не ошибка: такой ключ просто всегда промахивается; старое значение убираем
        pImpl->bucket0.remove(bucketKey);
        pImpl->oversized.fetch_add(1, std::memory_order_relaxed);
        logging::getLogger()->debug("CacheClient: value for key={} too large ({} > {}), not cached",
                                    key, stored.size() - 1, pImpl->config.objectMaxBytes);
        return false;
    }
    return pImpl->bucket0.set(bucketKey, std::move(stored));
}

std::unordered_map<std::string, Bytes> CacheClient::getMulti(const std::vector<std::string>& keys) {
    std::vector<std::string> bucketKeys;
    bucketKeys.reserve(keys.size());
    std::unordered_map<std::string, std::string> callerKeys;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->generationMutex);
        for (const auto& key : keys) {
            bucketKeys.push_back(pImpl->keyPrefix + key);
            callerKeys.emplace(bucketKeys.back(), key);
        }
    }
    auto found = pImpl->bucket0.getMulti(bucketKeys);
    std::unordered_map<std::string, Bytes> result;
    result.reserve(found.size());
    for (auto& item : found) {
        auto value = pImpl->decodeValue(item.second);
        if (!value) {
            pImpl->dropDamaged(item.first, item.second);
            continue;
        }
        result.emplace(callerKeys[item.first], std::move(*value));
    }
    return result;
}

size_t CacheClient::setMulti(const std::unordered_map<std::string, Bytes>& values) {
    size_t stored = 0;
    for (const auto& item : values) {
        if (set(item.first, item.second)) {
            ++stored;
        }
    }
    return stored;
}

void CacheClient::invalidate(const std::string& key) {
    pImpl->bucket0.remove(pImpl->bucketKey(key));
}

void CacheClient::flushAll() {
    pImpl->bucket0.clear();
    logging::getLogger()->info("CacheClient: all entries flushed");
}

void CacheClient::setGeneration(const std::string& generation) {
    std::unique_lock<std::shared_mutex> lock(pImpl->generationMutex);
    if (generation == pImpl->generation) return;
    logging::getLogger()->info("CacheClient: generation '{}' -> '{}'", pImpl->generation, generation);
    pImpl->generation = generation;
    pImpl->keyPrefix = encodeKey(generation, "");
}

std::string CacheClient::generation() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->generationMutex);
    return pImpl->generation;
}

void CacheClient::resetStats() {
    pImpl->bucket0.resetStats();
    pImpl->oversized.store(0, std::memory_order_relaxed);
}

CacheStats CacheClient::stats() const {
    CacheStats stats = pImpl->bucket0.stats();
    stats.rejections += pImpl->oversized.load(std::memory_order_relaxed);
    return stats;
}

SnapshotResult CacheClient::save() {
    if (!pImpl->store) {
        return SnapshotResult{SnapshotStatus::Disabled, "", 0, "persistence disabled"};
    }
    std::lock_guard<std::mutex> saveLock(pImpl->saveMutex);
    if (!pImpl->store->ensureDirectory()) {
        return SnapshotResult{SnapshotStatus::IoError, pImpl->store->directory(), 0, "cannot create snapshot directory"};
    }
    const std::string path = pImpl->store->nextSavePath();
    std::string prefix;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->generationMutex);
        prefix = pImpl->keyPrefix;
    }
    // Записи прошлых поколений недостижимы, в снапшот они не идут
    auto result = pImpl->snapshotCodec.save(pImpl->bucket0, path, [&prefix](const SnapshotRecord& record) {
        return record.key.compare(0, prefix.size(), prefix) == 0;
    });
    if (!result.ok()) {
        logging::getLogger()->error("CacheClient: snapshot save failed ({}): {}",
                                    persistence::statusName(result.status), result.message);
    }
    return result;
}

SnapshotResult CacheClient::restore() {
    if (!pImpl->store) {
        return SnapshotResult{SnapshotStatus::Disabled, "", 0, "persistence disabled"};
    }
    auto start = std::chrono::steady_clock::now();
    SnapshotResult last{SnapshotStatus::NotFound, pImpl->store->directory(), 0, "no snapshot files"};
    for (const auto& path : pImpl->store->existingNewestFirst()) {
        last = pImpl->snapshotCodec.load(pImpl->bucket0, path, pImpl->config.warmFrequencyThreshold);
        if (last.ok()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            logging::getLogger()->info("CacheClient: restored {} entries from {} in {} ms",
                                       last.entries, path, duration);
            return last;
        }
        logging::getLogger()->warn("CacheClient: snapshot {} not usable ({}), trying older one",
                                   path, persistence::statusName(last.status));
    }
    return last;
}

const CacheConfig& CacheClient::config() const {
    return pImpl->config;
}

SegmentedMap& CacheClient::bucket() {
    return pImpl->bucket0;
}

} // namespace cache
} // namespace core
} // namespace objcache
