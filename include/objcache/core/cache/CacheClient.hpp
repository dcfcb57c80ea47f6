#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "objcache/core/cache/CacheConfig.hpp"
#include "objcache/core/cache/Entry.hpp"
#include "objcache/core/cache/SegmentedMap.hpp"
#include "objcache/core/cache/StatsCollector.hpp"
#include "objcache/core/persistence/PersistenceCodec.hpp"

namespace objcache {
namespace core {
namespace cache {

// CacheClient — фасад кэша над bucket0: пространство ключей по поколению,
// сжатие значений, пакетные операции, статистика и снапшоты.
// Кэширование всегда необязательно: слишком большое значение просто не сохраняется.
class CacheClient {
public:
    explicit CacheClient(const CacheConfig& config, std::string generation = std::string()); // Конструктор
    ~CacheClient(); // Деструктор
    CacheClient(const CacheClient&) = delete;
    CacheClient& operator=(const CacheClient&) = delete;

    std::optional<Bytes> get(const std::string& key); // Получить
    bool set(const std::string& key, const Bytes& value); // Сохранить (false — не закэшировано)
    std::unordered_map<std::string, Bytes> getMulti(const std::vector<std::string>& keys); // Пакетное чтение
    size_t setMulti(const std::unordered_map<std::string, Bytes>& values); // Пакетная запись
    void invalidate(const std::string& key); // Инвалидировать ключ текущего поколения
    void flushAll(); // Очистить бакет

    // Смена поколения: старые записи становятся недостижимыми и уходят по LRU
    void setGeneration(const std::string& generation);
    std::string generation() const;

    void resetStats(); // Сбросить счётчики (содержимое не трогается)
    CacheStats stats() const; // Метрики

    persistence::SnapshotResult save(); // Снапшот в persistDir (ротация файлов)
    persistence::SnapshotResult restore(); // Загрузка самого нового валидного снапшота

    const CacheConfig& config() const;
    SegmentedMap& bucket();

    // Ключ бакета: "<длина поколения>:<поколение><ключ>"
    static std::string encodeKey(const std::string& generation, const std::string& key);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace objcache
