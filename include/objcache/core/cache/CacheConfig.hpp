#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace objcache {
namespace core {
namespace cache {

// CacheConfig — неизменяемые параметры бакета, сжатия и снапшотов
struct CacheConfig {
    size_t capacityBytes = 10 * 1024 * 1024;  // Бюджет бакета (10 MB)
    size_t objectMaxBytes = 16384;            // Макс. размер хранимого значения
    std::string compressionCodec = "zlib";    // "none" | "zlib"
    size_t compressionMinBytes = 100;         // Меньше — не сжимаем
    double protectedRatio = 0.8;              // Доля Protected от capacity
    uint32_t promotionThreshold = 1;          // Попаданий для выхода из Probation
    uint64_t warmFrequencyThreshold = 1;      // frequency > порога -> сразу в Protected при загрузке
    std::string persistDir = "none";          // Каталог снапшотов ("none" — выключено)
    std::string persistPrefix = "objcache";   // Префикс имён файлов
    size_t persistFileCount = 1;              // Сколько снапшотов хранить
    bool persistCompress = false;             // Сжимать область записей

    bool persistenceEnabled() const {
        return !persistDir.empty() && persistDir != "none";
    }

    bool validate() const {
        return capacityBytes > 0 && objectMaxBytes > 0
            && (compressionCodec == "none" || compressionCodec == "zlib")
            && protectedRatio > 0.0 && protectedRatio <= 1.0
            && promotionThreshold > 0
            && persistFileCount > 0 && !persistPrefix.empty();
    }

    size_t protectedLimit() const {
        return static_cast<size_t>(static_cast<double>(capacityBytes) * protectedRatio);
    }

    nlohmann::json toJson() const; // Экспорт
    static CacheConfig fromJson(const nlohmann::json& j); // Импорт (недостающие поля — по умолчанию)
    static CacheConfig loadFromFile(const std::string& path); // Чтение JSON-файла
};

} // namespace cache
} // namespace core
} // namespace objcache
