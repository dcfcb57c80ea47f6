#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objcache {
namespace core {
namespace compression {

using Bytes = std::vector<uint8_t>;

// Тег кодека в первом байте хранимого значения и во флаге снапшота
enum class CodecTag : uint8_t {
    None = 0,
    Zlib = 1
};

// Codec — возможность сжатия; закрытый набор реализаций выбирается по имени из конфигурации
class Codec {
public:
    virtual ~Codec() = default;
    virtual CodecTag tag() const = 0;
    virtual std::string name() const = 0;
    // nullopt — сжать не удалось
    virtual std::optional<Bytes> compress(const Bytes& data) const = 0;
    // nullopt — повреждённые данные
    virtual std::optional<Bytes> decompress(const Bytes& data) const = 0;
};

class NoneCodec final : public Codec {
public:
    CodecTag tag() const override { return CodecTag::None; }
    std::string name() const override { return "none"; }
    std::optional<Bytes> compress(const Bytes& data) const override { return data; }
    std::optional<Bytes> decompress(const Bytes& data) const override { return data; }
};

// ZlibCodec — deflate через zlib; исходная длина хранится 4-байтовым префиксом (LE)
// maxDecompressed ограничивает размер, который decompress готов выделить
class ZlibCodec final : public Codec {
public:
    static constexpr uint32_t DEFAULT_MAX_DECOMPRESSED = 256u * 1024u * 1024u;

    explicit ZlibCodec(int level = 6, uint32_t maxDecompressed = DEFAULT_MAX_DECOMPRESSED);
    CodecTag tag() const override { return CodecTag::Zlib; }
    std::string name() const override { return "zlib"; }
    std::optional<Bytes> compress(const Bytes& data) const override;
    std::optional<Bytes> decompress(const Bytes& data) const override;
    uint32_t maxDecompressed() const { return maxDecompressed_; }
private:
    int level_;
    uint32_t maxDecompressed_;
};

// Фабрика по имени ("none" | "zlib"); неизвестное имя — std::invalid_argument
std::shared_ptr<Codec> makeCodec(const std::string& name);
// Кодек по тегу; nullptr для неизвестного тега
std::shared_ptr<Codec> codecForTag(uint8_t tag);

} // namespace compression
} // namespace core
} // namespace objcache
