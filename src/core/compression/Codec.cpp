#include "objcache/core/compression/Codec.hpp"
#include "objcache/core/logging/Logger.hpp"
#include <zlib.h>
#include <stdexcept>

namespace objcache {
namespace core {
namespace compression {

namespace {
constexpr size_t LENGTH_PREFIX = 4;
}

ZlibCodec::ZlibCodec(int level, uint32_t maxDecompressed) : level_(level), maxDecompressed_(maxDecompressed) {
    if (level_ < Z_NO_COMPRESSION || level_ > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("ZlibCodec: invalid compression level " + std::to_string(level));
    }
}

std::optional<Bytes> ZlibCodec::compress(const Bytes& data) const {
    // Больше лимита decompress всё равно не примет
    if (data.size() > maxDecompressed_) {
        return std::nullopt;
    }
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    Bytes out(LENGTH_PREFIX + bound);
    const uint32_t length = static_cast<uint32_t>(data.size());
    for (size_t i = 0; i < LENGTH_PREFIX; ++i) {
        out[i] = static_cast<uint8_t>((length >> (8 * i)) & 0xFF);
    }
    uLongf outLen = bound;
    int rc = compress2(out.data() + LENGTH_PREFIX, &outLen, data.data(), static_cast<uLong>(data.size()), level_);
    if (rc != Z_OK) {
        logging::getLogger()->warn("ZlibCodec: compress2 failed rc={} size={}", rc, data.size());
        return std::nullopt;
    }
    out.resize(LENGTH_PREFIX + outLen);
    return out;
}

std::optional<Bytes> ZlibCodec::decompress(const Bytes& data) const {
    if (data.size() < LENGTH_PREFIX) {
        return std::nullopt;
    }
    uint32_t length = 0;
    for (size_t i = 0; i < LENGTH_PREFIX; ++i) {
        length |= static_cast<uint32_t>(data[i]) << (8 * i);
    }
    // Защита от мусорного префикса
    if (length > maxDecompressed_) {
        logging::getLogger()->error("ZlibCodec: declared length {} exceeds limit {}", length, maxDecompressed_);
        return std::nullopt;
    }
    Bytes out(length);
    uLongf outLen = length;
    int rc = uncompress(out.data(), &outLen, data.data() + LENGTH_PREFIX,
                        static_cast<uLong>(data.size() - LENGTH_PREFIX));
    if (rc != Z_OK || outLen != length) {
        logging::getLogger()->error("ZlibCodec: uncompress failed rc={} expected={} got={}", rc, length, outLen);
        return std::nullopt;
    }
    return out;
}

std::shared_ptr<Codec> makeCodec(const std::string& name) {
    if (name == "none" || name.empty()) {
        return std::make_shared<NoneCodec>();
    }
    if (name == "zlib") {
        return std::make_shared<ZlibCodec>();
    }
    throw std::invalid_argument("Unknown compression codec: " + name);
}

std::shared_ptr<Codec> codecForTag(uint8_t tag) {
    switch (static_cast<CodecTag>(tag)) {
        case CodecTag::None:
            return std::make_shared<NoneCodec>();
        case CodecTag::Zlib:
            return std::make_shared<ZlibCodec>();
    }
    return nullptr;
}

} // namespace compression
} // namespace core
} // namespace objcache
