#include "agrocache/core/storage/Compression.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include <zlib.h>
#include <string>

namespace agrocache {
namespace core {
namespace storage {

namespace {

// Предельная степень сжатия deflate
constexpr size_t kMaxDeflateRatio = 1032;

} // namespace

std::vector<uint8_t> compressBlob(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }
    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressed(compressedSize);
    int result = compress2(compressed.data(), &compressedSize,
                           data.data(), static_cast<uLong>(data.size()), Z_BEST_SPEED);
    if (result != Z_OK) {
        throw cache::SerializationError("zlib compress2 вернул " + std::to_string(result));
    }
    compressed.resize(compressedSize);
    return compressed;
}

std::vector<uint8_t> decompressBlob(const std::vector<uint8_t>& data, size_t originalSize) {
    if (originalSize == 0) {
        return {};
    }
    if (data.empty()) {
        throw cache::DeserializationError("Пустой сжатый блок для значения размером " +
                                          std::to_string(originalSize));
    }
    // size_bytes из повреждённой строки не должен вызвать огромную аллокацию
    if (originalSize / kMaxDeflateRatio > data.size()) {
        throw cache::DeserializationError("Заявленный размер " + std::to_string(originalSize) +
                                          " невозможен для сжатого блока размером " +
                                          std::to_string(data.size()));
    }
    std::vector<uint8_t> decompressed(originalSize);
    uLongf decompressedSize = static_cast<uLongf>(originalSize);
    int result = uncompress(decompressed.data(), &decompressedSize,
                            data.data(), static_cast<uLong>(data.size()));
    if (result != Z_OK || decompressedSize != originalSize) {
        throw cache::DeserializationError("zlib uncompress вернул " + std::to_string(result) +
                                          ", размер " + std::to_string(decompressedSize) +
                                          " вместо " + std::to_string(originalSize));
    }
    return decompressed;
}

} // namespace storage
} // namespace core
} // namespace agrocache
