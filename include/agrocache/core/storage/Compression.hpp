#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace agrocache {
namespace core {
namespace storage {

// zlib-сжатие значений постоянного хранилища
std::vector<uint8_t> compressBlob(const std::vector<uint8_t>& data); // Бросает SerializationError
std::vector<uint8_t> decompressBlob(const std::vector<uint8_t>& data, size_t originalSize); // Бросает DeserializationError

} // namespace storage
} // namespace core
} // namespace agrocache
