#pragma once
#include <cstddef>
#include <string>

namespace agrocache {
namespace core {
namespace cache {

// KeyCodec: ключ -> SHA-256 (hex), внутренний идентификатор записи
class KeyCodec {
public:
    static constexpr size_t kDigestLength = 64; // Длина hex-дайджеста
    static std::string digest(const std::string& key);
};

} // namespace cache
} // namespace core
} // namespace agrocache
