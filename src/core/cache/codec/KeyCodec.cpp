#include "agrocache/core/cache/codec/KeyCodec.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace agrocache {
namespace core {
namespace cache {

std::string KeyCodec::digest(const std::string& key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace cache
} // namespace core
} // namespace agrocache
