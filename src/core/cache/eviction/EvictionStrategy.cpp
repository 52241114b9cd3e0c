#include "agrocache/core/cache/eviction/EvictionStrategy.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include <algorithm>
#include <cctype>

namespace agrocache {
namespace core {
namespace cache {

std::string toString(EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::LRU: return "lru";
        case EvictionStrategy::LFU: return "lfu";
        case EvictionStrategy::FIFO: return "fifo";
        case EvictionStrategy::TTL: return "ttl";
    }
    return "lru";
}

EvictionStrategy strategyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "lru") return EvictionStrategy::LRU;
    if (lower == "lfu") return EvictionStrategy::LFU;
    if (lower == "fifo") return EvictionStrategy::FIFO;
    if (lower == "ttl") return EvictionStrategy::TTL;
    throw ConfigError("Неизвестная стратегия вытеснения: " + name);
}

} // namespace cache
} // namespace core
} // namespace agrocache
