#pragma once
#include <string>

namespace agrocache {
namespace core {
namespace cache {

// Стратегия вытеснения при нехватке памяти
enum class EvictionStrategy {
    LRU,  // Least Recently Used
    LFU,  // Least Frequently Used
    FIFO, // First In First Out (по времени вставки)
    TTL   // Ближайший к истечению срока
};

std::string toString(EvictionStrategy strategy);

// Бросает ConfigError для неизвестного имени
EvictionStrategy strategyFromString(const std::string& name);

} // namespace cache
} // namespace core
} // namespace agrocache
