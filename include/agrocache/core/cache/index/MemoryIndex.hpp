#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "agrocache/core/cache/CacheEntry.hpp"
#include "agrocache/core/cache/eviction/EvictionPlanner.hpp"

namespace agrocache {
namespace core {
namespace cache {

// MemoryIndex: key_hash -> живое значение + учёт доступа.
// Ведёт суммарный размер; синхронизация на стороне CacheManager.
template<typename Value>
class MemoryIndex {
public:
    struct Slot {
        Value value;
        EntryMeta meta;
    };

    const Slot* find(const std::string& keyHash) const;
    bool contains(const std::string& keyHash) const;
    void insert(const std::string& keyHash, Value value, EntryMeta meta); // Полная замена
    bool erase(const std::string& keyHash);
    void clear();

    // Отметить попадание: accessedAt, accessCount, порядок доступа
    const Slot* touch(const std::string& keyHash, TimePoint now);

    std::vector<EvictionCandidate> candidates(const std::string& excludeHash = {}) const;
    std::vector<std::string> expiredKeys(TimePoint now) const;
    std::vector<std::string> keysByCategory(const std::string& category) const;
    std::vector<std::string> keys() const;

    size_t size() const { return slots_.size(); }
    size_t memoryUsage() const { return usage_; }
    std::optional<size_t> sizeOf(const std::string& keyHash) const;

private:
    uint64_t nextSeq() { return ++seq_; }

    std::unordered_map<std::string, Slot> slots_;
    size_t usage_ = 0;
    uint64_t seq_ = 0;
};

// Реализация шаблонного класса

template<typename Value>
const typename MemoryIndex<Value>::Slot* MemoryIndex<Value>::find(const std::string& keyHash) const {
    auto it = slots_.find(keyHash);
    return it == slots_.end() ? nullptr : &it->second;
}

template<typename Value>
bool MemoryIndex<Value>::contains(const std::string& keyHash) const {
    return slots_.find(keyHash) != slots_.end();
}

template<typename Value>
void MemoryIndex<Value>::insert(const std::string& keyHash, Value value, EntryMeta meta) {
    erase(keyHash);
    meta.insertSeq = nextSeq();
    meta.accessSeq = meta.insertSeq;
    usage_ += meta.sizeBytes;
    slots_.emplace(keyHash, Slot{std::move(value), std::move(meta)});
}

template<typename Value>
bool MemoryIndex<Value>::erase(const std::string& keyHash) {
    auto it = slots_.find(keyHash);
    if (it == slots_.end()) {
        return false;
    }
    usage_ -= it->second.meta.sizeBytes;
    slots_.erase(it);
    return true;
}

template<typename Value>
void MemoryIndex<Value>::clear() {
    slots_.clear();
    usage_ = 0;
}

template<typename Value>
const typename MemoryIndex<Value>::Slot* MemoryIndex<Value>::touch(const std::string& keyHash, TimePoint now) {
    auto it = slots_.find(keyHash);
    if (it == slots_.end()) {
        return nullptr;
    }
    auto& meta = it->second.meta;
    meta.accessedAt = now;
    meta.accessCount++;
    meta.accessSeq = nextSeq();
    return &it->second;
}

template<typename Value>
std::vector<EvictionCandidate> MemoryIndex<Value>::candidates(const std::string& excludeHash) const {
    std::vector<EvictionCandidate> result;
    result.reserve(slots_.size());
    for (const auto& [hash, slot] : slots_) {
        if (hash == excludeHash) continue;
        const auto& meta = slot.meta;
        result.push_back(EvictionCandidate{hash, meta.sizeBytes, meta.createdAt, meta.accessedAt,
                                           meta.expiresAt, meta.accessCount, meta.insertSeq,
                                           meta.accessSeq});
    }
    return result;
}

template<typename Value>
std::vector<std::string> MemoryIndex<Value>::expiredKeys(TimePoint now) const {
    std::vector<std::string> result;
    for (const auto& [hash, slot] : slots_) {
        if (slot.meta.isExpired(now)) {
            result.push_back(hash);
        }
    }
    return result;
}

template<typename Value>
std::vector<std::string> MemoryIndex<Value>::keysByCategory(const std::string& category) const {
    std::vector<std::string> result;
    for (const auto& [hash, slot] : slots_) {
        if (slot.meta.category && *slot.meta.category == category) {
            result.push_back(hash);
        }
    }
    return result;
}

template<typename Value>
std::vector<std::string> MemoryIndex<Value>::keys() const {
    std::vector<std::string> result;
    result.reserve(slots_.size());
    for (const auto& [hash, slot] : slots_) {
        result.push_back(hash);
    }
    return result;
}

template<typename Value>
std::optional<size_t> MemoryIndex<Value>::sizeOf(const std::string& keyHash) const {
    auto it = slots_.find(keyHash);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second.meta.sizeBytes;
}

} // namespace cache
} // namespace core
} // namespace agrocache
