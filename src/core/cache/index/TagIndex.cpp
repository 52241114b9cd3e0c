#include "agrocache/core/cache/index/TagIndex.hpp"

namespace agrocache {
namespace core {
namespace cache {

void TagIndex::add(const std::string& keyHash, const std::set<std::string>& tags) {
    if (tags.empty()) {
        return;
    }
    auto& entryTags = byEntry_[keyHash];
    for (const auto& tag : tags) {
        byTag_[tag].insert(keyHash);
        entryTags.insert(tag);
    }
}

void TagIndex::removeEntry(const std::string& keyHash) {
    auto it = byEntry_.find(keyHash);
    if (it == byEntry_.end()) {
        return;
    }
    for (const auto& tag : it->second) {
        auto tagIt = byTag_.find(tag);
        if (tagIt == byTag_.end()) continue;
        tagIt->second.erase(keyHash);
        // Пустые теги не храним
        if (tagIt->second.empty()) {
            byTag_.erase(tagIt);
        }
    }
    byEntry_.erase(it);
}

std::set<std::string> TagIndex::keysForAny(const std::set<std::string>& tags) const {
    std::set<std::string> result;
    for (const auto& tag : tags) {
        auto it = byTag_.find(tag);
        if (it != byTag_.end()) {
            result.insert(it->second.begin(), it->second.end());
        }
    }
    return result;
}

std::set<std::string> TagIndex::tagsOf(const std::string& keyHash) const {
    auto it = byEntry_.find(keyHash);
    if (it == byEntry_.end()) {
        return {};
    }
    return std::set<std::string>(it->second.begin(), it->second.end());
}

bool TagIndex::contains(const std::string& tag, const std::string& keyHash) const {
    auto it = byTag_.find(tag);
    return it != byTag_.end() && it->second.count(keyHash) > 0;
}

void TagIndex::clear() {
    byTag_.clear();
    byEntry_.clear();
}

} // namespace cache
} // namespace core
} // namespace agrocache
