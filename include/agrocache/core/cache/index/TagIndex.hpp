#pragma once
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace agrocache {
namespace core {
namespace cache {

// TagIndex: связь тег <-> key_hash для массовой инвалидации без полного обхода
class TagIndex {
public:
    void add(const std::string& keyHash, const std::set<std::string>& tags); // Добавить теги записи
    void removeEntry(const std::string& keyHash); // Убрать запись из всех тегов
    std::set<std::string> keysForAny(const std::set<std::string>& tags) const; // Объединение по тегам
    std::set<std::string> tagsOf(const std::string& keyHash) const;
    bool contains(const std::string& tag, const std::string& keyHash) const;
    size_t tagCount() const { return byTag_.size(); }
    size_t entryCount() const { return byEntry_.size(); }
    void clear();
private:
    std::unordered_map<std::string, std::unordered_set<std::string>> byTag_;   // тег -> записи
    std::unordered_map<std::string, std::unordered_set<std::string>> byEntry_; // запись -> теги
};

} // namespace cache
} // namespace core
} // namespace agrocache
