#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace agrocache {
namespace core {
namespace storage {

class Database;

// StoredEntry: строка cache_entries вместе с тегами
struct StoredEntry {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string keyHash;
    std::string key;
    std::vector<uint8_t> value;  // Сериализованное значение (без сжатия)
    size_t sizeBytes = 0;
    TimePoint createdAt;
    TimePoint accessedAt;
    uint64_t accessCount = 0;
    std::chrono::seconds ttl{0};
    TimePoint expiresAt;
    std::optional<std::string> category;
    std::set<std::string> tags;
};

/**
 * @brief DurableStore: постоянный уровень кэша поверх SQLite.
 *
 * Хранит метаданные и сериализованное значение каждой записи по key_hash,
 * а также связи запись-тег. Все методы бросают StoreError при недоступности
 * базы; load() бросает DeserializationError для повреждённого сжатого блока.
 * Не потокобезопасен: вызывается под блокировкой CacheManager.
 */
class DurableStore {
public:
    DurableStore(const std::string& path, bool enableCompression);
    ~DurableStore();

    DurableStore(const DurableStore&) = delete;
    DurableStore& operator=(const DurableStore&) = delete;

    void put(const StoredEntry& entry);                          // Вставка/замена записи и тегов
    std::optional<StoredEntry> load(const std::string& keyHash); // Запись (в т.ч. истёкшая)
    bool erase(const std::string& keyHash);                      // Удалить запись и теги
    size_t eraseAll();                                           // Удалить всё
    void touch(const std::string& keyHash, StoredEntry::TimePoint accessedAt, uint64_t accessCount);

    bool contains(const std::string& keyHash);
    size_t count();
    std::vector<std::string> allKeys();
    std::vector<std::string> keysByCategory(const std::string& category);
    std::vector<std::string> keysByTags(const std::set<std::string>& tags);
    std::vector<std::string> expiredKeys(StoredEntry::TimePoint now);
    std::unordered_map<std::string, std::set<std::string>> loadTagAssociations(); // key_hash -> теги

    void recordStat(const std::string& name, int64_t value);   // Снимок статистики (cache_stats)
    std::optional<int64_t> lastStat(const std::string& name);

    const std::string& path() const;

private:
    void createSchema();
    std::vector<std::string> collectKeys(const std::string& sql, const std::string& param = {});

    std::unique_ptr<Database> db_;
    bool enableCompression_;
};

} // namespace storage
} // namespace core
} // namespace agrocache
