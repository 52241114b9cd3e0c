#include "agrocache/core/storage/DurableStore.hpp"
#include "agrocache/core/storage/Database.hpp"
#include "agrocache/core/storage/Statement.hpp"
#include "agrocache/core/storage/Transaction.hpp"
#include "agrocache/core/storage/Compression.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/logging/Logger.hpp"
#include <filesystem>

namespace agrocache {
namespace core {
namespace storage {

namespace {

int64_t toEpochMs(StoredEntry::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

StoredEntry::TimePoint fromEpochMs(int64_t ms) {
    using TimePoint = StoredEntry::TimePoint;
    // Значения за пределами диапазона TimePoint насыщаются
    if (ms >= toEpochMs(TimePoint::max())) {
        return TimePoint::max();
    }
    if (ms <= toEpochMs(TimePoint::min())) {
        return TimePoint::min();
    }
    return TimePoint(
        std::chrono::duration_cast<StoredEntry::TimePoint::duration>(std::chrono::milliseconds(ms)));
}

const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS cache_entries ("
    "  key_hash TEXT PRIMARY KEY,"
    "  key_data TEXT NOT NULL,"
    "  value_data BLOB,"
    "  size_bytes INTEGER NOT NULL,"
    "  created_at INTEGER NOT NULL,"
    "  accessed_at INTEGER NOT NULL,"
    "  access_count INTEGER NOT NULL DEFAULT 0,"
    "  ttl_seconds INTEGER NOT NULL,"
    "  expires_at INTEGER NOT NULL,"
    "  category TEXT,"
    "  compressed INTEGER NOT NULL DEFAULT 0"
    ");",
    "CREATE TABLE IF NOT EXISTS cache_entry_tags ("
    "  key_hash TEXT NOT NULL,"
    "  tag_name TEXT NOT NULL,"
    "  PRIMARY KEY (key_hash, tag_name),"
    "  FOREIGN KEY (key_hash) REFERENCES cache_entries (key_hash)"
    ");",
    "CREATE TABLE IF NOT EXISTS cache_stats ("
    "  stat_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  stat_name TEXT NOT NULL,"
    "  stat_value INTEGER NOT NULL DEFAULT 0,"
    "  recorded_at INTEGER NOT NULL"
    ");",
    "CREATE INDEX IF NOT EXISTS idx_cache_expires ON cache_entries(expires_at);",
    "CREATE INDEX IF NOT EXISTS idx_cache_category ON cache_entries(category);",
    "CREATE INDEX IF NOT EXISTS idx_cache_accessed ON cache_entries(accessed_at);",
    "CREATE INDEX IF NOT EXISTS idx_cache_tag_name ON cache_entry_tags(tag_name);"
};

} // namespace

DurableStore::DurableStore(const std::string& path, bool enableCompression)
    : enableCompression_(enableCompression) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && path != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw cache::StoreError("Не удалось создать каталог " + parent.string() + ": " + ec.message());
        }
    }
    db_ = std::make_unique<Database>(path);
    createSchema();
    logging::get()->info("DurableStore: открыт {}, записей={}, compression={}",
                         path, count(), enableCompression_);
}

DurableStore::~DurableStore() = default;

void DurableStore::createSchema() {
    auto tx = db_->beginTransaction();
    for (const char* sql : kSchema) {
        db_->execute(sql);
    }
    tx->commit();
}

void DurableStore::put(const StoredEntry& entry) {
    bool compress = enableCompression_ && !entry.value.empty();
    auto blob = compress ? compressBlob(entry.value) : entry.value;

    auto tx = db_->beginTransaction();
    // Старые теги удаляются до REPLACE, иначе сработает внешний ключ
    db_->prepare("DELETE FROM cache_entry_tags WHERE key_hash = ?")->bind(1, entry.keyHash).execute();

    auto insert = db_->prepare(
        "INSERT OR REPLACE INTO cache_entries ("
        " key_hash, key_data, value_data, size_bytes, created_at, accessed_at,"
        " access_count, ttl_seconds, expires_at, category, compressed"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    insert->bind(1, entry.keyHash)
        .bind(2, entry.key)
        .bind(3, blob)
        .bind(4, static_cast<int64_t>(entry.sizeBytes))
        .bind(5, toEpochMs(entry.createdAt))
        .bind(6, toEpochMs(entry.accessedAt))
        .bind(7, static_cast<int64_t>(entry.accessCount))
        .bind(8, static_cast<int64_t>(entry.ttl.count()))
        .bind(9, toEpochMs(entry.expiresAt));
    if (entry.category) {
        insert->bind(10, *entry.category);
    } else {
        insert->bindNull(10);
    }
    insert->bind(11, static_cast<int64_t>(compress ? 1 : 0));
    insert->execute();

    if (!entry.tags.empty()) {
        auto tagInsert = db_->prepare(
            "INSERT OR IGNORE INTO cache_entry_tags (key_hash, tag_name) VALUES (?, ?)");
        for (const auto& tag : entry.tags) {
            tagInsert->reset();
            tagInsert->bind(1, entry.keyHash).bind(2, tag).execute();
        }
    }
    tx->commit();
}

std::optional<StoredEntry> DurableStore::load(const std::string& keyHash) {
    auto select = db_->prepare(
        "SELECT key_data, value_data, size_bytes, created_at, accessed_at, access_count,"
        " ttl_seconds, expires_at, category, compressed"
        " FROM cache_entries WHERE key_hash = ?");
    select->bind(1, keyHash);
    if (!select->step()) {
        return std::nullopt;
    }

    StoredEntry entry;
    entry.keyHash = keyHash;
    entry.key = select->getText(0);
    auto sizeBytes = select->getInt64(2);
    if (sizeBytes < 0) {
        throw cache::DeserializationError("Отрицательный size_bytes=" + std::to_string(sizeBytes));
    }
    entry.sizeBytes = static_cast<size_t>(sizeBytes);
    entry.createdAt = fromEpochMs(select->getInt64(3));
    entry.accessedAt = fromEpochMs(select->getInt64(4));
    entry.accessCount = static_cast<uint64_t>(select->getInt64(5));
    entry.ttl = std::chrono::seconds(select->getInt64(6));
    entry.expiresAt = fromEpochMs(select->getInt64(7));
    if (!select->isNull(8)) {
        entry.category = select->getText(8);
    }
    bool compressed = select->getInt64(9) != 0;
    auto blob = select->getBlob(1);
    entry.value = compressed ? decompressBlob(blob, entry.sizeBytes) : std::move(blob);

    if (entry.value.size() != entry.sizeBytes) {
        throw cache::DeserializationError("Размер значения " + std::to_string(entry.value.size()) +
                                          " не совпадает с size_bytes=" + std::to_string(entry.sizeBytes));
    }

    auto tags = db_->prepare("SELECT tag_name FROM cache_entry_tags WHERE key_hash = ?");
    tags->bind(1, keyHash);
    while (tags->step()) {
        entry.tags.insert(tags->getText(0));
    }
    return entry;
}

bool DurableStore::erase(const std::string& keyHash) {
    auto tx = db_->beginTransaction();
    db_->prepare("DELETE FROM cache_entry_tags WHERE key_hash = ?")->bind(1, keyHash).execute();
    db_->prepare("DELETE FROM cache_entries WHERE key_hash = ?")->bind(1, keyHash).execute();
    bool removed = sqlite3_changes(db_->get()) > 0;
    tx->commit();
    return removed;
}

size_t DurableStore::eraseAll() {
    auto tx = db_->beginTransaction();
    db_->execute("DELETE FROM cache_entry_tags;");
    db_->execute("DELETE FROM cache_entries;");
    auto removed = static_cast<size_t>(sqlite3_changes(db_->get()));
    tx->commit();
    return removed;
}

void DurableStore::touch(const std::string& keyHash, StoredEntry::TimePoint accessedAt, uint64_t accessCount) {
    db_->prepare("UPDATE cache_entries SET accessed_at = ?, access_count = ? WHERE key_hash = ?")
        ->bind(1, toEpochMs(accessedAt))
        .bind(2, static_cast<int64_t>(accessCount))
        .bind(3, keyHash)
        .execute();
}

bool DurableStore::contains(const std::string& keyHash) {
    auto select = db_->prepare("SELECT 1 FROM cache_entries WHERE key_hash = ?");
    select->bind(1, keyHash);
    return select->step();
}

size_t DurableStore::count() {
    auto select = db_->prepare("SELECT COUNT(*) FROM cache_entries");
    return select->step() ? static_cast<size_t>(select->getInt64(0)) : 0;
}

std::vector<std::string> DurableStore::collectKeys(const std::string& sql, const std::string& param) {
    auto select = db_->prepare(sql);
    if (!param.empty()) {
        select->bind(1, param);
    }
    std::vector<std::string> keys;
    while (select->step()) {
        keys.push_back(select->getText(0));
    }
    return keys;
}

std::vector<std::string> DurableStore::allKeys() {
    return collectKeys("SELECT key_hash FROM cache_entries");
}

std::vector<std::string> DurableStore::keysByCategory(const std::string& category) {
    if (category.empty()) {
        return {};
    }
    return collectKeys("SELECT key_hash FROM cache_entries WHERE category = ?", category);
}

std::vector<std::string> DurableStore::keysByTags(const std::set<std::string>& tags) {
    if (tags.empty()) {
        return {};
    }
    std::string placeholders;
    for (size_t i = 0; i < tags.size(); ++i) {
        placeholders += (i == 0) ? "?" : ", ?";
    }
    auto select = db_->prepare("SELECT DISTINCT key_hash FROM cache_entry_tags WHERE tag_name IN (" +
                               placeholders + ")");
    int index = 1;
    for (const auto& tag : tags) {
        select->bind(index++, tag);
    }
    std::vector<std::string> keys;
    while (select->step()) {
        keys.push_back(select->getText(0));
    }
    return keys;
}

std::vector<std::string> DurableStore::expiredKeys(StoredEntry::TimePoint now) {
    auto select = db_->prepare("SELECT key_hash FROM cache_entries WHERE expires_at <= ?");
    select->bind(1, toEpochMs(now));
    std::vector<std::string> keys;
    while (select->step()) {
        keys.push_back(select->getText(0));
    }
    return keys;
}

std::unordered_map<std::string, std::set<std::string>> DurableStore::loadTagAssociations() {
    auto select = db_->prepare("SELECT key_hash, tag_name FROM cache_entry_tags");
    std::unordered_map<std::string, std::set<std::string>> result;
    while (select->step()) {
        result[select->getText(0)].insert(select->getText(1));
    }
    return result;
}

void DurableStore::recordStat(const std::string& name, int64_t value) {
    db_->prepare("INSERT INTO cache_stats (stat_name, stat_value, recorded_at) VALUES (?, ?, ?)")
        ->bind(1, name)
        .bind(2, value)
        .bind(3, toEpochMs(std::chrono::system_clock::now()))
        .execute();
}

std::optional<int64_t> DurableStore::lastStat(const std::string& name) {
    auto select = db_->prepare(
        "SELECT stat_value FROM cache_stats WHERE stat_name = ? ORDER BY stat_id DESC LIMIT 1");
    select->bind(1, name);
    if (!select->step()) {
        return std::nullopt;
    }
    return select->getInt64(0);
}

const std::string& DurableStore::path() const {
    return db_->path();
}

} // namespace storage
} // namespace core
} // namespace agrocache
