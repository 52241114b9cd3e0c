#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "agrocache/core/storage/Database.hpp"
#include "agrocache/core/storage/DurableStore.hpp"
#include "agrocache/core/storage/Statement.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/cache/codec/KeyCodec.hpp"

using namespace agrocache::core;
namespace fs = std::filesystem;

namespace {

std::string freshDbPath(const std::string& name) {
    auto dir = fs::temp_directory_path() / "agrocache_tests";
    fs::create_directories(dir);
    auto path = dir / (name + ".db");
    fs::remove(path);
    fs::remove(path.string() + "-wal");
    fs::remove(path.string() + "-shm");
    return path.string();
}

storage::StoredEntry makeEntry(const std::string& key, const std::string& payload,
                               std::chrono::seconds ttl,
                               std::optional<std::string> category = std::nullopt,
                               std::set<std::string> tags = {}) {
    auto now = std::chrono::system_clock::now();
    storage::StoredEntry entry;
    entry.keyHash = cache::KeyCodec::digest(key);
    entry.key = key;
    entry.value.assign(payload.begin(), payload.end());
    entry.sizeBytes = entry.value.size();
    entry.createdAt = now;
    entry.accessedAt = now;
    entry.ttl = ttl;
    entry.expiresAt = now + ttl;
    entry.category = std::move(category);
    entry.tags = std::move(tags);
    return entry;
}

} // namespace

void testPutLoadErase() {
    std::cout << "Testing DurableStore put/load/erase...\n";

    storage::DurableStore store(freshDbPath("durable_basic"), false);
    assert(store.count() == 0);

    auto entry = makeEntry("sensor:1:1", "{\"moisture\":31.5}", std::chrono::seconds(60),
                           std::string("sensors"), {"area:1", "moisture"});
    store.put(entry);
    assert(store.count() == 1);
    assert(store.contains(entry.keyHash));

    auto loaded = store.load(entry.keyHash);
    assert(loaded);
    assert(loaded->key == "sensor:1:1");
    assert(loaded->value == entry.value);
    assert(loaded->sizeBytes == entry.sizeBytes);
    assert(loaded->ttl == std::chrono::seconds(60));
    assert(loaded->category && *loaded->category == "sensors");
    assert(loaded->tags == entry.tags);

    // Замена перезаписывает теги
    auto replaced = makeEntry("sensor:1:1", "42", std::chrono::seconds(60), std::nullopt, {"area:2"});
    store.put(replaced);
    loaded = store.load(entry.keyHash);
    assert(loaded->value == replaced.value);
    assert(!loaded->category);
    assert(loaded->tags.size() == 1 && loaded->tags.count("area:2") == 1);
    assert(store.keysByTags({"area:1"}).empty());

    assert(store.erase(entry.keyHash));
    assert(!store.erase(entry.keyHash));
    assert(!store.load(entry.keyHash));
    assert(store.loadTagAssociations().empty());

    std::cout << "[OK] DurableStore put/load/erase test\n";
}

void testQueries() {
    std::cout << "Testing DurableStore queries...\n";

    storage::DurableStore store(freshDbPath("durable_queries"), false);
    auto a = makeEntry("a", "1", std::chrono::seconds(60), std::string("sensors"), {"area:1"});
    auto b = makeEntry("b", "2", std::chrono::seconds(60), std::string("sensors"), {"area:2"});
    auto c = makeEntry("c", "3", std::chrono::seconds(60), std::string("forecast"), {"area:1", "area:2"});
    auto old = makeEntry("old", "4", std::chrono::seconds(1));
    old.expiresAt = std::chrono::system_clock::now() - std::chrono::seconds(5);
    for (const auto* entry : {&a, &b, &c, &old}) {
        store.put(*entry);
    }

    assert(store.allKeys().size() == 4);
    assert(store.keysByCategory("sensors").size() == 2);
    assert(store.keysByCategory("").empty());
    assert(store.keysByTags({"area:1"}).size() == 2);
    assert(store.keysByTags({"area:1", "area:2"}).size() == 3);
    assert(store.keysByTags({}).empty());

    auto expired = store.expiredKeys(std::chrono::system_clock::now());
    assert(expired.size() == 1 && expired[0] == old.keyHash);

    auto associations = store.loadTagAssociations();
    assert(associations.size() == 3);
    assert(associations[c.keyHash].size() == 2);

    store.touch(a.keyHash, std::chrono::system_clock::now(), 7);
    assert(store.load(a.keyHash)->accessCount == 7);

    assert(store.eraseAll() == 4);
    assert(store.count() == 0);

    std::cout << "[OK] DurableStore queries test\n";
}

void testCompressionAndReopen() {
    std::cout << "Testing DurableStore compression and reopen...\n";

    auto path = freshDbPath("durable_reopen");
    auto entry = makeEntry("payload", std::string(4096, 'z'), std::chrono::seconds(600),
                           std::nullopt, {"bulk"});
    {
        storage::DurableStore store(path, true);
        store.put(entry);
        store.recordStat("hits", 11);
        store.recordStat("hits", 12);
    }
    {
        storage::DurableStore store(path, false);
        auto loaded = store.load(entry.keyHash);
        assert(loaded);
        assert(loaded->value == entry.value);
        assert(loaded->tags.count("bulk") == 1);
        assert(store.lastStat("hits") && *store.lastStat("hits") == 12);
        assert(!store.lastStat("misses"));
    }

    std::cout << "[OK] DurableStore compression/reopen test\n";
}

void testUnopenablePath() {
    std::cout << "Testing DurableStore open failure...\n";

    auto blocker = fs::temp_directory_path() / "agrocache_tests" / "not_a_dir";
    { std::ofstream out(blocker); out << "x"; }

    bool thrown = false;
    try {
        storage::DurableStore store((blocker / "cache.db").string(), false);
    } catch (const cache::StoreError&) {
        thrown = true;
    }
    assert(thrown);
    fs::remove(blocker);

    std::cout << "[OK] DurableStore open failure test\n";
}

void testOversizedBindRejected() {
    std::cout << "Testing oversized parameters are rejected, not truncated...\n";

    storage::Database db(freshDbPath("oversized"));
    db.execute("CREATE TABLE blobs (id INTEGER PRIMARY KEY, data BLOB, label TEXT);");
    sqlite3_limit(db.get(), SQLITE_LIMIT_LENGTH, 1024);

    auto blobInsert = db.prepare("INSERT INTO blobs (id, data) VALUES (1, ?)");
    bool thrown = false;
    try {
        blobInsert->bind(1, std::vector<uint8_t>(4096, 7));
    } catch (const cache::StoreError&) {
        thrown = true;
    }
    assert(thrown);

    auto textInsert = db.prepare("INSERT INTO blobs (id, label) VALUES (2, ?)");
    thrown = false;
    try {
        textInsert->bind(1, std::string(4096, 'x'));
    } catch (const cache::StoreError&) {
        thrown = true;
    }
    assert(thrown);

    // В пределах лимита значение сохраняется целиком
    db.prepare("INSERT INTO blobs (id, data) VALUES (3, ?)")
        ->bind(1, std::vector<uint8_t>(1000, 9))
        .execute();
    auto select = db.prepare("SELECT length(data) FROM blobs WHERE id = 3");
    assert(select->step());
    assert(select->getInt64(0) == 1000);

    std::cout << "[OK] oversized parameter test\n";
}

int main() {
    try {
        testPutLoadErase();
        testQueries();
        testCompressionAndReopen();
        testUnopenablePath();
        testOversizedBindRejected();
        std::cout << "All DurableStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
