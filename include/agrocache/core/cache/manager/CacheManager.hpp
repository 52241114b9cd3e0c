#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include "agrocache/core/cache/CacheConfig.hpp"
#include "agrocache/core/cache/CacheEntry.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/cache/codec/KeyCodec.hpp"
#include "agrocache/core/cache/codec/Serializer.hpp"
#include "agrocache/core/cache/eviction/EvictionPlanner.hpp"
#include "agrocache/core/cache/eviction/ExpirySweeper.hpp"
#include "agrocache/core/cache/index/MemoryIndex.hpp"
#include "agrocache/core/cache/index/TagIndex.hpp"
#include "agrocache/core/cache/metrics/CacheStats.hpp"
#include "agrocache/core/cache/metrics/StatsCollector.hpp"
#include "agrocache/core/logging/Logger.hpp"
#include "agrocache/core/storage/DurableStore.hpp"

namespace agrocache {
namespace core {
namespace cache {

/**
 * @brief CacheManager: фасад двухуровневого кэша (память + SQLite).
 *
 * Все операции выполняются под одной блокировкой экземпляра. Память
 * ограничена maxMemoryBytes/maxItems, вытеснение по выбранной стратегии,
 * истёкшие записи удаляются лениво в get() и фоновым ExpirySweeper.
 * Ошибки сериализации и хранилища не выходят наружу: они логируются и
 * превращаются в false / nullopt / 0.
 *
 * @tparam Value тип значения
 * @tparam Codec кодек Value <-> байты (encode/decode)
 */
template<typename Value, typename Codec = Serializer<Value>>
class CacheManager {
public:
    using ValueType = Value;

    explicit CacheManager(const CacheConfig& config); // Конструктор
    ~CacheManager(); // Деструктор (вызывает shutdown)

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    bool initialize(); // Открыть хранилище, восстановить теги, запустить очистку
    void shutdown();   // Остановить очистку, сохранить статистику, закрыть хранилище
    bool isInitialized() const;
    bool isDurable() const; // Есть ли постоянный уровень

    bool set(const std::string& key, const Value& value, const EntryOptions& options = {}); // Сохранить
    std::optional<Value> get(const std::string& key); // Получить
    bool remove(const std::string& key); // Удалить
    bool exists(const std::string& key); // get() != nullopt, учитывается в hit/miss
    size_t clear(const std::optional<std::string>& category = std::nullopt,
                 const std::set<std::string>& tags = {}); // Очистить по категории / тегам / всё
    std::unordered_map<std::string, Value> getMany(const std::vector<std::string>& keys);
    size_t setMany(const std::unordered_map<std::string, Value>& entries, const EntryOptions& options = {});
    size_t invalidateByTags(const std::set<std::string>& tags); // = clear(nullopt, tags)
    size_t purgeExpired(); // Один проход очистки истёкших записей

    CacheStats getStats() const; // Снимок статистики
    CacheConfig getConfiguration() const;

private:
    bool ensureSpaceLocked(const std::string& keyHash, size_t sizeBytes, EvictionStrategy strategy);
    bool eraseLocked(const std::string& keyHash);
    std::optional<Value> loadFromStoreLocked(const std::string& keyHash, TimePoint now);
    void persistAccessLocked(const std::string& keyHash, const EntryMeta& meta);
    void recordStatsLocked();
    static std::string shortHash(const std::string& keyHash) { return keyHash.substr(0, 12); }

    CacheConfig config_;
    MemoryIndex<Value> memory_;
    TagIndex tags_;
    EvictionPlanner planner_;
    StatsCollector stats_;
    std::unique_ptr<storage::DurableStore> store_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    mutable std::mutex mutex_;
};

// Байтовый кэш по умолчанию
using DefaultCacheManager = CacheManager<Bytes>;
using JsonCacheManager = CacheManager<nlohmann::json>;

// Реализация шаблонного класса

template<typename Value, typename Codec>
CacheManager<Value, Codec>::CacheManager(const CacheConfig& config)
    : config_(config) {
    logging::LoggerConfig loggerConfig;
    loggerConfig.logPath = config.logPath;
    loggerConfig.level = config.logLevel;
    loggerConfig.maxSize = config.maxLogSize;
    loggerConfig.maxFiles = config.maxLogFiles;
    logger_ = logging::initialize(loggerConfig);

    sweeper_ = std::make_unique<ExpirySweeper>(config.cleanupInterval, [this] { return purgeExpired(); });
    logger_->info("CacheManager создан с конфигурацией: maxMemoryBytes={}, maxItems={}, storagePath='{}'",
                  config.maxMemoryBytes, config.maxItems, config.storagePath);
}

template<typename Value, typename Codec>
CacheManager<Value, Codec>::~CacheManager() {
    shutdown();
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::initialize() {
    auto start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        logger_->warn("CacheManager уже инициализирован");
        return true;
    }
    if (!config_.validate()) {
        logger_->error("CacheManager: некорректная конфигурация: {}", config_.toJson().dump());
        return false;
    }

    if (config_.storagePath.empty()) {
        logger_->info("CacheManager: storagePath пуст, режим только памяти");
    } else {
        try {
            store_ = std::make_unique<storage::DurableStore>(config_.storagePath, config_.enableCompression);
            size_t restored = 0;
            for (const auto& [keyHash, entryTags] : store_->loadTagAssociations()) {
                tags_.add(keyHash, entryTags);
                ++restored;
            }
            logger_->info("CacheManager: восстановлены теги для {} записей", restored);
        } catch (const CacheError& e) {
            logger_->error("CacheManager: хранилище '{}' недоступно, работаем только в памяти: {}",
                           config_.storagePath, e.what());
            store_.reset();
            tags_.clear();
        }
    }

    initialized_ = true;
    sweeper_->start();

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->info("CacheManager успешно инициализирован за {} μs (durable={}, cleanupInterval={} мс)",
                  duration, store_ != nullptr, config_.cleanupInterval.count());
    return true;
}

template<typename Value, typename Codec>
void CacheManager<Value, Codec>::shutdown() {
    // Поток очистки берёт mutex_, поэтому останавливаем его до блокировки
    sweeper_->stop();

    std::unique_ptr<storage::DurableStore> tmpStore;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return;
        }
        recordStatsLocked();
        memory_.clear();
        tags_.clear();
        tmpStore = std::move(store_); // Закрытие вне lock
        initialized_ = false;
        logger_->info("CacheManager завершил работу");
    }
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::isDurable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_ != nullptr;
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::set(const std::string& key, const Value& value, const EntryOptions& options) {
    auto start = std::chrono::steady_clock::now();
    if (key.empty()) {
        logger_->warn("CacheManager::set: пустой ключ отклонён");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        logger_->error("CacheManager не инициализирован");
        return false;
    }

    auto keyHash = KeyCodec::digest(key);
    Bytes encoded;
    try {
        encoded = Codec::encode(value);
    } catch (const std::exception& e) {
        logger_->error("CacheManager::set: ошибка сериализации key_hash={}: {}", shortHash(keyHash), e.what());
        return false;
    }

    const size_t sizeBytes = encoded.size();
    if (!ensureSpaceLocked(keyHash, sizeBytes, options.strategy)) {
        logger_->warn("CacheManager::set: недостаточно памяти для key_hash={}, size={}, maxMemoryBytes={}",
                      shortHash(keyHash), sizeBytes, config_.maxMemoryBytes);
        return false;
    }

    auto now = Clock::now();
    EntryMeta meta;
    meta.key = key;
    meta.sizeBytes = sizeBytes;
    meta.createdAt = now;
    meta.accessedAt = now;
    meta.ttl = (options.ttl && options.ttl->count() > 0) ? *options.ttl : config_.defaultTtl;
    meta.expiresAt = expiryFor(now, meta.ttl);
    if (options.category && !options.category->empty()) {
        meta.category = options.category;
    }
    meta.tags = options.tags;

    // Write-through в постоянный уровень
    if (store_) {
        storage::StoredEntry stored;
        stored.keyHash = keyHash;
        stored.key = key;
        stored.value = std::move(encoded);
        stored.sizeBytes = sizeBytes;
        stored.createdAt = now;
        stored.accessedAt = now;
        stored.ttl = meta.ttl;
        stored.expiresAt = meta.expiresAt;
        stored.category = meta.category;
        stored.tags = meta.tags;
        try {
            store_->put(stored);
        } catch (const CacheError& e) {
            logger_->warn("CacheManager::set: запись key_hash={} только в памяти, хранилище: {}",
                          shortHash(keyHash), e.what());
            // Старая версия в хранилище не должна пережить замену
            try {
                store_->erase(keyHash);
            } catch (const CacheError& inner) {
                logger_->warn("CacheManager::set: не удалось удалить старую версию key_hash={}: {}",
                              shortHash(keyHash), inner.what());
            }
        }
    }

    tags_.removeEntry(keyHash);
    tags_.add(keyHash, meta.tags);
    memory_.insert(keyHash, value, std::move(meta));
    stats_.recordSet();

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->debug("Данные сохранены в кэш: key_hash={}, size={}, время={} μs",
                   shortHash(keyHash), sizeBytes, duration);
    return true;
}

template<typename Value, typename Codec>
std::optional<Value> CacheManager<Value, Codec>::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        logger_->error("CacheManager не инициализирован");
        return std::nullopt;
    }

    auto keyHash = KeyCodec::digest(key);
    auto now = Clock::now();

    if (const auto* slot = memory_.find(keyHash)) {
        if (slot->meta.isExpired(now)) {
            eraseLocked(keyHash);
            stats_.recordExpiration();
            stats_.recordMiss();
            logger_->debug("Запись истекла: key_hash={}", shortHash(keyHash));
            return std::nullopt;
        }
        slot = memory_.touch(keyHash, now);
        persistAccessLocked(keyHash, slot->meta);
        stats_.recordHit();
        return slot->value;
    }

    if (store_) {
        auto value = loadFromStoreLocked(keyHash, now);
        if (value) {
            stats_.recordHit();
            return value;
        }
    }

    stats_.recordMiss();
    logger_->debug("Данные не найдены в кэше: key_hash={}", shortHash(keyHash));
    return std::nullopt;
}

template<typename Value, typename Codec>
std::optional<Value> CacheManager<Value, Codec>::loadFromStoreLocked(const std::string& keyHash, TimePoint now) {
    std::optional<storage::StoredEntry> stored;
    try {
        stored = store_->load(keyHash);
    } catch (const DeserializationError& e) {
        logger_->error("CacheManager::get: повреждённая запись key_hash={} удалена: {}", shortHash(keyHash), e.what());
        eraseLocked(keyHash);
        return std::nullopt;
    } catch (const StoreError& e) {
        logger_->warn("CacheManager::get: хранилище недоступно для key_hash={}: {}", shortHash(keyHash), e.what());
        return std::nullopt;
    }
    if (!stored) {
        return std::nullopt;
    }

    if (stored->expiresAt <= now) {
        eraseLocked(keyHash);
        stats_.recordExpiration();
        logger_->debug("Запись в хранилище истекла: key_hash={}", shortHash(keyHash));
        return std::nullopt;
    }

    std::optional<Value> value;
    try {
        value.emplace(Codec::decode(stored->value));
    } catch (const std::exception& e) {
        logger_->error("CacheManager::get: ошибка десериализации key_hash={}, запись удалена: {}",
                       shortHash(keyHash), e.what());
        eraseLocked(keyHash);
        return std::nullopt;
    }

    EntryMeta meta;
    meta.key = stored->key;
    meta.sizeBytes = stored->sizeBytes;
    meta.createdAt = stored->createdAt;
    meta.accessedAt = now;
    meta.accessCount = stored->accessCount + 1;
    meta.ttl = stored->ttl;
    meta.expiresAt = stored->expiresAt;
    meta.category = stored->category;
    meta.tags = stored->tags;

    // Продвижение в память; если значение не помещается, отдаём без продвижения
    if (ensureSpaceLocked(keyHash, meta.sizeBytes, config_.defaultStrategy)) {
        tags_.removeEntry(keyHash);
        tags_.add(keyHash, meta.tags);
        memory_.insert(keyHash, *value, meta);
        logger_->debug("Запись продвинута из хранилища: key_hash={}, size={}", shortHash(keyHash), meta.sizeBytes);
    } else {
        logger_->debug("Запись key_hash={} не помещается в память, отдана без продвижения", shortHash(keyHash));
    }
    persistAccessLocked(keyHash, meta);
    return value;
}

template<typename Value, typename Codec>
void CacheManager<Value, Codec>::persistAccessLocked(const std::string& keyHash, const EntryMeta& meta) {
    if (!store_) {
        return;
    }
    try {
        store_->touch(keyHash, meta.accessedAt, meta.accessCount);
    } catch (const StoreError& e) {
        logger_->warn("CacheManager: не удалось обновить статистику доступа key_hash={}: {}",
                      shortHash(keyHash), e.what());
    }
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        logger_->error("CacheManager не инициализирован");
        return false;
    }

    auto keyHash = KeyCodec::digest(key);
    bool existed = eraseLocked(keyHash);
    if (existed) {
        stats_.recordDelete();
        logger_->debug("Данные удалены: key_hash={}", shortHash(keyHash));
    }
    return existed;
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::exists(const std::string& key) {
    return get(key).has_value();
}

template<typename Value, typename Codec>
size_t CacheManager<Value, Codec>::clear(const std::optional<std::string>& category,
                                         const std::set<std::string>& tags) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        logger_->error("CacheManager не инициализирован");
        return 0;
    }

    std::set<std::string> targets;
    if (category && !category->empty()) {
        for (auto& keyHash : memory_.keysByCategory(*category)) {
            targets.insert(std::move(keyHash));
        }
        if (store_) {
            try {
                for (auto& keyHash : store_->keysByCategory(*category)) {
                    targets.insert(std::move(keyHash));
                }
            } catch (const StoreError& e) {
                logger_->warn("CacheManager::clear: категория '{}' очищена только в памяти: {}", *category, e.what());
            }
        }
    } else if (!tags.empty()) {
        targets = tags_.keysForAny(tags);
        if (store_) {
            try {
                for (auto& keyHash : store_->keysByTags(tags)) {
                    targets.insert(std::move(keyHash));
                }
            } catch (const StoreError& e) {
                logger_->warn("CacheManager::clear: теги очищены по индексу памяти: {}", e.what());
            }
        }
    } else {
        for (auto& keyHash : memory_.keys()) {
            targets.insert(std::move(keyHash));
        }
        memory_.clear();
        tags_.clear();
        if (store_) {
            try {
                for (auto& keyHash : store_->allKeys()) {
                    targets.insert(std::move(keyHash));
                }
                store_->eraseAll();
            } catch (const StoreError& e) {
                logger_->warn("CacheManager::clear: хранилище не очищено: {}", e.what());
            }
        }
        logger_->info("Кэш очищен полностью, удалено записей: {}", targets.size());
        return targets.size();
    }

    size_t removed = 0;
    for (const auto& keyHash : targets) {
        if (eraseLocked(keyHash)) {
            ++removed;
        }
    }
    logger_->info("Кэш очищен выборочно (category='{}', tags={}), удалено записей: {}",
                  category.value_or(""), tags.size(), removed);
    return removed;
}

template<typename Value, typename Codec>
std::unordered_map<std::string, Value> CacheManager<Value, Codec>::getMany(const std::vector<std::string>& keys) {
    std::unordered_map<std::string, Value> result;
    for (const auto& key : keys) {
        auto value = get(key);
        if (value) {
            result.emplace(key, std::move(*value));
        }
    }
    return result;
}

template<typename Value, typename Codec>
size_t CacheManager<Value, Codec>::setMany(const std::unordered_map<std::string, Value>& entries,
                                           const EntryOptions& options) {
    size_t stored = 0;
    for (const auto& [key, value] : entries) {
        if (set(key, value, options)) {
            ++stored;
        }
    }
    return stored;
}

template<typename Value, typename Codec>
size_t CacheManager<Value, Codec>::invalidateByTags(const std::set<std::string>& tags) {
    if (tags.empty()) {
        return 0;
    }
    return clear(std::nullopt, tags);
}

template<typename Value, typename Codec>
size_t CacheManager<Value, Codec>::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return 0;
    }

    auto now = Clock::now();
    std::set<std::string> targets;
    for (auto& keyHash : memory_.expiredKeys(now)) {
        targets.insert(std::move(keyHash));
    }
    if (store_) {
        try {
            for (auto& keyHash : store_->expiredKeys(now)) {
                targets.insert(std::move(keyHash));
            }
        } catch (const StoreError& e) {
            logger_->warn("CacheManager::purgeExpired: хранилище недоступно, повтор на следующем проходе: {}",
                          e.what());
        }
    }

    size_t removed = 0;
    for (const auto& keyHash : targets) {
        if (eraseLocked(keyHash)) {
            stats_.recordExpiration();
            ++removed;
        }
    }
    return removed;
}

template<typename Value, typename Codec>
CacheStats CacheManager<Value, Codec>::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.snapshot(memory_.size(), memory_.memoryUsage(), config_.maxMemoryBytes);
}

template<typename Value, typename Codec>
CacheConfig CacheManager<Value, Codec>::getConfiguration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::ensureSpaceLocked(const std::string& keyHash, size_t sizeBytes,
                                                   EvictionStrategy strategy) {
    if (sizeBytes > config_.maxMemoryBytes) {
        return false;
    }

    // Заменяемая запись освобождает своё место и не может быть жертвой
    const bool replacing = memory_.contains(keyHash);
    const size_t usage = memory_.memoryUsage() - memory_.sizeOf(keyHash).value_or(0);
    const size_t items = memory_.size() - (replacing ? 1 : 0);

    size_t bytesToFree = usage + sizeBytes > config_.maxMemoryBytes
                             ? usage + sizeBytes - config_.maxMemoryBytes
                             : 0;
    size_t itemsToFree = (config_.maxItems > 0 && items + 1 > config_.maxItems)
                             ? items + 1 - config_.maxItems
                             : 0;
    if (bytesToFree == 0 && itemsToFree == 0) {
        return true;
    }

    auto plan = planner_.plan(memory_.candidates(keyHash), strategy, bytesToFree, itemsToFree);
    if (!plan.satisfiable) {
        return false;
    }

    for (const auto& victim : plan.victims) {
        eraseLocked(victim);
        stats_.recordEviction();
        logger_->debug("Элемент вытеснен из кэша: key_hash={}", shortHash(victim));
    }
    logger_->info("CacheManager: вытеснено {} записей ({}), освобождено {} байт",
                  plan.victims.size(), toString(strategy), plan.bytesFreed);
    return true;
}

template<typename Value, typename Codec>
bool CacheManager<Value, Codec>::eraseLocked(const std::string& keyHash) {
    bool existed = memory_.erase(keyHash);
    tags_.removeEntry(keyHash);
    if (store_) {
        try {
            existed = store_->erase(keyHash) || existed;
        } catch (const StoreError& e) {
            logger_->warn("CacheManager: не удалось удалить key_hash={} из хранилища: {}",
                          shortHash(keyHash), e.what());
        }
    }
    return existed;
}

template<typename Value, typename Codec>
void CacheManager<Value, Codec>::recordStatsLocked() {
    if (!store_) {
        return;
    }
    auto stats = stats_.snapshot(memory_.size(), memory_.memoryUsage(), config_.maxMemoryBytes);
    try {
        store_->recordStat("hits", static_cast<int64_t>(stats.hits));
        store_->recordStat("misses", static_cast<int64_t>(stats.misses));
        store_->recordStat("sets", static_cast<int64_t>(stats.sets));
        store_->recordStat("deletes", static_cast<int64_t>(stats.deletes));
        store_->recordStat("evictions", static_cast<int64_t>(stats.evictions));
        store_->recordStat("expirations", static_cast<int64_t>(stats.expirations));
    } catch (const StoreError& e) {
        logger_->warn("CacheManager: снимок статистики не сохранён: {}", e.what());
    }
}

} // namespace cache
} // namespace core
} // namespace agrocache
