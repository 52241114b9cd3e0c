#include "agrocache/core/storage/Transaction.hpp"
#include "agrocache/core/storage/Database.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/logging/Logger.hpp"

namespace agrocache {
namespace core {
namespace storage {

Transaction::Transaction(Database& db) : db(db) {
    db.execute("BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
    if (!committed && !rolledBack) {
        try {
            rollback();
        } catch (const std::exception& e) {
            logging::get()->error("Failed to auto-rollback transaction in destructor: {}", e.what());
        }
    }
}

void Transaction::commit() {
    if (committed || rolledBack) {
        throw cache::StoreError("Transaction already committed or rolled back");
    }
    db.execute("COMMIT;");
    committed = true;
}

void Transaction::rollback() {
    if (committed || rolledBack) {
        throw cache::StoreError("Transaction already committed or rolled back");
    }
    rolledBack = true;
    db.execute("ROLLBACK;");
}

} // namespace storage
} // namespace core
} // namespace agrocache
