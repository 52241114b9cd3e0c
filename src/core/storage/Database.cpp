#include "agrocache/core/storage/Database.hpp"
#include "agrocache/core/storage/Statement.hpp"
#include "agrocache/core/storage/Transaction.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/logging/Logger.hpp"

namespace agrocache {
namespace core {
namespace storage {

Database::Database(const std::string& path, int flags)
    : db(nullptr, sqlite3_close), path_(path) {
    sqlite3* raw_db = nullptr;
    int result = sqlite3_open_v2(path.c_str(), &raw_db, flags, nullptr);
    db.reset(raw_db);

    if (result != SQLITE_OK) {
        std::string error_msg = "Can't open database " + path + ": ";
        if (raw_db) {
            error_msg += sqlite3_errmsg(raw_db);
        } else {
            error_msg += "Unknown error";
        }
        logging::get()->error("{}", error_msg);
        throw cache::StoreError(error_msg);
    }

    sqlite3_busy_timeout(db.get(), 5000);
    valid.store(true);
    try {
        execute("PRAGMA foreign_keys = ON;");
        execute("PRAGMA journal_mode = WAL;");
        execute("PRAGMA synchronous = NORMAL;");
        logging::get()->info("Database opened successfully: {}", path);
    } catch (const std::exception& e) {
        valid.store(false);
        logging::get()->error("Failed to configure database {}: {}", path, e.what());
        throw;
    }
}

Database::~Database() {
    try {
        if (valid.load()) {
            execute("PRAGMA optimize;");
        }
    } catch (const std::exception& e) {
        logging::get()->warn("Error during database cleanup: {}", e.what());
    }
    valid.store(false);
}

sqlite3* Database::get() {
    if (!valid.load()) {
        throw cache::StoreError("Attempted to use an invalid database connection");
    }
    return db.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = "SQL Error: ";
        if (errMsg) {
            error += errMsg;
            sqlite3_free(errMsg);
        } else {
            error += "Unknown error";
        }
        logging::get()->error("{} [{}]", error, sql);
        throw cache::StoreError(error);
    }
}

bool Database::isValid() const noexcept { return valid.load(); }

} // namespace storage
} // namespace core
} // namespace agrocache
