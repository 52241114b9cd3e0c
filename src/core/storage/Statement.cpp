#include "agrocache/core/storage/Statement.hpp"
#include "agrocache/core/storage/Database.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/logging/Logger.hpp"

namespace agrocache {
namespace core {
namespace storage {

Statement::Statement(Database& db, const std::string& sql)
    : db(db), stmt(nullptr, sqlite3_finalize), sql(sql) {
    sqlite3_stmt* raw_stmt = nullptr;
    int result = sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw_stmt, nullptr);
    stmt.reset(raw_stmt);

    if (result != SQLITE_OK) {
        std::string error = "Failed to prepare SQL statement: ";
        error += sqlite3_errmsg(db.get());
        logging::get()->error("{} [{}]", error, sql);
        throw cache::StoreError(error);
    }
}

void Statement::check(int result, const char* what) const {
    if (result != SQLITE_OK) {
        std::string error = std::string("Failed to ") + what + ": " + sqlite3_errmsg(db.get());
        logging::get()->error("{} [{}]", error, sql);
        throw cache::StoreError(error);
    }
}

Statement& Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt.get(), index, value), "bind int64 parameter");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    // SQLITE_TRANSIENT: SQLite копирует данные
    check(sqlite3_bind_text64(stmt.get(), index, value.c_str(),
                              static_cast<sqlite3_uint64>(value.size()), SQLITE_TRANSIENT, SQLITE_UTF8),
          "bind text parameter");
    return *this;
}

Statement& Statement::bind(int index, const std::vector<uint8_t>& value) {
    if (value.empty()) {
        check(sqlite3_bind_zeroblob(stmt.get(), index, 0), "bind blob parameter");
        return *this;
    }
    check(sqlite3_bind_blob64(stmt.get(), index, value.data(),
                              static_cast<sqlite3_uint64>(value.size()), SQLITE_TRANSIENT),
          "bind blob parameter");
    return *this;
}

Statement& Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt.get(), index), "bind NULL parameter");
    return *this;
}

void Statement::execute() {
    int result = sqlite3_step(stmt.get());
    if (result != SQLITE_DONE && result != SQLITE_ROW) {
        std::string error = "Failed to execute statement: ";
        error += sqlite3_errmsg(db.get());
        logging::get()->error("{} [{}]", error, sql);
        throw cache::StoreError(error);
    }
}

bool Statement::step() {
    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result != SQLITE_DONE) {
        std::string error = "Failed to step statement: ";
        error += sqlite3_errmsg(db.get());
        logging::get()->error("{} [{}]", error, sql);
        throw cache::StoreError(error);
    }
    return false;
}

Statement& Statement::reset() {
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    return *this;
}

int64_t Statement::getInt64(int index) const {
    return sqlite3_column_int64(stmt.get(), index);
}

std::string Statement::getText(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt.get(), index);
    if (!text) {
        return "";
    }
    int size = sqlite3_column_bytes(stmt.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::vector<uint8_t> Statement::getBlob(int index) const {
    const void* blob = sqlite3_column_blob(stmt.get(), index);
    int size = sqlite3_column_bytes(stmt.get(), index);
    if (!blob || size <= 0) {
        return {};
    }
    const uint8_t* data = static_cast<const uint8_t*>(blob);
    return std::vector<uint8_t>(data, data + size);
}

bool Statement::isNull(int index) const {
    return sqlite3_column_type(stmt.get(), index) == SQLITE_NULL;
}

} // namespace storage
} // namespace core
} // namespace agrocache
