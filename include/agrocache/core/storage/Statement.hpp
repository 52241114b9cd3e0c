#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace agrocache {
namespace core {
namespace storage {

class Database;

// Statement: подготовленное выражение SQLite. Все ошибки -> StoreError.
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement() = default;

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Параметры нумеруются с 1
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const std::vector<uint8_t>& value);
    Statement& bindNull(int index);

    // Выполняет выражение без результата
    void execute();

    // true, если получена очередная строка
    bool step();

    // Сбрасывает выражение и привязки для повторного использования
    Statement& reset();

    // Колонки нумеруются с 0
    int64_t getInt64(int index) const;
    std::string getText(int index) const;
    std::vector<uint8_t> getBlob(int index) const;
    bool isNull(int index) const;

    const std::string& getSql() const { return sql; }

private:
    void check(int result, const char* what) const;

    Database& db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{nullptr, sqlite3_finalize};
    std::string sql;
};

} // namespace storage
} // namespace core
} // namespace agrocache
