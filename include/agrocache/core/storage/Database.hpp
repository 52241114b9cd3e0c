#pragma once
#include <sqlite3.h>
#include <atomic>
#include <memory>
#include <string>

namespace agrocache {
namespace core {
namespace storage {

class Statement;
class Transaction;

// Database: RAII-обёртка соединения SQLite
class Database {
public:
    /**
     * @brief Открывает (или создаёт) базу SQLite.
     * @param path Путь к файлу базы (":memory:" для временной базы)
     * @throws StoreError если базу не удалось открыть или настроить
     */
    explicit Database(const std::string& path,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* get();

    /**
     * @brief Подготавливает выражение.
     * @throws StoreError при ошибке подготовки
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Начинает транзакцию; откат в деструкторе, если не было commit().
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Выполняет SQL без результата.
     * @throws StoreError при ошибке выполнения
     */
    void execute(const std::string& sql);

    bool isValid() const noexcept;
    const std::string& path() const noexcept { return path_; }

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr, sqlite3_close};
    std::atomic<bool> valid{false};
    std::string path_;
};

} // namespace storage
} // namespace core
} // namespace agrocache
