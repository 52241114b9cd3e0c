#pragma once

namespace agrocache {
namespace core {
namespace storage {

class Database;

// Transaction: BEGIN в конструкторе, ROLLBACK в деструкторе без commit()
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();   // Бросает StoreError
    void rollback(); // Бросает StoreError

private:
    Database& db;
    bool committed = false;
    bool rolledBack = false;
};

} // namespace storage
} // namespace core
} // namespace agrocache
