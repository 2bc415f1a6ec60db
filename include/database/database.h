#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace coursedao {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();

    void put(const std::string& key, const std::vector<uint8_t>& value);
    void del(const std::string& key);
    void clear();
    size_t size() const;

private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Key/value store on a single sqlite table. Accepts ":memory:" as path.
class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    std::vector<uint8_t> get(const std::string& key) const;
    bool get(const std::string& key, std::vector<uint8_t>& out) const;
    bool del(const std::string& key);
    bool exists(const std::string& key) const;

    // Puts are applied before deletes; everything commits together or not at all.
    // Inside an open transaction the batch joins it as a savepoint.
    bool write(WriteBatch& batch);

    // Visits keys starting with prefix in key order until fn returns false.
    void forEach(const std::string& prefix,
                 std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t count(const std::string& prefix = "") const;

    std::string getPath() const;

    // BEGIN IMMEDIATE: takes the write lock up front, waiting out other
    // writers for the busy timeout. Transactions do not nest.
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();
    bool inTransaction() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Scoped transaction; rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool active() const { return active_; }
    bool commit();

private:
    Database& db_;
    bool active_;
};

}
}
