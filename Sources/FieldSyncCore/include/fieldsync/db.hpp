#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace fieldsync {

// One SQLite connection. Sessions on different threads may share it: every
// call holds the connection lock, and a transaction or foreign key
// suspension holds it for its whole lifetime, so statements from another
// thread never land inside someone else's transaction.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values);

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows touched by the last INSERT/UPDATE/DELETE on this connection.
    /// Only meaningful while the caller holds lock() or a transaction.
    int changes() const;

    /// Exclusive use of the connection across several calls (recursive).
    std::unique_lock<std::recursive_mutex> lock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    // Foreign key enforcement. SQLite ignores the pragma inside a transaction,
    // so toggling while one is open is an error.
    void set_foreign_keys_enabled(bool enabled);
    bool foreign_keys_enabled();

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::recursive_mutex mutex_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool completed_ = false;
};

// RAII foreign key suspension: disables enforcement for the guard's lifetime
// and restores the previous setting on scope exit.
class foreign_keys_suspended {
public:
    explicit foreign_keys_suspended(database& db);
    ~foreign_keys_suspended();

    foreign_keys_suspended(const foreign_keys_suspended&) = delete;
    foreign_keys_suspended& operator=(const foreign_keys_suspended&) = delete;

private:
    database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool was_enabled_;
};

/// "?, ?, ?" for an IN (...) clause of the given arity
std::string placeholders(size_t count);

} // namespace fieldsync
