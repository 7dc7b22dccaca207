#include "fieldsync/db.hpp"
#include "fieldsync/log.hpp"
#include <sstream>

namespace fieldsync {

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database: " + error);
    }

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    // Dependent rows cascade with their parcel
    execute("PRAGMA foreign_keys = ON");

    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

int database::changes() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return sqlite3_changes(db_);
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table,
                               const std::vector<std::pair<std::string, column_value_t>>& values) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << col;
        first = false;
    }
    sql << ") VALUES (" << placeholders(values.size()) << ")";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare insert: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Insert into %s failed: %s", table.c_str(), err.c_str());
        throw db_error("Insert failed: " + err);
    }

    return sqlite3_last_insert_rowid(db_);
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        throw db_error("Query failed: " + error);
    }

    return results;
}

void database::begin_transaction() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    // BEGIN IMMEDIATE takes the write lock up front; the busy timeout covers contention
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(db_)));
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

void database::set_foreign_keys_enabled(bool enabled) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    if (is_in_transaction()) {
        throw db_error("Cannot toggle foreign keys inside a transaction");
    }
    execute(enabled ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
}

bool database::foreign_keys_enabled() {
    auto rows = query("PRAGMA foreign_keys");
    if (rows.empty()) return false;
    auto value = detail::row_int(rows[0], "foreign_keys");
    return value && *value != 0;
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db), lock_(db.lock()) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
    lock_.unlock();
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
    lock_.unlock();
}

// Foreign key suspension guard
foreign_keys_suspended::foreign_keys_suspended(database& db)
    : db_(db), lock_(db.lock()), was_enabled_(db.foreign_keys_enabled()) {
    db_.set_foreign_keys_enabled(false);
}

foreign_keys_suspended::~foreign_keys_suspended() {
    if (!was_enabled_) return;
    try {
        db_.set_foreign_keys_enabled(true);
    } catch (const db_error& e) {
        LOG_ERROR("db", "Failed to re-enable foreign keys: %s", e.what());
    }
}

std::string placeholders(size_t count) {
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) result += ", ";
        result += "?";
    }
    return result;
}

} // namespace fieldsync
