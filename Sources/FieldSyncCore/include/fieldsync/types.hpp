#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <unordered_map>

namespace fieldsync {

// Timestamp type (wall clock, rendered as ISO-8601 UTC text in storage)
using timestamp_t = std::chrono::system_clock::time_point;

// Primary key type (SQLite rowid)
using primary_key_t = int64_t;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

using row_t = std::unordered_map<std::string, column_value_t>;

// ============================================================================
// Sync ledger status - persisted as a small integer
// ============================================================================

enum class sync_status : int {
    pending = 0,
    synced = 1,
    failed = 2
};

const char* to_string(sync_status status);

/// Decode the persisted integer. Returns nullopt for values outside the enum.
std::optional<sync_status> sync_status_from_int(int64_t value);

// Entity kinds that own an export session
enum class entity_kind {
    taxpayer,
    parcel
};

const char* to_string(entity_kind kind);

// ============================================================================
// Timestamp helpers
// ============================================================================

/// "2024-01-01T12:30:45.123Z"
std::string to_iso8601(timestamp_t tp);

inline std::string utc_now_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

// ============================================================================
// Row accessors (tolerant of NULL and of numeric affinity differences)
// ============================================================================

namespace detail {

    inline std::optional<std::string> row_text(const row_t& row, const std::string& key) {
        auto it = row.find(key);
        if (it != row.end() && std::holds_alternative<std::string>(it->second)) {
            return std::get<std::string>(it->second);
        }
        return std::nullopt;
    }

    inline std::optional<int64_t> row_int(const row_t& row, const std::string& key) {
        auto it = row.find(key);
        if (it == row.end()) return std::nullopt;
        if (std::holds_alternative<int64_t>(it->second)) {
            return std::get<int64_t>(it->second);
        }
        if (std::holds_alternative<double>(it->second)) {
            return static_cast<int64_t>(std::get<double>(it->second));
        }
        return std::nullopt;
    }

    inline std::optional<double> row_real(const row_t& row, const std::string& key) {
        auto it = row.find(key);
        if (it == row.end()) return std::nullopt;
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int64_t>(it->second)) {
            return static_cast<double>(std::get<int64_t>(it->second));
        }
        return std::nullopt;
    }

    // Optional C++ values to column values
    inline column_value_t to_column_value(const std::optional<std::string>& v) {
        if (!v) return nullptr;
        return *v;
    }
    inline column_value_t to_column_value(const std::optional<int64_t>& v) {
        if (!v) return nullptr;
        return *v;
    }
    inline column_value_t to_column_value(const std::optional<double>& v) {
        if (!v) return nullptr;
        return *v;
    }

} // namespace detail

} // namespace fieldsync
