#include "fieldsync/ledger.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

sync_ledger::sync_ledger(database& db, std::string table)
    : db_(db), table_(std::move(table)) {}

void sync_ledger::transition_to_synced(const std::vector<primary_key_t>& ids) {
    if (ids.empty()) return;

    std::vector<column_value_t> params;
    params.reserve(ids.size() + 1);
    params.push_back(utc_now_iso8601());
    for (auto id : ids) params.push_back(id);

    db_.execute(
        "UPDATE " + table_ + " SET sync_status = 1, sync_error = NULL, last_sync_at = ? "
        "WHERE id IN (" + placeholders(ids.size()) + ")",
        params);

    LOG_DEBUG("ledger", "%s: %zu rows -> synced", table_.c_str(), ids.size());
}

void sync_ledger::transition_to_failed(const std::vector<primary_key_t>& ids,
                                       const std::string& error_message) {
    if (ids.empty()) return;

    std::vector<column_value_t> params;
    params.reserve(ids.size() + 2);
    params.push_back(error_message);
    params.push_back(utc_now_iso8601());
    for (auto id : ids) params.push_back(id);

    db_.execute(
        "UPDATE " + table_ + " SET sync_status = 2, sync_error = ?, "
        "sync_attempts = sync_attempts + 1, last_sync_at = ? "
        "WHERE id IN (" + placeholders(ids.size()) + ")",
        params);

    LOG_DEBUG("ledger", "%s: %zu rows -> failed (%s)",
              table_.c_str(), ids.size(), error_message.c_str());
}

std::vector<row_t> sync_ledger::select_pending(size_t limit, const std::optional<cursor>& after) {
    if (limit == 0) return {};

    std::string sql = "SELECT * FROM " + table_ + " WHERE sync_status != 1";
    std::vector<column_value_t> params;
    if (after) {
        sql += " AND (COALESCE(created_at, ''), id) > (?, ?)";
        params.push_back(after->created_at);
        params.push_back(after->id);
    }
    sql += " ORDER BY COALESCE(created_at, '') ASC, id ASC LIMIT ?";
    params.push_back(static_cast<int64_t>(limit));

    return db_.query(sql, params);
}

sync_ledger::cursor sync_ledger::cursor_of(const row_t& row) {
    cursor position;
    position.created_at = detail::row_text(row, "created_at").value_or("");
    position.id = detail::row_int(row, "id").value_or(0);
    return position;
}

std::vector<primary_key_t> sync_ledger::select_synced(size_t limit) {
    auto rows = db_.query(
        "SELECT id FROM " + table_ + " WHERE sync_status = 1 ORDER BY id ASC LIMIT ?",
        {static_cast<int64_t>(limit)});

    std::vector<primary_key_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        if (auto id = detail::row_int(row, "id")) ids.push_back(*id);
    }
    return ids;
}

size_t sync_ledger::count_pending() {
    auto rows = db_.query("SELECT COUNT(*) AS count FROM " + table_ + " WHERE sync_status != 1");
    if (rows.empty()) return 0;
    return static_cast<size_t>(detail::row_int(rows[0], "count").value_or(0));
}

std::optional<ledger_fields> sync_ledger::fields_of(primary_key_t id) {
    auto rows = db_.query(
        "SELECT sync_status, sync_error, sync_attempts, last_sync_at FROM " + table_ + " WHERE id = ?",
        {id});
    if (rows.empty()) return std::nullopt;
    return from_row(rows[0]);
}

ledger_fields sync_ledger::from_row(const row_t& row) {
    ledger_fields fields;

    auto raw_status = detail::row_int(row, "sync_status").value_or(0);
    auto status = sync_status_from_int(raw_status);
    if (!status) {
        throw db_error("Unknown sync_status value: " + std::to_string(raw_status));
    }
    fields.status = *status;
    fields.error = detail::row_text(row, "sync_error");
    fields.attempts = detail::row_int(row, "sync_attempts").value_or(0);
    fields.last_sync_at = detail::row_text(row, "last_sync_at");
    return fields;
}

} // namespace fieldsync
