#pragma once

#include "db.hpp"
#include "records.hpp"
#include <string>
#include <vector>
#include <optional>

namespace fieldsync {

// ============================================================================
// sync_ledger - per-row sync state machine embedded in a syncable table
// ============================================================================
//
// Columns: sync_status, sync_error, sync_attempts, last_sync_at.
//
//   pending --(chunk accepted)--> synced --(cleanup)--> row deleted
//   pending --(chunk failed)----> failed --(next session)--> selected again
//
// Every transition is a single bulk UPDATE over the given ids.

class sync_ledger {
public:
    // Position in the export order (created_at, id)
    struct cursor {
        std::string created_at;
        primary_key_t id = 0;
    };

    sync_ledger(database& db, std::string table);

    const std::string& table() const { return table_; }

    void transition_to_synced(const std::vector<primary_key_t>& ids);

    void transition_to_failed(const std::vector<primary_key_t>& ids,
                              const std::string& error_message);

    /// Rows not yet synced, oldest first (created_at, id). At most `limit` rows,
    /// all strictly after `after` when given.
    std::vector<row_t> select_pending(size_t limit,
                                      const std::optional<cursor>& after = std::nullopt);

    /// Cursor positioned on a row returned by select_pending
    static cursor cursor_of(const row_t& row);

    /// Ids of rows already marked synced (accepted remotely, not yet purged).
    std::vector<primary_key_t> select_synced(size_t limit);

    size_t count_pending();

    std::optional<ledger_fields> fields_of(primary_key_t id);

    /// Decode the ledger columns of a row. Throws db_error on an unknown status.
    static ledger_fields from_row(const row_t& row);

private:
    database& db_;
    std::string table_;
};

} // namespace fieldsync
