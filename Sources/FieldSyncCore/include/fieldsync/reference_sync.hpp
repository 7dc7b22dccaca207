#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "network.hpp"
#include "record_store.hpp"
#include "session_gate.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fieldsync {

// Fetched reference rows keyed by local table name
struct reference_payload {
    std::map<std::string, std::vector<reference_row>> tables;

    size_t row_count() const;
};

struct reference_sync_result {
    bool success = false;
    std::string message;
    std::map<std::string, size_t> counts;   // rows written per table
};

/// Decode the reference endpoint body. Rows without a usable id or with a
/// blank label are dropped, labels are trimmed, absent lists are empty.
/// Throws fieldsync::error when the body is not a JSON object.
reference_payload parse_reference_payload(const std::string& body);

// ============================================================================
// reference_sync - wholesale replacement of the lookup tables
// ============================================================================
//
// Foreign key enforcement is suspended for the swap so that records pointing
// at reference ids keep their values; the delete and every insert run in one
// transaction, so readers see either the old tables or the new ones.

class reference_sync {
public:
    enum class phase {
        cleared,          // all reference tables emptied, nothing inserted yet
        table_written     // one table refilled
    };

    using phase_observer = std::function<void(phase, const std::string& table)>;

    /// `auth` may be null when the reference endpoint is public.
    reference_sync(record_store& store,
                   http_client& client,
                   const sync_config& config,
                   session_gate& gate,
                   authenticator* auth = nullptr);

    /// Fetch and replace. Failures come back as success == false; only
    /// session_busy_error is thrown.
    reference_sync_result synchronize();

    /// Replace every reference table with the payload. Throws db_error and
    /// leaves the old rows in place on failure.
    std::map<std::string, size_t> replace_all(const reference_payload& payload);

    void set_phase_observer(phase_observer observer) { on_phase_ = std::move(observer); }

private:
    record_store& store_;
    http_client& client_;
    const sync_config& config_;
    session_gate& gate_;
    authenticator* auth_;
    phase_observer on_phase_;
};

} // namespace fieldsync
