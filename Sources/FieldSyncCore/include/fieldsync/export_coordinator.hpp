#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "record_store.hpp"
#include "session_gate.hpp"
#include "transfer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

struct export_summary {
    enum class outcome_kind {
        nothing_to_do,  // no pending records
        complete,       // every attempted record synced
        partial,        // some synced, some failed
        failed          // nothing synced
    };

    size_t synced_count = 0;
    size_t failed_count = 0;
    size_t chunk_count = 0;
    bool aborted = false;                  // stopped on a rejected credential
    std::optional<std::string> last_error;

    outcome_kind outcome() const;
    bool success() const { return failed_count == 0 && !aborted; }
};

const char* to_string(export_summary::outcome_kind outcome);

// ============================================================================
// export_traits - what the coordinator needs to know about a record type
// ============================================================================

template <typename Record>
struct export_traits;

template <>
struct export_traits<taxpayer_record> {
    static constexpr entity_kind kind = entity_kind::taxpayer;
    static constexpr const char* table = "contribuables";

    static std::vector<taxpayer_record> decode(record_store& store, const std::vector<row_t>& rows);
    static std::vector<taxpayer_record> fetch(record_store& store, const std::vector<primary_key_t>& ids);
};

template <>
struct export_traits<parcel_record> {
    static constexpr entity_kind kind = entity_kind::parcel;
    static constexpr const char* table = "parcelles";

    static std::vector<parcel_record> decode(record_store& store, const std::vector<row_t>& rows);
    static std::vector<parcel_record> fetch(record_store& store, const std::vector<primary_key_t>& ids);
};

// ============================================================================
// export_coordinator - drives one export session for one record type
// ============================================================================
//
// select pending chunk -> transfer -> mark synced + purge, or mark failed.
// Records that fail during a session are not selected again by that session.
// Storage errors propagate; transfer failures never do.

template <typename Record>
class export_coordinator {
public:
    using traits = export_traits<Record>;

    export_coordinator(record_store& store,
                       transfer_protocol& transfer,
                       authenticator& auth,
                       session_gate& gate,
                       failure_policy policy = failure_policy::continue_session);

    /// Throws session_busy_error, authentication_error, db_error, or
    /// fieldsync::error when chunk_size is 0.
    export_summary export_all(size_t chunk_size,
                              std::optional<size_t> max_chunks = std::nullopt);

    void set_failure_policy(failure_policy policy) { policy_ = policy; }
    failure_policy get_failure_policy() const { return policy_; }

private:
    record_store& store_;
    transfer_protocol& transfer_;
    authenticator& auth_;
    session_gate& gate_;
    failure_policy policy_;

    // Rows accepted remotely by an earlier session that never got purged
    size_t purge_leftovers(size_t batch_size);
};

extern template class export_coordinator<taxpayer_record>;
extern template class export_coordinator<parcel_record>;

using taxpayer_exporter = export_coordinator<taxpayer_record>;
using parcel_exporter = export_coordinator<parcel_record>;

} // namespace fieldsync
