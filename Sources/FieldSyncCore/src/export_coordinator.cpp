#include "fieldsync/export_coordinator.hpp"
#include "fieldsync/cleanup.hpp"
#include "fieldsync/ledger.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

export_summary::outcome_kind export_summary::outcome() const {
    if (synced_count == 0 && failed_count == 0) return outcome_kind::nothing_to_do;
    if (failed_count == 0 && !aborted) return outcome_kind::complete;
    if (synced_count > 0) return outcome_kind::partial;
    return outcome_kind::failed;
}

const char* to_string(export_summary::outcome_kind outcome) {
    switch (outcome) {
        case export_summary::outcome_kind::nothing_to_do: return "nothing_to_do";
        case export_summary::outcome_kind::complete: return "complete";
        case export_summary::outcome_kind::partial: return "partial";
        case export_summary::outcome_kind::failed: return "failed";
    }
    return "unknown";
}

// ============================================================================
// Traits
// ============================================================================

std::vector<taxpayer_record> export_traits<taxpayer_record>::decode(record_store&,
                                                                    const std::vector<row_t>& rows) {
    std::vector<taxpayer_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(record_store::taxpayer_from_row(row));
    }
    return records;
}

std::vector<taxpayer_record> export_traits<taxpayer_record>::fetch(record_store& store,
                                                                   const std::vector<primary_key_t>& ids) {
    return store.taxpayers(ids);
}

std::vector<parcel_record> export_traits<parcel_record>::decode(record_store& store,
                                                                const std::vector<row_t>& rows) {
    std::vector<parcel_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        auto parcel = record_store::parcel_from_row(row);
        store.load_dependents(parcel);
        records.push_back(std::move(parcel));
    }
    return records;
}

std::vector<parcel_record> export_traits<parcel_record>::fetch(record_store& store,
                                                               const std::vector<primary_key_t>& ids) {
    return store.parcels(ids);
}

// ============================================================================
// export_coordinator
// ============================================================================

template <typename Record>
export_coordinator<Record>::export_coordinator(record_store& store,
                                               transfer_protocol& transfer,
                                               authenticator& auth,
                                               session_gate& gate,
                                               failure_policy policy)
    : store_(store), transfer_(transfer), auth_(auth), gate_(gate), policy_(policy) {}

template <typename Record>
size_t export_coordinator<Record>::purge_leftovers(size_t batch_size) {
    sync_ledger ledger(store_.db(), traits::table);
    record_cleanup cleanup(store_.db());

    size_t purged = 0;
    for (;;) {
        auto ids = ledger.select_synced(batch_size);
        if (ids.empty()) break;
        auto report = cleanup.purge(traits::fetch(store_, ids));
        if (report.rows_deleted == 0) break;
        purged += report.rows_deleted;
    }
    if (purged > 0) {
        LOG_INFO("export", "Purged %zu %s rows left synced by an earlier session",
                 purged, traits::table);
    }
    return purged;
}

template <typename Record>
export_summary export_coordinator<Record>::export_all(size_t chunk_size,
                                                      std::optional<size_t> max_chunks) {
    if (chunk_size == 0) {
        throw error("chunk_size must be positive");
    }

    auto lease = gate_.enter_export(traits::kind);
    auto token = auth_.authenticate();

    purge_leftovers(chunk_size);

    sync_ledger ledger(store_.db(), traits::table);
    record_cleanup cleanup(store_.db());
    // Rows behind the cursor were attempted this session; failed ones wait
    // for the next session
    std::optional<sync_ledger::cursor> after;
    export_summary summary;

    LOG_INFO("export", "Starting %s export: %zu pending, chunk size %zu",
             to_string(traits::kind), ledger.count_pending(), chunk_size);

    while (!max_chunks || summary.chunk_count < *max_chunks) {
        auto rows = ledger.select_pending(chunk_size, after);
        if (rows.empty()) break;
        after = sync_ledger::cursor_of(rows.back());

        auto records = traits::decode(store_, rows);
        std::vector<primary_key_t> ids;
        ids.reserve(records.size());
        for (const auto& record : records) {
            ids.push_back(record.id);
        }
        ++summary.chunk_count;

        auto result = transfer_.transfer(records, token);
        bool stop = false;

        switch (result.status) {
            case transfer_status::accepted:
                ledger.transition_to_synced(ids);
                cleanup.purge(records);
                summary.synced_count += ids.size();
                LOG_DEBUG("export", "Chunk %zu accepted (%zu records)", summary.chunk_count, ids.size());
                break;

            case transfer_status::credential_expired:
                ledger.transition_to_failed(ids, result.message);
                summary.failed_count += ids.size();
                summary.last_error = result.message;
                summary.aborted = true;
                stop = true;
                LOG_ERROR("export", "Session aborted: %s", result.message.c_str());
                break;

            case transfer_status::rejected:
            case transfer_status::transport_failed:
            case transfer_status::malformed_payload:
                ledger.transition_to_failed(ids, result.message);
                summary.failed_count += ids.size();
                summary.last_error = result.message;
                stop = policy_ == failure_policy::halt_session;
                break;
        }

        if (stop || rows.size() < chunk_size) break;
    }

    LOG_INFO("export", "%s export finished (%s): %zu synced, %zu failed in %zu chunks",
             to_string(traits::kind), to_string(summary.outcome()),
             summary.synced_count, summary.failed_count, summary.chunk_count);
    return summary;
}

template class export_coordinator<taxpayer_record>;
template class export_coordinator<parcel_record>;

} // namespace fieldsync
