#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "db.hpp"
#include "export_coordinator.hpp"
#include "network.hpp"
#include "record_store.hpp"
#include "reference_sync.hpp"
#include "scheduler.hpp"
#include "session_gate.hpp"
#include "transfer.hpp"
#include <functional>
#include <optional>
#include <string>

namespace fieldsync {

struct pending_summary {
    size_t taxpayers = 0;
    size_t parcels = 0;

    size_t total() const { return taxpayers + parcels; }
};

// ============================================================================
// sync_service - entry point for the application's sync screen
// ============================================================================
//
// Wires store, authenticator, transfer protocol, exporters and the reference
// resynchronizer around one database connection and one HTTP client, both
// owned by the caller. The schema is created on construction.

class sync_service {
public:
    using export_handler = std::function<void(export_summary)>;
    using reference_handler = std::function<void(reference_sync_result)>;
    using on_error_handler = std::function<void(const std::string& error)>;

    sync_service(database& db, http_client& client, credential_store& credentials,
                 sync_config config = {});

    sync_service(const sync_service&) = delete;
    sync_service& operator=(const sync_service&) = delete;

    // Blocking sessions. chunk_size defaults to the configured one.
    export_summary export_taxpayers(std::optional<size_t> chunk_size = std::nullopt);
    export_summary export_parcels(std::optional<size_t> chunk_size = std::nullopt);
    reference_sync_result synchronize_reference_data();

    // Run on `worker`, deliver the result (or the error) on `callback`.
    void export_taxpayers_async(scheduler& worker, scheduler& callback, export_handler handler);
    void export_parcels_async(scheduler& worker, scheduler& callback, export_handler handler);
    void synchronize_reference_data_async(scheduler& worker, scheduler& callback,
                                          reference_handler handler);

    /// Receives session-level errors (busy, authentication, storage) from
    /// the async variants.
    void set_on_error(on_error_handler handler) { on_error_ = std::move(handler); }

    pending_summary pending_counts();

    record_store& store() { return store_; }
    session_gate& gate() { return gate_; }
    const sync_config& config() const { return config_; }

    void set_failure_policy(failure_policy policy);

private:
    sync_config config_;
    record_store store_;
    session_gate gate_;
    authenticator auth_;
    transfer_protocol transfer_;
    taxpayer_exporter taxpayer_exporter_;
    parcel_exporter parcel_exporter_;
    reference_sync reference_sync_;
    on_error_handler on_error_;

    template <typename Result, typename Session>
    void run_async(scheduler& worker, scheduler& callback,
                   Session session, std::function<void(Result)> handler);
};

} // namespace fieldsync
