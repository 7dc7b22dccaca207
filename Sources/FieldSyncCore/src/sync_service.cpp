#include "fieldsync/sync_service.hpp"
#include "fieldsync/ledger.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

sync_service::sync_service(database& db, http_client& client, credential_store& credentials,
                           sync_config config)
    : config_(std::move(config))
    , store_(db)
    , auth_(client, config_, credentials)
    , transfer_(client, config_)
    , taxpayer_exporter_(store_, transfer_, auth_, gate_, config_.on_chunk_failure)
    , parcel_exporter_(store_, transfer_, auth_, gate_, config_.on_chunk_failure)
    , reference_sync_(store_, client, config_, gate_,
                      config_.authenticate_reference_sync ? &auth_ : nullptr)
{
    store_.ensure_schema();
}

export_summary sync_service::export_taxpayers(std::optional<size_t> chunk_size) {
    return taxpayer_exporter_.export_all(chunk_size.value_or(config_.chunk_size), config_.max_chunks);
}

export_summary sync_service::export_parcels(std::optional<size_t> chunk_size) {
    return parcel_exporter_.export_all(chunk_size.value_or(config_.chunk_size), config_.max_chunks);
}

reference_sync_result sync_service::synchronize_reference_data() {
    return reference_sync_.synchronize();
}

template <typename Result, typename Session>
void sync_service::run_async(scheduler& worker, scheduler& callback,
                             Session session, std::function<void(Result)> handler) {
    worker.invoke([this, &callback, session = std::move(session), handler = std::move(handler)]() {
        try {
            Result result = session();
            callback.invoke([handler, result = std::move(result)]() {
                if (handler) handler(result);
            });
        } catch (const std::exception& e) {
            std::string message = e.what();
            LOG_ERROR("export", "Session failed: %s", message.c_str());
            auto on_error = on_error_;
            callback.invoke([on_error, message]() {
                if (on_error) on_error(message);
            });
        }
    });
}

void sync_service::export_taxpayers_async(scheduler& worker, scheduler& callback,
                                          export_handler handler) {
    run_async<export_summary>(worker, callback,
                              [this] { return export_taxpayers(); }, std::move(handler));
}

void sync_service::export_parcels_async(scheduler& worker, scheduler& callback,
                                        export_handler handler) {
    run_async<export_summary>(worker, callback,
                              [this] { return export_parcels(); }, std::move(handler));
}

void sync_service::synchronize_reference_data_async(scheduler& worker, scheduler& callback,
                                                    reference_handler handler) {
    run_async<reference_sync_result>(worker, callback,
                                     [this] { return synchronize_reference_data(); },
                                     std::move(handler));
}

pending_summary sync_service::pending_counts() {
    pending_summary counts;
    counts.taxpayers = sync_ledger(store_.db(), export_traits<taxpayer_record>::table).count_pending();
    counts.parcels = sync_ledger(store_.db(), export_traits<parcel_record>::table).count_pending();
    return counts;
}

void sync_service::set_failure_policy(failure_policy policy) {
    config_.on_chunk_failure = policy;
    taxpayer_exporter_.set_failure_policy(policy);
    parcel_exporter_.set_failure_policy(policy);
}

} // namespace fieldsync
