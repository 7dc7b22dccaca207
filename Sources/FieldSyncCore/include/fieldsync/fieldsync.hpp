#pragma once

// FieldSync - offline field records export and reference data sync
//
// Usage:
//   #include <fieldsync/fieldsync.hpp>
//
//   int main() {
//       auto config = fieldsync::load_config("fieldsync.json");
//       fieldsync::set_log_level(config.logging);
//       fieldsync::database db(config.database_path);
//       fieldsync::httplib_client http(config);       // FieldSyncHttp
//       fieldsync::memory_credential_store creds(fieldsync::credentials{"agent@example.org", "secret"});
//
//       fieldsync::sync_service sync(db, http, creds, config);
//       sync.synchronize_reference_data();
//       auto summary = sync.export_taxpayers();
//       std::printf("%zu synced, %zu failed\n", summary.synced_count, summary.failed_count);
//   }

#include "log.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "db.hpp"
#include "records.hpp"
#include "record_store.hpp"
#include "ledger.hpp"
#include "cleanup.hpp"
#include "network.hpp"
#include "credentials.hpp"
#include "transfer.hpp"
#include "session_gate.hpp"
#include "export_coordinator.hpp"
#include "reference_sync.hpp"
#include "scheduler.hpp"
#include "sync_service.hpp"
