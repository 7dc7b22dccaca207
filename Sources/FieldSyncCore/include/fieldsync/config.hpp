#pragma once

#include "log.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace fieldsync {

// What an export session does after a chunk fails
enum class failure_policy {
    continue_session,   // record the failure and move on to the next chunk
    halt_session        // stop at the first failed chunk
};

const char* to_string(failure_policy policy);

struct sync_config {
    std::string base_url = "http://localhost:8080";

    std::string login_path = "/auth/login";
    std::string taxpayer_export_path = "/contribuables/batch";
    std::string parcel_export_path = "/parcelles/batch";
    std::string reference_data_path = "/reftypes/all";

    // Seconds
    int connect_timeout = 60;
    int read_timeout = 60;
    int write_timeout = 60;

    size_t chunk_size = 20;
    std::optional<size_t> max_chunks;
    failure_policy on_chunk_failure = failure_policy::continue_session;

    // Send a bearer token with the reference data request
    bool authenticate_reference_sync = false;

    std::string database_path = "fieldsync.db";
    // Read by the application, which passes it to set_log_level()
    log_level logging = log_level::warn;

    /// base_url joined with an endpoint path, with exactly one '/' between them
    std::string url_for(const std::string& path) const;

    /// Parse a JSON document. Missing keys keep their defaults; unknown keys
    /// are ignored. Throws config_error on malformed input.
    static sync_config from_json(const std::string& text);
};

/// Read and parse a JSON configuration file. Throws config_error.
sync_config load_config(const std::string& path);

} // namespace fieldsync
