#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "network.hpp"
#include "records.hpp"
#include <string>
#include <vector>

namespace fieldsync {

enum class transfer_status {
    accepted,            // 2xx, the whole chunk is durable remotely
    rejected,            // non-2xx answer from the backend
    credential_expired,  // 401/403 on the export endpoint
    transport_failed,    // no answer (connect error, timeout)
    malformed_payload    // the request body could not be built
};

const char* to_string(transfer_status status);

struct transfer_result {
    transfer_status status = transfer_status::accepted;
    int http_status = 0;
    std::string message;

    bool accepted() const { return status == transfer_status::accepted; }
};

// A binary attachment and the record it belongs to
struct attachment_ref {
    primary_key_t owner_id = 0;
    std::string path;
};

// Everything one export request needs, built before any I/O
struct chunk_payload {
    std::string endpoint;                    // path relative to base_url
    std::string data;                        // JSON array of record DTOs
    std::vector<attachment_ref> attachments;
    std::vector<primary_key_t> ids;
};

// Payload builders. Throw payload_error when a record cannot be encoded.
chunk_payload make_payload(const std::vector<taxpayer_record>& records, const sync_config& config);
chunk_payload make_payload(const std::vector<parcel_record>& records, const sync_config& config);

/// Multipart part name carrying the files of one record
std::string attachment_part_name(primary_key_t owner_id);

/// File name component of a path with quotes and control characters
/// replaced by '_' ("file" when the path has none)
std::string filename_of(const std::string& path);

// ============================================================================
// transfer_protocol - one multipart POST per chunk
// ============================================================================

class transfer_protocol {
public:
    transfer_protocol(http_client& client, const sync_config& config);

    template <typename Record>
    transfer_result transfer(const std::vector<Record>& records, const std::string& token) {
        chunk_payload payload;
        try {
            payload = make_payload(records, config_);
        } catch (const payload_error& e) {
            return {transfer_status::malformed_payload, 0, e.what()};
        }
        return send_chunk(payload, token);
    }

    transfer_result send_chunk(const chunk_payload& payload, const std::string& token);

private:
    http_client& client_;
    const sync_config& config_;

    static transfer_result classify(const http_response& response);
};

} // namespace fieldsync
