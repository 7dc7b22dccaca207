#include "fieldsync/reference_sync.hpp"
#include "fieldsync/log.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace fieldsync {

using json = nlohmann::json;

namespace {

// Response key -> local table
const std::pair<const char*, const char*> k_reference_keys[] = {
    {"typeActivites", "ref_type_activite"},
    {"zoneTypes", "ref_zone_type"},
    {"communes", "ref_commune"},
    {"quartiers", "ref_quartier"},
    {"avenues", "ref_avenue"}
};

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<int64_t> parse_id(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        auto text = trim(value.get<std::string>());
        if (text.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0') return std::nullopt;
        return static_cast<int64_t>(parsed);
    }
    return std::nullopt;
}

std::vector<reference_row> parse_rows(const json& list) {
    std::vector<reference_row> rows;
    if (!list.is_array()) return rows;

    for (const auto& item : list) {
        if (!item.is_object()) continue;

        auto id_it = item.find("id");
        auto label_it = item.find("libelle");
        if (id_it == item.end() || label_it == item.end()) continue;
        if (id_it->is_null() || label_it->is_null()) continue;

        auto id = parse_id(*id_it);
        auto label = trim(label_it->is_string() ? label_it->get<std::string>() : label_it->dump());
        if (!id || label.empty()) continue;

        rows.push_back({*id, label});
    }
    return rows;
}

} // namespace

size_t reference_payload::row_count() const {
    size_t total = 0;
    for (const auto& [table, rows] : tables) {
        total += rows.size();
    }
    return total;
}

reference_payload parse_reference_payload(const std::string& body) {
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw error("Invalid reference data response format");
    }

    reference_payload payload;
    for (const auto& [key, table] : k_reference_keys) {
        auto it = doc.find(key);
        payload.tables[table] = it == doc.end() ? std::vector<reference_row>{} : parse_rows(*it);
    }
    return payload;
}

// ============================================================================
// reference_sync
// ============================================================================

reference_sync::reference_sync(record_store& store,
                               http_client& client,
                               const sync_config& config,
                               session_gate& gate,
                               authenticator* auth)
    : store_(store), client_(client), config_(config), gate_(gate), auth_(auth) {}

std::map<std::string, size_t> reference_sync::replace_all(const reference_payload& payload) {
    auto& db = store_.db();
    std::map<std::string, size_t> counts;

    foreign_keys_suspended fk_guard(db);
    transaction tx(db);

    for (const char* table : reference_tables) {
        db.execute(std::string("DELETE FROM ") + table);
    }
    if (on_phase_) on_phase_(phase::cleared, {});

    for (const char* table : reference_tables) {
        size_t written = 0;
        auto it = payload.tables.find(table);
        if (it != payload.tables.end()) {
            for (const auto& row : it->second) {
                store_.add_reference_row(table, row);
                ++written;
            }
        }
        counts[table] = written;
        if (on_phase_) on_phase_(phase::table_written, table);
    }

    tx.commit();
    return counts;
}

reference_sync_result reference_sync::synchronize() {
    auto lease = gate_.enter_reference_sync();
    reference_sync_result result;

    try {
        http_request request;
        request.method = "GET";
        request.url = config_.url_for(config_.reference_data_path);
        request.headers["Accept"] = "application/json";
        if (auth_) {
            request.set_bearer_token(auth_->authenticate());
        }

        LOG_DEBUG("refsync", "GET %s", request.url.c_str());
        auto response = client_.send(request);
        if (response.is_transport_failure()) {
            result.message = "Network error: " + response.error;
            LOG_WARN("refsync", "%s", result.message.c_str());
            return result;
        }
        if (!response.is_success()) {
            result.message = "Reference data request failed with HTTP " +
                             std::to_string(response.status_code);
            LOG_WARN("refsync", "%s", result.message.c_str());
            return result;
        }

        auto payload = parse_reference_payload(response.body_string());
        result.counts = replace_all(payload);
        result.success = true;
        result.message = "Reference data synchronized";
        LOG_INFO("refsync", "Reference data synchronized: %zu rows", payload.row_count());
    } catch (const std::exception& e) {
        result.success = false;
        result.counts.clear();
        result.message = std::string("Synchronization failed: ") + e.what();
        LOG_ERROR("refsync", "%s", result.message.c_str());
    }
    return result;
}

} // namespace fieldsync
