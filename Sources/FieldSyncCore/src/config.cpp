#include "fieldsync/config.hpp"
#include "fieldsync/errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace fieldsync {

using json = nlohmann::json;

const char* to_string(failure_policy policy) {
    switch (policy) {
        case failure_policy::continue_session: return "continue";
        case failure_policy::halt_session: return "halt";
    }
    return "unknown";
}

namespace {

log_level parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    throw config_error("Unknown log_level: " + name);
}

failure_policy parse_failure_policy(const std::string& name) {
    if (name == "continue") return failure_policy::continue_session;
    if (name == "halt") return failure_policy::halt_session;
    throw config_error("Unknown on_chunk_failure: " + name);
}

template <typename T>
void read_key(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it != doc.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

int read_timeout_key(const json& doc, const char* key, int fallback) {
    int value = fallback;
    read_key(doc, key, value);
    if (value <= 0) {
        throw config_error(std::string(key) + " must be positive");
    }
    return value;
}

} // namespace

std::string sync_config::url_for(const std::string& path) const {
    if (path.empty()) return base_url;
    bool base_slash = !base_url.empty() && base_url.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base_url + path.substr(1);
    if (!base_slash && !path_slash) return base_url + "/" + path;
    return base_url + path;
}

sync_config sync_config::from_json(const std::string& text) {
    sync_config config;

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Invalid configuration JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    try {
        read_key(doc, "base_url", config.base_url);
        read_key(doc, "login_path", config.login_path);
        read_key(doc, "taxpayer_export_path", config.taxpayer_export_path);
        read_key(doc, "parcel_export_path", config.parcel_export_path);
        read_key(doc, "reference_data_path", config.reference_data_path);
        read_key(doc, "database_path", config.database_path);
        read_key(doc, "authenticate_reference_sync", config.authenticate_reference_sync);

        config.connect_timeout = read_timeout_key(doc, "connect_timeout", config.connect_timeout);
        config.read_timeout = read_timeout_key(doc, "read_timeout", config.read_timeout);
        config.write_timeout = read_timeout_key(doc, "write_timeout", config.write_timeout);

        int64_t chunk_size = static_cast<int64_t>(config.chunk_size);
        read_key(doc, "chunk_size", chunk_size);
        if (chunk_size <= 0) {
            throw config_error("chunk_size must be positive");
        }
        config.chunk_size = static_cast<size_t>(chunk_size);

        if (doc.contains("max_chunks") && !doc["max_chunks"].is_null()) {
            auto max_chunks = doc["max_chunks"].get<int64_t>();
            if (max_chunks <= 0) {
                throw config_error("max_chunks must be positive");
            }
            config.max_chunks = static_cast<size_t>(max_chunks);
        }

        if (doc.contains("on_chunk_failure")) {
            config.on_chunk_failure = parse_failure_policy(doc["on_chunk_failure"].get<std::string>());
        }
        if (doc.contains("log_level")) {
            config.logging = parse_log_level(doc["log_level"].get<std::string>());
        }
    } catch (const json::exception& e) {
        throw config_error(std::string("Invalid configuration value: ") + e.what());
    }

    if (config.base_url.empty()) {
        throw config_error("base_url must not be empty");
    }

    LOG_DEBUG("config", "Loaded configuration for %s", config.base_url.c_str());
    return config;
}

sync_config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return sync_config::from_json(buffer.str());
}

} // namespace fieldsync
