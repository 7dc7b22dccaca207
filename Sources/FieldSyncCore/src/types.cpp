#include "fieldsync/types.hpp"
#include "fieldsync/errors.hpp"
#include <ctime>
#include <cstdio>

namespace fieldsync {

const char* to_string(sync_status status) {
    switch (status) {
        case sync_status::pending: return "pending";
        case sync_status::synced:  return "synced";
        case sync_status::failed:  return "failed";
    }
    return "unknown";
}

std::optional<sync_status> sync_status_from_int(int64_t value) {
    switch (value) {
        case 0: return sync_status::pending;
        case 1: return sync_status::synced;
        case 2: return sync_status::failed;
        default: return std::nullopt;
    }
}

const char* to_string(entity_kind kind) {
    switch (kind) {
        case entity_kind::taxpayer: return "taxpayer";
        case entity_kind::parcel:   return "parcel";
    }
    return "unknown";
}

const char* to_string(auth_error_kind kind) {
    switch (kind) {
        case auth_error_kind::no_credentials:      return "no_credentials";
        case auth_error_kind::invalid_credentials: return "invalid_credentials";
        case auth_error_kind::network_error:       return "network_error";
        case auth_error_kind::server_error:        return "server_error";
        case auth_error_kind::invalid_response:    return "invalid_response";
        case auth_error_kind::unknown_error:       return "unknown_error";
    }
    return "unknown_error";
}

std::string to_iso8601(timestamp_t tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int ms = static_cast<int>(millis % 1000);
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, ms);
    return buf;
}

} // namespace fieldsync
