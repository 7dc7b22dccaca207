#include "fieldsync/session_gate.hpp"
#include "fieldsync/log.hpp"
#include <string>

namespace fieldsync {

bool& session_gate::flag(slot s) {
    switch (s) {
        case slot::taxpayer_export: return taxpayer_export_;
        case slot::parcel_export: return parcel_export_;
        case slot::reference_sync: return reference_sync_;
    }
    return reference_sync_;
}

session_gate::lease session_gate::enter_export(entity_kind kind) {
    auto s = kind == entity_kind::taxpayer ? slot::taxpayer_export : slot::parcel_export;

    std::lock_guard<std::mutex> lock(mutex_);
    if (reference_sync_) {
        throw session_busy_error("Reference data synchronization in progress");
    }
    bool& active = flag(s);
    if (active) {
        throw session_busy_error(std::string("An export of ") + to_string(kind) +
                                 " records is already in progress");
    }
    active = true;
    LOG_DEBUG("export", "Gate entered: %s export", to_string(kind));
    return lease(this, s);
}

session_gate::lease session_gate::enter_reference_sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reference_sync_) {
        throw session_busy_error("Reference data synchronization already in progress");
    }
    if (taxpayer_export_ || parcel_export_) {
        throw session_busy_error("Cannot refresh reference data while an export is in progress");
    }
    reference_sync_ = true;
    LOG_DEBUG("refsync", "Gate entered: reference sync");
    return lease(this, slot::reference_sync);
}

bool session_gate::is_active(slot s) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (s) {
        case slot::taxpayer_export: return taxpayer_export_;
        case slot::parcel_export: return parcel_export_;
        case slot::reference_sync: return reference_sync_;
    }
    return false;
}

bool session_gate::any_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return taxpayer_export_ || parcel_export_ || reference_sync_;
}

void session_gate::leave(slot s) {
    std::lock_guard<std::mutex> lock(mutex_);
    flag(s) = false;
}

} // namespace fieldsync
