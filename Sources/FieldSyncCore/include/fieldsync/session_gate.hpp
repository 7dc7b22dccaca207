#pragma once

#include "errors.hpp"
#include "types.hpp"
#include <mutex>

namespace fieldsync {

// ============================================================================
// session_gate - single-flight admission for export and resync sessions
// ============================================================================
//
// At most one export per entity kind, at most one reference resync, and a
// resync never overlaps any export. A request that cannot enter is rejected
// with session_busy_error immediately; nothing is queued.

class session_gate {
public:
    enum class slot { taxpayer_export, parcel_export, reference_sync };

    // Held for the duration of a session; leaving scope reopens the slot.
    class lease {
    public:
        lease() = default;
        ~lease() { release(); }

        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;

        lease(lease&& other) noexcept : gate_(other.gate_), slot_(other.slot_) {
            other.gate_ = nullptr;
        }
        lease& operator=(lease&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                slot_ = other.slot_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        bool held() const { return gate_ != nullptr; }

        void release() {
            if (gate_) {
                gate_->leave(slot_);
                gate_ = nullptr;
            }
        }

    private:
        friend class session_gate;
        lease(session_gate* gate, slot s) : gate_(gate), slot_(s) {}

        session_gate* gate_ = nullptr;
        slot slot_ = slot::taxpayer_export;
    };

    lease enter_export(entity_kind kind);
    lease enter_reference_sync();

    bool is_active(slot s) const;
    bool any_active() const;

private:
    mutable std::mutex mutex_;
    bool taxpayer_export_ = false;
    bool parcel_export_ = false;
    bool reference_sync_ = false;

    bool& flag(slot s);
    void leave(slot s);
};

} // namespace fieldsync
