#pragma once

#include "db.hpp"
#include "records.hpp"
#include "cleanup.hpp"
#include <string>
#include <vector>
#include <optional>

namespace fieldsync {

// Reference tables, in the order they are created
inline constexpr const char* reference_tables[] = {
    "ref_type_activite",
    "ref_zone_type",
    "ref_commune",
    "ref_quartier",
    "ref_avenue"
};

// ============================================================================
// record_store - local relational store for field records
// ============================================================================
//
// Owns no connection: the database handle is injected and must outlive the
// store. All domain writes from form collaborators go through here; ledger
// columns are left at their defaults (pending, 0 attempts) on insert.

class record_store {
public:
    explicit record_store(database& db);

    /// Create every table and index that does not exist yet.
    void ensure_schema();

    database& db() { return db_; }

    // Taxpayers
    primary_key_t add_taxpayer(const taxpayer_record& record);
    std::optional<taxpayer_record> find_taxpayer(primary_key_t id);
    std::vector<taxpayer_record> taxpayers();
    std::vector<taxpayer_record> taxpayers(const std::vector<primary_key_t>& ids);

    /// Explicit user deletion: the row and its attachment files.
    cleanup_report delete_taxpayer(primary_key_t id);

    // Parcels (owner and buildings are written in the same transaction)
    primary_key_t add_parcel(const parcel_record& record);
    std::optional<parcel_record> find_parcel(primary_key_t id);
    std::vector<parcel_record> parcels(const std::vector<primary_key_t>& ids);
    cleanup_report delete_parcel(primary_key_t id);

    // Reference tables
    std::vector<reference_row> reference_rows(const std::string& table);
    void add_reference_row(const std::string& table, const reference_row& row);

    size_t count(const std::string& table);

    // Row decoding
    static taxpayer_record taxpayer_from_row(const row_t& row);
    static parcel_record parcel_from_row(const row_t& row);

    /// Fill owner and buildings of parcels decoded from bare rows.
    void load_dependents(parcel_record& parcel);

private:
    database& db_;
};

} // namespace fieldsync
