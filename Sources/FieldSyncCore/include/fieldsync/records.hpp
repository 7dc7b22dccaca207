#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace fieldsync {

// ============================================================================
// Ledger fields embedded in every syncable row
// ============================================================================

struct ledger_fields {
    sync_status status = sync_status::pending;
    std::optional<std::string> error;         // NULL whenever status == synced
    int64_t attempts = 0;
    std::optional<std::string> last_sync_at;  // ISO-8601 UTC
};

// ============================================================================
// Taxpayer (contribuables)
// ============================================================================

struct taxpayer_record {
    primary_key_t id = 0;

    std::optional<std::string> nif;
    std::optional<std::string> type_nif;
    std::string type_contribuable;
    std::optional<std::string> nom;
    std::optional<std::string> post_nom;
    std::optional<std::string> prenom;
    std::optional<std::string> raison_sociale;
    std::string telephone1;
    std::optional<std::string> telephone2;
    std::optional<std::string> email;

    // Foreign keys into the reference tables
    std::optional<int64_t> commune_id;
    std::optional<int64_t> quartier_id;
    std::optional<int64_t> avenue_id;
    std::optional<int64_t> activite_id;
    std::optional<int64_t> zone_id;

    std::optional<std::string> rue;
    std::optional<std::string> numero_parcelle;
    std::string origine_fiche;
    std::optional<int64_t> statut;
    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
    std::optional<std::string> forme_juridique;
    std::optional<std::string> numero_rccm;
    std::string cree_par;
    std::optional<std::string> maj_par;

    // Identity document photos, owned by this record
    std::vector<std::string> piece_identite_urls;

    std::string created_at;                   // stamped on insert when empty
    std::optional<std::string> updated_at;

    ledger_fields ledger;
};

// ============================================================================
// Parcel (parcelles) and its dependents
// ============================================================================

struct owner_record {
    primary_key_t id = 0;
    primary_key_t parcel_id = 0;
    std::string type_personne;
    std::optional<std::string> nom_raison_sociale;
    std::optional<std::string> nif;
    std::optional<std::string> contact;
    std::optional<std::string> adresse_postale;
};

struct building_record {
    primary_key_t id = 0;
    primary_key_t parcel_id = 0;
    std::string type_batiment;
    std::optional<int64_t> nombre_etages;
    std::optional<int64_t> annee_construction;
    std::optional<double> surface_batie_m2;
    std::string usage_principal;
    std::string statut_batiment;
};

struct parcel_record {
    primary_key_t id = 0;

    std::optional<std::string> code_parcelle;
    std::optional<std::string> reference_cadastrale;
    std::optional<int64_t> commune_id;
    std::optional<int64_t> quartier_id;
    std::optional<int64_t> avenue_id;
    std::optional<std::string> rue;
    std::optional<std::string> numero_parcelle;
    std::optional<std::string> numero_adresse;
    std::optional<double> superficie_m2;
    std::optional<double> gps_lat;
    std::optional<double> gps_lon;
    std::string statut_parcelle;
    std::optional<std::string> source_donnee;

    std::vector<std::string> photo_urls;

    std::string created_at;
    std::optional<std::string> updated_at;

    ledger_fields ledger;

    std::optional<owner_record> owner;
    std::vector<building_record> buildings;
};

// ============================================================================
// Reference (lookup) rows
// ============================================================================

struct reference_row {
    int64_t id = 0;
    std::string libelle;

    bool operator==(const reference_row& other) const {
        return id == other.id && libelle == other.libelle;
    }
};

// Attachment path lists are stored as a JSON array in one TEXT column.
// NULL for an empty list; a legacy bare path decodes to a one-element list.
std::optional<std::string> encode_attachment_list(const std::vector<std::string>& paths);
std::vector<std::string> decode_attachment_list(const std::optional<std::string>& stored);

} // namespace fieldsync
