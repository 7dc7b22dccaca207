#include "fieldsync/record_store.hpp"
#include "fieldsync/ledger.hpp"
#include "fieldsync/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>

namespace fieldsync {

using json = nlohmann::json;

namespace {

const char* const k_schema = R"(
    CREATE TABLE IF NOT EXISTS ref_type_activite (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        libelle TEXT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS ref_zone_type (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        libelle TEXT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS ref_commune (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        libelle TEXT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS ref_quartier (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        libelle TEXT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS ref_avenue (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        libelle TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS contribuables (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        nif TEXT,
        type_nif TEXT,
        type_contribuable TEXT NOT NULL,
        nom TEXT,
        post_nom TEXT,
        prenom TEXT,
        raison_sociale TEXT,
        telephone1 TEXT NOT NULL,
        telephone2 TEXT,
        email TEXT,
        commune_id INTEGER REFERENCES ref_commune (id),
        quartier_id INTEGER REFERENCES ref_quartier (id),
        avenue_id INTEGER REFERENCES ref_avenue (id),
        rue TEXT,
        numero_parcelle TEXT,
        origine_fiche TEXT NOT NULL,
        activite_id INTEGER REFERENCES ref_type_activite (id),
        zone_id INTEGER REFERENCES ref_zone_type (id),
        statut INTEGER,
        gps_latitude REAL,
        gps_longitude REAL,
        piece_identite_url TEXT,
        forme_juridique TEXT,
        numero_rccm TEXT,
        cree_par TEXT NOT NULL,
        maj_par TEXT,
        created_at TEXT,
        updated_at TEXT,
        sync_status INTEGER NOT NULL DEFAULT 0,
        sync_error TEXT,
        sync_attempts INTEGER NOT NULL DEFAULT 0,
        last_sync_at TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_contribuables_sync
        ON contribuables (sync_status, created_at, id);

    CREATE TABLE IF NOT EXISTS parcelles (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        code_parcelle TEXT,
        reference_cadastrale TEXT,
        commune_id INTEGER REFERENCES ref_commune (id),
        quartier_id INTEGER REFERENCES ref_quartier (id),
        avenue_id INTEGER REFERENCES ref_avenue (id),
        rue TEXT,
        numero_parcelle TEXT,
        numero_adresse TEXT,
        superficie_m2 REAL,
        gps_lat REAL,
        gps_lon REAL,
        statut_parcelle TEXT NOT NULL,
        source_donnee TEXT,
        photo_url TEXT,
        created_at TEXT,
        updated_at TEXT,
        sync_status INTEGER NOT NULL DEFAULT 0,
        sync_error TEXT,
        sync_attempts INTEGER NOT NULL DEFAULT 0,
        last_sync_at TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_parcelles_sync
        ON parcelles (sync_status, created_at, id);

    CREATE TABLE IF NOT EXISTS personnes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        type_personne TEXT NOT NULL,
        nom_raison_sociale TEXT,
        nif TEXT,
        contact TEXT,
        adresse_postale TEXT,
        parcelle_id INTEGER UNIQUE REFERENCES parcelles (id) ON DELETE CASCADE,
        created_at TEXT,
        updated_at TEXT
    );

    CREATE TABLE IF NOT EXISTS batiments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        parcelle_id INTEGER REFERENCES parcelles (id) ON DELETE CASCADE,
        type_batiment TEXT NOT NULL,
        nombre_etages INTEGER,
        annee_construction INTEGER,
        surface_batie_m2 REAL,
        usage_principal TEXT NOT NULL,
        statut_batiment TEXT NOT NULL,
        created_at TEXT,
        updated_at TEXT
    );
)";

bool is_reference_table(const std::string& table) {
    return std::find(std::begin(reference_tables), std::end(reference_tables), table)
        != std::end(reference_tables);
}

std::string id_list_clause(const std::vector<primary_key_t>& ids, std::vector<column_value_t>& params) {
    for (auto id : ids) params.push_back(id);
    return "(" + placeholders(ids.size()) + ")";
}

owner_record owner_from_row(const row_t& row) {
    owner_record owner;
    owner.id = detail::row_int(row, "id").value_or(0);
    owner.parcel_id = detail::row_int(row, "parcelle_id").value_or(0);
    owner.type_personne = detail::row_text(row, "type_personne").value_or("");
    owner.nom_raison_sociale = detail::row_text(row, "nom_raison_sociale");
    owner.nif = detail::row_text(row, "nif");
    owner.contact = detail::row_text(row, "contact");
    owner.adresse_postale = detail::row_text(row, "adresse_postale");
    return owner;
}

building_record building_from_row(const row_t& row) {
    building_record building;
    building.id = detail::row_int(row, "id").value_or(0);
    building.parcel_id = detail::row_int(row, "parcelle_id").value_or(0);
    building.type_batiment = detail::row_text(row, "type_batiment").value_or("");
    building.nombre_etages = detail::row_int(row, "nombre_etages");
    building.annee_construction = detail::row_int(row, "annee_construction");
    building.surface_batie_m2 = detail::row_real(row, "surface_batie_m2");
    building.usage_principal = detail::row_text(row, "usage_principal").value_or("");
    building.statut_batiment = detail::row_text(row, "statut_batiment").value_or("");
    return building;
}

} // namespace

// ============================================================================
// Attachment lists
// ============================================================================

std::optional<std::string> encode_attachment_list(const std::vector<std::string>& paths) {
    if (paths.empty()) return std::nullopt;
    return json(paths).dump();
}

std::vector<std::string> decode_attachment_list(const std::optional<std::string>& stored) {
    std::vector<std::string> paths;
    if (!stored || stored->empty()) return paths;

    if ((*stored)[0] != '[') {
        paths.push_back(*stored);
        return paths;
    }

    auto parsed = json::parse(*stored, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        LOG_WARN("db", "Unreadable attachment list: %s", stored->c_str());
        return paths;
    }
    for (const auto& item : parsed) {
        if (item.is_string()) {
            paths.push_back(item.get<std::string>());
        }
    }
    return paths;
}

// ============================================================================
// record_store
// ============================================================================

record_store::record_store(database& db) : db_(db) {}

void record_store::ensure_schema() {
    db_.execute(k_schema);
}

primary_key_t record_store::add_taxpayer(const taxpayer_record& r) {
    auto created_at = r.created_at.empty() ? utc_now_iso8601() : r.created_at;

    return db_.insert("contribuables", {
        {"nif", detail::to_column_value(r.nif)},
        {"type_nif", detail::to_column_value(r.type_nif)},
        {"type_contribuable", r.type_contribuable},
        {"nom", detail::to_column_value(r.nom)},
        {"post_nom", detail::to_column_value(r.post_nom)},
        {"prenom", detail::to_column_value(r.prenom)},
        {"raison_sociale", detail::to_column_value(r.raison_sociale)},
        {"telephone1", r.telephone1},
        {"telephone2", detail::to_column_value(r.telephone2)},
        {"email", detail::to_column_value(r.email)},
        {"commune_id", detail::to_column_value(r.commune_id)},
        {"quartier_id", detail::to_column_value(r.quartier_id)},
        {"avenue_id", detail::to_column_value(r.avenue_id)},
        {"rue", detail::to_column_value(r.rue)},
        {"numero_parcelle", detail::to_column_value(r.numero_parcelle)},
        {"origine_fiche", r.origine_fiche},
        {"activite_id", detail::to_column_value(r.activite_id)},
        {"zone_id", detail::to_column_value(r.zone_id)},
        {"statut", detail::to_column_value(r.statut)},
        {"gps_latitude", detail::to_column_value(r.gps_latitude)},
        {"gps_longitude", detail::to_column_value(r.gps_longitude)},
        {"piece_identite_url", detail::to_column_value(encode_attachment_list(r.piece_identite_urls))},
        {"forme_juridique", detail::to_column_value(r.forme_juridique)},
        {"numero_rccm", detail::to_column_value(r.numero_rccm)},
        {"cree_par", r.cree_par},
        {"maj_par", detail::to_column_value(r.maj_par)},
        {"created_at", created_at},
        {"updated_at", detail::to_column_value(r.updated_at)}
    });
}

std::optional<taxpayer_record> record_store::find_taxpayer(primary_key_t id) {
    auto rows = db_.query("SELECT * FROM contribuables WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return taxpayer_from_row(rows[0]);
}

std::vector<taxpayer_record> record_store::taxpayers() {
    auto rows = db_.query("SELECT * FROM contribuables ORDER BY created_at ASC, id ASC");
    std::vector<taxpayer_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(taxpayer_from_row(row));
    }
    return records;
}

std::vector<taxpayer_record> record_store::taxpayers(const std::vector<primary_key_t>& ids) {
    if (ids.empty()) return {};
    std::vector<column_value_t> params;
    auto in_clause = id_list_clause(ids, params);
    auto rows = db_.query("SELECT * FROM contribuables WHERE id IN " + in_clause +
                          " ORDER BY created_at ASC, id ASC", params);
    std::vector<taxpayer_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(taxpayer_from_row(row));
    }
    return records;
}

cleanup_report record_store::delete_taxpayer(primary_key_t id) {
    auto record = find_taxpayer(id);
    if (!record) return {};
    return record_cleanup(db_).purge(std::vector<taxpayer_record>{*record});
}

primary_key_t record_store::add_parcel(const parcel_record& r) {
    auto created_at = r.created_at.empty() ? utc_now_iso8601() : r.created_at;

    transaction tx(db_);
    auto parcel_id = db_.insert("parcelles", {
        {"code_parcelle", detail::to_column_value(r.code_parcelle)},
        {"reference_cadastrale", detail::to_column_value(r.reference_cadastrale)},
        {"commune_id", detail::to_column_value(r.commune_id)},
        {"quartier_id", detail::to_column_value(r.quartier_id)},
        {"avenue_id", detail::to_column_value(r.avenue_id)},
        {"rue", detail::to_column_value(r.rue)},
        {"numero_parcelle", detail::to_column_value(r.numero_parcelle)},
        {"numero_adresse", detail::to_column_value(r.numero_adresse)},
        {"superficie_m2", detail::to_column_value(r.superficie_m2)},
        {"gps_lat", detail::to_column_value(r.gps_lat)},
        {"gps_lon", detail::to_column_value(r.gps_lon)},
        {"statut_parcelle", r.statut_parcelle},
        {"source_donnee", detail::to_column_value(r.source_donnee)},
        {"photo_url", detail::to_column_value(encode_attachment_list(r.photo_urls))},
        {"created_at", created_at},
        {"updated_at", detail::to_column_value(r.updated_at)}
    });

    if (r.owner) {
        const auto& o = *r.owner;
        db_.insert("personnes", {
            {"type_personne", o.type_personne},
            {"nom_raison_sociale", detail::to_column_value(o.nom_raison_sociale)},
            {"nif", detail::to_column_value(o.nif)},
            {"contact", detail::to_column_value(o.contact)},
            {"adresse_postale", detail::to_column_value(o.adresse_postale)},
            {"parcelle_id", parcel_id},
            {"created_at", created_at}
        });
    }

    for (const auto& b : r.buildings) {
        db_.insert("batiments", {
            {"parcelle_id", parcel_id},
            {"type_batiment", b.type_batiment},
            {"nombre_etages", detail::to_column_value(b.nombre_etages)},
            {"annee_construction", detail::to_column_value(b.annee_construction)},
            {"surface_batie_m2", detail::to_column_value(b.surface_batie_m2)},
            {"usage_principal", b.usage_principal},
            {"statut_batiment", b.statut_batiment},
            {"created_at", created_at}
        });
    }

    tx.commit();
    return parcel_id;
}

std::optional<parcel_record> record_store::find_parcel(primary_key_t id) {
    auto rows = db_.query("SELECT * FROM parcelles WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    auto parcel = parcel_from_row(rows[0]);
    load_dependents(parcel);
    return parcel;
}

std::vector<parcel_record> record_store::parcels(const std::vector<primary_key_t>& ids) {
    if (ids.empty()) return {};
    std::vector<column_value_t> params;
    auto in_clause = id_list_clause(ids, params);
    auto rows = db_.query("SELECT * FROM parcelles WHERE id IN " + in_clause +
                          " ORDER BY created_at ASC, id ASC", params);
    std::vector<parcel_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        auto parcel = parcel_from_row(row);
        load_dependents(parcel);
        records.push_back(std::move(parcel));
    }
    return records;
}

cleanup_report record_store::delete_parcel(primary_key_t id) {
    auto record = find_parcel(id);
    if (!record) return {};
    return record_cleanup(db_).purge(std::vector<parcel_record>{*record});
}

void record_store::load_dependents(parcel_record& parcel) {
    auto owners = db_.query("SELECT * FROM personnes WHERE parcelle_id = ?", {parcel.id});
    if (!owners.empty()) {
        parcel.owner = owner_from_row(owners[0]);
    } else {
        parcel.owner.reset();
    }

    parcel.buildings.clear();
    auto buildings = db_.query("SELECT * FROM batiments WHERE parcelle_id = ? ORDER BY id ASC", {parcel.id});
    for (const auto& row : buildings) {
        parcel.buildings.push_back(building_from_row(row));
    }
}

std::vector<reference_row> record_store::reference_rows(const std::string& table) {
    if (!is_reference_table(table)) {
        throw db_error("Not a reference table: " + table);
    }
    auto rows = db_.query("SELECT id, libelle FROM " + table + " ORDER BY id ASC");
    std::vector<reference_row> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back({detail::row_int(row, "id").value_or(0),
                          detail::row_text(row, "libelle").value_or("")});
    }
    return result;
}

void record_store::add_reference_row(const std::string& table, const reference_row& row) {
    if (!is_reference_table(table)) {
        throw db_error("Not a reference table: " + table);
    }
    db_.insert(table, {{"id", row.id}, {"libelle", row.libelle}});
}

size_t record_store::count(const std::string& table) {
    auto rows = db_.query("SELECT COUNT(*) AS count FROM " + table);
    if (rows.empty()) return 0;
    return static_cast<size_t>(detail::row_int(rows[0], "count").value_or(0));
}

taxpayer_record record_store::taxpayer_from_row(const row_t& row) {
    taxpayer_record r;
    r.id = detail::row_int(row, "id").value_or(0);
    r.nif = detail::row_text(row, "nif");
    r.type_nif = detail::row_text(row, "type_nif");
    r.type_contribuable = detail::row_text(row, "type_contribuable").value_or("");
    r.nom = detail::row_text(row, "nom");
    r.post_nom = detail::row_text(row, "post_nom");
    r.prenom = detail::row_text(row, "prenom");
    r.raison_sociale = detail::row_text(row, "raison_sociale");
    r.telephone1 = detail::row_text(row, "telephone1").value_or("");
    r.telephone2 = detail::row_text(row, "telephone2");
    r.email = detail::row_text(row, "email");
    r.commune_id = detail::row_int(row, "commune_id");
    r.quartier_id = detail::row_int(row, "quartier_id");
    r.avenue_id = detail::row_int(row, "avenue_id");
    r.activite_id = detail::row_int(row, "activite_id");
    r.zone_id = detail::row_int(row, "zone_id");
    r.rue = detail::row_text(row, "rue");
    r.numero_parcelle = detail::row_text(row, "numero_parcelle");
    r.origine_fiche = detail::row_text(row, "origine_fiche").value_or("");
    r.statut = detail::row_int(row, "statut");
    r.gps_latitude = detail::row_real(row, "gps_latitude");
    r.gps_longitude = detail::row_real(row, "gps_longitude");
    r.forme_juridique = detail::row_text(row, "forme_juridique");
    r.numero_rccm = detail::row_text(row, "numero_rccm");
    r.cree_par = detail::row_text(row, "cree_par").value_or("");
    r.maj_par = detail::row_text(row, "maj_par");
    r.piece_identite_urls = decode_attachment_list(detail::row_text(row, "piece_identite_url"));
    r.created_at = detail::row_text(row, "created_at").value_or("");
    r.updated_at = detail::row_text(row, "updated_at");
    r.ledger = sync_ledger::from_row(row);
    return r;
}

parcel_record record_store::parcel_from_row(const row_t& row) {
    parcel_record r;
    r.id = detail::row_int(row, "id").value_or(0);
    r.code_parcelle = detail::row_text(row, "code_parcelle");
    r.reference_cadastrale = detail::row_text(row, "reference_cadastrale");
    r.commune_id = detail::row_int(row, "commune_id");
    r.quartier_id = detail::row_int(row, "quartier_id");
    r.avenue_id = detail::row_int(row, "avenue_id");
    r.rue = detail::row_text(row, "rue");
    r.numero_parcelle = detail::row_text(row, "numero_parcelle");
    r.numero_adresse = detail::row_text(row, "numero_adresse");
    r.superficie_m2 = detail::row_real(row, "superficie_m2");
    r.gps_lat = detail::row_real(row, "gps_lat");
    r.gps_lon = detail::row_real(row, "gps_lon");
    r.statut_parcelle = detail::row_text(row, "statut_parcelle").value_or("");
    r.source_donnee = detail::row_text(row, "source_donnee");
    r.photo_urls = decode_attachment_list(detail::row_text(row, "photo_url"));
    r.created_at = detail::row_text(row, "created_at").value_or("");
    r.updated_at = detail::row_text(row, "updated_at");
    r.ledger = sync_ledger::from_row(row);
    return r;
}

} // namespace fieldsync
