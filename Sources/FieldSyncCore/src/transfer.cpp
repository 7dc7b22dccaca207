#include "fieldsync/transfer.hpp"
#include "fieldsync/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fieldsync {

using json = nlohmann::json;
namespace fs = std::filesystem;

const char* to_string(transfer_status status) {
    switch (status) {
        case transfer_status::accepted: return "accepted";
        case transfer_status::rejected: return "rejected";
        case transfer_status::credential_expired: return "credential_expired";
        case transfer_status::transport_failed: return "transport_failed";
        case transfer_status::malformed_payload: return "malformed_payload";
    }
    return "unknown";
}

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

std::string content_type_for(const std::string& path) {
    auto ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".webp") return "image/webp";
    if (ext == ".pdf") return "application/pdf";
    return "application/octet-stream";
}

json taxpayer_dto(const taxpayer_record& r) {
    std::string file_names;
    for (const auto& path : r.piece_identite_urls) {
        if (!file_names.empty()) file_names += ",";
        file_names += filename_of(path);
    }

    return json{
        {"localId", r.id},
        {"nif", nullable(r.nif)},
        {"typeNif", nullable(r.type_nif)},
        {"typeContribuable", r.type_contribuable},
        {"nom", nullable(r.nom)},
        {"postNom", nullable(r.post_nom)},
        {"prenom", nullable(r.prenom)},
        {"raisonSociale", nullable(r.raison_sociale)},
        {"telephone1", r.telephone1},
        {"telephone2", nullable(r.telephone2)},
        {"email", nullable(r.email)},
        {"rue", nullable(r.rue)},
        {"numeroParcelle", nullable(r.numero_parcelle)},
        {"origineFiche", r.origine_fiche},
        {"statut", nullable(r.statut)},
        {"gpsLatitude", nullable(r.gps_latitude)},
        {"gpsLongitude", nullable(r.gps_longitude)},
        {"pieceIdentiteUrl", file_names.empty() ? json(nullptr) : json(file_names)},
        {"dateInscription", r.created_at},
        {"dateMaj", nullable(r.updated_at)},
        {"formeJuridique", nullable(r.forme_juridique)},
        {"numeroRccm", nullable(r.numero_rccm)},
        {"creePar", r.cree_par},
        {"majPar", nullable(r.maj_par)},
        {"refTypeActivite", nullable(r.activite_id)},
        {"refZoneType", nullable(r.zone_id)},
        {"refAvenue", nullable(r.avenue_id)},
        {"refQuartier", nullable(r.quartier_id)},
        {"refCommune", nullable(r.commune_id)}
    };
}

json parcel_dto(const parcel_record& r) {
    json buildings = json::array();
    for (const auto& b : r.buildings) {
        buildings.push_back({
            {"typeBatiment", b.type_batiment},
            {"nombreEtages", nullable(b.nombre_etages)},
            {"anneeConstruction", nullable(b.annee_construction)},
            {"surfaceBatieM2", nullable(b.surface_batie_m2)},
            {"usagePrincipal", b.usage_principal},
            {"statutBatiment", b.statut_batiment}
        });
    }

    json owners = json::array();
    if (r.owner) {
        const auto& o = *r.owner;
        owners.push_back({
            {"typePersonne", o.type_personne},
            {"nomRaisonSociale", nullable(o.nom_raison_sociale)},
            {"nif", nullable(o.nif)},
            {"contact", nullable(o.contact)},
            {"adressePostale", nullable(o.adresse_postale)}
        });
    }

    return json{
        {"localId", r.id},
        {"codeParcelle", nullable(r.code_parcelle)},
        {"referenceCadastrale", nullable(r.reference_cadastrale)},
        {"numeroAdresse", nullable(r.numero_adresse)},
        {"rue", nullable(r.rue)},
        {"numeroParcelle", nullable(r.numero_parcelle)},
        {"superficieM2", nullable(r.superficie_m2)},
        {"gpsLat", nullable(r.gps_lat)},
        {"gpsLon", nullable(r.gps_lon)},
        {"statutParcelle", r.statut_parcelle},
        {"sourceDonnee", nullable(r.source_donnee)},
        {"commune", nullable(r.commune_id)},
        {"quartier", nullable(r.quartier_id)},
        {"rueAvenue", nullable(r.avenue_id)},
        {"batiments", std::move(buildings)},
        {"personnes", std::move(owners)}
    };
}

template <typename Record, typename ToDto, typename Files>
chunk_payload build(const std::vector<Record>& records, const std::string& endpoint,
                    ToDto to_dto, Files files_of) {
    chunk_payload payload;
    payload.endpoint = endpoint;

    json data = json::array();
    for (const auto& record : records) {
        payload.ids.push_back(record.id);
        data.push_back(to_dto(record));
        for (const auto& path : files_of(record)) {
            if (!path.empty()) payload.attachments.push_back({record.id, path});
        }
    }

    try {
        payload.data = data.dump();
    } catch (const json::type_error& e) {
        throw payload_error(std::string("Cannot encode chunk: ") + e.what());
    }
    return payload;
}

} // namespace

std::string attachment_part_name(primary_key_t owner_id) {
    return "files_" + std::to_string(owner_id);
}

std::string filename_of(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    auto name = pos == std::string::npos ? path : path.substr(pos + 1);
    // Quotes and control characters would break the Content-Disposition header
    for (auto& c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '"' || uc < 0x20 || uc == 0x7F) c = '_';
    }
    return name.empty() ? "file" : name;
}

chunk_payload make_payload(const std::vector<taxpayer_record>& records, const sync_config& config) {
    return build(records, config.taxpayer_export_path, taxpayer_dto,
                 [](const taxpayer_record& r) -> const std::vector<std::string>& {
                     return r.piece_identite_urls;
                 });
}

chunk_payload make_payload(const std::vector<parcel_record>& records, const sync_config& config) {
    return build(records, config.parcel_export_path, parcel_dto,
                 [](const parcel_record& r) -> const std::vector<std::string>& {
                     return r.photo_urls;
                 });
}

// ============================================================================
// transfer_protocol
// ============================================================================

transfer_protocol::transfer_protocol(http_client& client, const sync_config& config)
    : client_(client), config_(config) {}

transfer_result transfer_protocol::send_chunk(const chunk_payload& payload, const std::string& token) {
    std::vector<multipart_part> parts;
    parts.push_back({"data", "", "application/json",
                     byte_vector(payload.data.begin(), payload.data.end())});

    for (const auto& attachment : payload.attachments) {
        std::error_code ec;
        if (!fs::exists(attachment.path, ec)) {
            LOG_WARN("transfer", "Attachment missing, skipped: %s", attachment.path.c_str());
            continue;
        }

        std::ifstream in(attachment.path, std::ios::binary);
        if (!in) {
            // Sending without it would lose the file once the chunk is purged
            return {transfer_status::malformed_payload, 0,
                    "Cannot read attachment: " + attachment.path};
        }
        byte_vector content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        parts.push_back({attachment_part_name(attachment.owner_id),
                         filename_of(attachment.path),
                         content_type_for(attachment.path),
                         std::move(content)});
    }

    http_request request;
    request.method = "POST";
    request.url = config_.url_for(payload.endpoint);
    request.headers["Accept"] = "application/json";
    request.set_bearer_token(token);
    auto part_count = parts.size();
    request.set_multipart(std::move(parts));

    LOG_DEBUG("transfer", "POST %s (%zu records, %zu parts)",
              request.url.c_str(), payload.ids.size(), part_count);

    auto result = classify(client_.send(request));
    if (!result.accepted()) {
        LOG_WARN("transfer", "Chunk of %zu records not accepted (%s): %s",
                 payload.ids.size(), to_string(result.status), result.message.c_str());
    }
    return result;
}

transfer_result transfer_protocol::classify(const http_response& response) {
    if (response.is_transport_failure()) {
        auto message = response.error.empty() ? std::string("Network error during export") : response.error;
        return {transfer_status::transport_failed, 0, message};
    }

    int status = response.status_code;
    if (response.is_success()) {
        return {transfer_status::accepted, status, {}};
    }

    auto body = response.body_string();
    if (status == 401 || status == 403) {
        return {transfer_status::credential_expired, status,
                "Credential rejected with HTTP " + std::to_string(status)};
    }
    return {transfer_status::rejected, status,
            body.empty() ? "Export failed with HTTP " + std::to_string(status) : body};
}

} // namespace fieldsync
