#pragma once

#include "TestSupport.hpp"

namespace transfer_tests {

using namespace test_support;

// ============================================================================
// http_request multipart form
// ============================================================================

void test_multipart_request() {
    std::cout << "  test_multipart_request..." << std::flush;

    std::string payload = R"([{"localId":1}])";
    std::vector<fieldsync::multipart_part> parts = {
        {"data", "", "application/json", fieldsync::byte_vector(payload.begin(), payload.end())},
        {"files_1", "id.jpg", "image/jpeg", fieldsync::byte_vector{0xFF, 0xD8, 0x00, 0x0D, 0x0A}}
    };

    fieldsync::http_request request;
    request.set_json_body("{}");
    assert(!request.is_multipart());

    // The transport owns the body encoding and its Content-Type
    request.set_multipart(parts);
    assert(request.is_multipart());
    assert(request.body.empty());
    assert(request.headers.count("Content-Type") == 0);

    auto data = find_part(request, "data");
    assert(data);
    assert(part_text(*data) == payload);
    assert(data->content_type == "application/json");
    assert(data->filename.empty());

    auto file = find_part(request, "files_1");
    assert(file);
    assert(file->filename == "id.jpg");
    assert(file->content == parts[1].content);

    assert(!find_part(request, "files_2"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Payload building
// ============================================================================

void test_taxpayer_payload() {
    std::cout << "  test_taxpayer_payload..." << std::flush;

    auto config = test_config();
    auto first = make_taxpayer(1, {"/photos/a.jpg", "/photos/b.png"});
    first.id = 11;
    first.commune_id = 4;
    first.activite_id = 2;
    auto second = make_taxpayer(2);
    second.id = 12;

    auto payload = fieldsync::make_payload(std::vector<fieldsync::taxpayer_record>{first, second}, config);
    assert(payload.endpoint == "/contribuables/batch");
    assert((payload.ids == std::vector<fieldsync::primary_key_t>{11, 12}));
    assert(payload.attachments.size() == 2);
    assert(payload.attachments[0].owner_id == 11);
    assert(payload.attachments[1].path == "/photos/b.png");

    auto data = json::parse(payload.data);
    assert(data.is_array() && data.size() == 2);
    assert(data[0]["localId"] == 11);
    assert(data[0]["typeContribuable"] == "PERSONNE_PHYSIQUE");
    assert(data[0]["postNom"].is_null());
    assert(data[0]["refCommune"] == 4);
    assert(data[0]["refTypeActivite"] == 2);
    assert(data[0]["refZoneType"].is_null());
    assert(data[0]["pieceIdentiteUrl"] == "a.jpg,b.png");
    assert(data[0]["dateInscription"] == "2024-01-01T00:00:00.000Z");
    assert(data[1]["pieceIdentiteUrl"].is_null());

    assert(fieldsync::attachment_part_name(11) == "files_11");
    assert(fieldsync::filename_of("/photos/a.jpg") == "a.jpg");
    assert(fieldsync::filename_of("C:\\photos\\b.jpg") == "b.jpg");
    assert(fieldsync::filename_of("/photos/") == "file");

    // Characters that would break the part headers are replaced
    assert(fieldsync::filename_of("/photos/a\"b\r\n.jpg") == "a_b__.jpg");
    assert(fieldsync::filename_of("x\ty.png") == "x_y.png");

    std::cout << " OK" << std::endl;
}

void test_parcel_payload_embeds_dependents() {
    std::cout << "  test_parcel_payload_embeds_dependents..." << std::flush;

    auto parcel = make_parcel(1, {"/photos/p.jpg"});
    parcel.id = 5;
    parcel.avenue_id = 9;

    auto payload = fieldsync::make_payload(std::vector<fieldsync::parcel_record>{parcel}, test_config());
    assert(payload.endpoint == "/parcelles/batch");
    assert(payload.attachments.size() == 1);

    auto dto = json::parse(payload.data)[0];
    assert(dto["localId"] == 5);
    assert(dto["rueAvenue"] == 9);
    assert(dto["statutParcelle"] == "BATI");
    assert(dto["batiments"].size() == 2);
    assert(dto["batiments"][1]["surfaceBatieM2"] == 40.5);
    assert(dto["batiments"][0]["nombreEtages"] == 1);
    assert(dto["personnes"].size() == 1);
    assert(dto["personnes"][0]["typePersonne"] == "PHYSIQUE");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// transfer_protocol
// ============================================================================

void test_transfer_request_shape() {
    std::cout << "  test_transfer_request_shape..." << std::flush;

    temp_dir dir("transfer_shape");
    auto photo = dir.write_file("front.jpg", "JPEGDATA");
    auto missing = (dir.path / "gone.jpg").string();

    auto record = make_taxpayer(1, {photo, missing});
    record.id = 3;

    auto config = test_config();
    fieldsync::mock_http_client http([](const fieldsync::http_request&) {
        return fieldsync::mock_http_client::respond(200, "{}");
    });
    fieldsync::transfer_protocol transfer(http, config);

    auto result = transfer.transfer(std::vector<fieldsync::taxpayer_record>{record}, "tok-xyz");
    assert(result.accepted());
    assert(result.http_status == 200);

    auto requests = http.requests();
    assert(requests.size() == 1);
    const auto& request = requests[0];
    assert(request.method == "POST");
    assert(request.url == "http://backend.test/contribuables/batch");
    assert(request.headers.at("Authorization") == "Bearer tok-xyz");
    assert(request.is_multipart());
    assert(request.parts[0].name == "data");

    assert((local_ids(request) == std::vector<int64_t>{3}));

    // The missing file is skipped, the readable one goes out as files_<localId>
    assert(request.parts.size() == 2);
    auto file = find_part(request, "files_3");
    assert(file);
    assert(file->filename == "front.jpg");
    assert(file->content_type == "image/jpeg");
    assert(part_text(*file) == "JPEGDATA");

    std::cout << " OK" << std::endl;
}

void test_transfer_classification() {
    std::cout << "  test_transfer_classification..." << std::flush;

    auto config = test_config();
    fieldsync::http_response next;
    fieldsync::mock_http_client http([&next](const fieldsync::http_request&) { return next; });
    fieldsync::transfer_protocol transfer(http, config);
    std::vector<fieldsync::taxpayer_record> chunk{make_taxpayer(1)};

    next = fieldsync::mock_http_client::respond(201, "");
    assert(transfer.transfer(chunk, "t").status == fieldsync::transfer_status::accepted);

    next = fieldsync::mock_http_client::respond(500, "database down");
    auto rejected = transfer.transfer(chunk, "t");
    assert(rejected.status == fieldsync::transfer_status::rejected);
    assert(rejected.http_status == 500);
    assert(rejected.message == "database down");

    next = fieldsync::mock_http_client::respond(400, "");
    assert(transfer.transfer(chunk, "t").message == "Export failed with HTTP 400");

    next = fieldsync::mock_http_client::respond(401, "");
    assert(transfer.transfer(chunk, "t").status == fieldsync::transfer_status::credential_expired);
    next = fieldsync::mock_http_client::respond(403, "");
    assert(transfer.transfer(chunk, "t").status == fieldsync::transfer_status::credential_expired);

    next = fieldsync::http_response::transport_failure("Read timeout");
    auto offline = transfer.transfer(chunk, "t");
    assert(offline.status == fieldsync::transfer_status::transport_failed);
    assert(offline.message == "Read timeout");

    std::cout << " OK" << std::endl;
}

void test_transfer_unencodable_payload() {
    std::cout << "  test_transfer_unencodable_payload..." << std::flush;

    auto config = test_config();
    fieldsync::mock_http_client http;
    fieldsync::transfer_protocol transfer(http, config);

    auto record = make_taxpayer(1);
    record.nom = std::string("\xC3\x28 invalid utf-8");

    auto result = transfer.transfer(std::vector<fieldsync::taxpayer_record>{record}, "t");
    assert(result.status == fieldsync::transfer_status::malformed_payload);
    assert(!result.message.empty());
    assert(http.request_count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// authenticator
// ============================================================================

void test_token_extraction() {
    std::cout << "  test_token_extraction..." << std::flush;

    using fieldsync::authenticator;
    assert(authenticator::extract_token(R"({"token":"a"})") == std::optional<std::string>("a"));
    assert(authenticator::extract_token(R"({"access_token":"b"})") == std::optional<std::string>("b"));
    assert(authenticator::extract_token(R"({"jwt":"c"})") == std::optional<std::string>("c"));
    assert(authenticator::extract_token(R"({"accessToken":"d"})") == std::optional<std::string>("d"));
    assert(authenticator::extract_token(R"({"token":"","jwt":"e"})") == std::optional<std::string>("e"));
    assert(authenticator::extract_token("eyJhbGciOi.raw.token") == std::optional<std::string>("eyJhbGciOi.raw.token"));
    assert(!authenticator::extract_token(R"({"user":"x"})"));
    assert(!authenticator::extract_token(""));

    std::cout << " OK" << std::endl;
}

void test_authenticator_login_request() {
    std::cout << "  test_authenticator_login_request..." << std::flush;

    auto config = test_config();
    fieldsync::mock_http_client http([](const fieldsync::http_request&) { return login_ok("jwt-1"); });
    fieldsync::memory_credential_store store(fieldsync::credentials{"agent@example.org", "secret"});
    fieldsync::authenticator auth(http, config, store);

    assert(auth.authenticate() == "jwt-1");

    auto request = http.requests().at(0);
    assert(request.method == "POST");
    assert(request.url == "http://backend.test/auth/login");
    assert(request.headers.at("Content-Type") == "application/json");
    auto body = json::parse(std::string(request.body.begin(), request.body.end()));
    assert(body["email"] == "agent@example.org");
    assert(body["password"] == "secret");

    std::cout << " OK" << std::endl;
}

void test_authenticator_error_kinds() {
    std::cout << "  test_authenticator_error_kinds..." << std::flush;

    auto config = test_config();
    fieldsync::http_response next;
    fieldsync::mock_http_client http([&next](const fieldsync::http_request&) { return next; });
    fieldsync::memory_credential_store store;
    fieldsync::authenticator auth(http, config, store);

    auto kind_of = [&auth]() {
        try {
            auth.authenticate();
        } catch (const fieldsync::authentication_error& e) {
            return e.kind();
        }
        assert(false && "authentication should have failed");
        return fieldsync::auth_error_kind::unknown_error;
    };

    assert(kind_of() == fieldsync::auth_error_kind::no_credentials);
    store.save({"agent@example.org", ""});
    assert(kind_of() == fieldsync::auth_error_kind::no_credentials);
    assert(http.request_count() == 0);

    store.save({"agent@example.org", "wrong"});
    next = fieldsync::mock_http_client::respond(401);
    assert(kind_of() == fieldsync::auth_error_kind::invalid_credentials);
    next = fieldsync::mock_http_client::respond(403);
    assert(kind_of() == fieldsync::auth_error_kind::invalid_credentials);
    next = fieldsync::mock_http_client::respond(503);
    assert(kind_of() == fieldsync::auth_error_kind::server_error);
    next = fieldsync::http_response::transport_failure("Connection refused");
    assert(kind_of() == fieldsync::auth_error_kind::network_error);
    next = fieldsync::mock_http_client::respond(200, R"({"user":"agent"})");
    assert(kind_of() == fieldsync::auth_error_kind::invalid_response);
    next = fieldsync::mock_http_client::respond(404, "not here");
    assert(kind_of() == fieldsync::auth_error_kind::unknown_error);

    store.clear();
    assert(!store.stored_credentials());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing transfer protocol..." << std::endl;
    test_multipart_request();
    test_taxpayer_payload();
    test_parcel_payload_embeds_dependents();
    test_transfer_request_shape();
    test_transfer_classification();
    test_transfer_unencodable_payload();
    test_token_extraction();
    test_authenticator_login_request();
    test_authenticator_error_kinds();
}

} // namespace transfer_tests
