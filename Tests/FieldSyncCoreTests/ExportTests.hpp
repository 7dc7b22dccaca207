#pragma once

#include "TestSupport.hpp"

namespace export_tests {

using namespace test_support;
using fieldsync::export_summary;
using fieldsync::mock_http_client;

// ============================================================================
// test_all_chunks_accepted - 45 pending, chunk 20 -> 20 + 20 + 5
// ============================================================================

void test_all_chunks_accepted() {
    std::cout << "  test_all_chunks_accepted..." << std::flush;

    export_fixture f;
    add_taxpayers(f.store, 45);

    auto summary = f.taxpayers.export_all(20);
    assert(summary.chunk_count == 3);
    assert(summary.synced_count == 45);
    assert(summary.failed_count == 0);
    assert(!summary.aborted);
    assert(!summary.last_error);
    assert(summary.outcome() == export_summary::outcome_kind::complete);
    assert(summary.success());

    auto requests = export_requests(f.http);
    assert(requests.size() == 3);
    assert(local_ids(requests[0]).size() == 20);
    assert(local_ids(requests[1]).size() == 20);
    assert(local_ids(requests[2]).size() == 5);
    assert(f.store.count("contribuables") == 0);

    // One login per session
    assert(f.http.request_count() == 4);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_middle_chunk_fails - chunks 1 and 3 purged, chunk 2 retained as failed
// ============================================================================

void test_middle_chunk_fails() {
    std::cout << "  test_middle_chunk_fails..." << std::flush;

    export_fixture f;
    auto ids = add_taxpayers(f.store, 45);
    f.on_export = [](const fieldsync::http_request&, int call) {
        if (call == 2) return mock_http_client::respond(500, "Internal Server Error");
        return mock_http_client::respond(200, "{}");
    };

    auto summary = f.taxpayers.export_all(20);
    assert(summary.chunk_count == 3);
    assert(summary.synced_count == 25);
    assert(summary.failed_count == 20);
    assert(summary.last_error == std::optional<std::string>("Internal Server Error"));
    assert(summary.outcome() == export_summary::outcome_kind::partial);
    assert(!summary.success());

    assert(f.store.count("contribuables") == 20);
    for (size_t i = 0; i < ids.size(); ++i) {
        bool in_failed_chunk = i >= 20 && i < 40;
        auto record = f.store.find_taxpayer(ids[i]);
        assert(record.has_value() == in_failed_chunk);
        if (in_failed_chunk) {
            assert(record->ledger.status == fieldsync::sync_status::failed);
            assert(record->ledger.attempts == 1);
            assert(record->ledger.error == std::optional<std::string>("Internal Server Error"));
        }
    }

    // The third request carried the last five records, not the failed twenty
    auto requests = export_requests(f.http);
    auto third = local_ids(requests[2]);
    assert(third.size() == 5);
    assert(third.front() == ids[40]);

    std::cout << " OK" << std::endl;
}

void test_halt_policy_stops_at_first_failure() {
    std::cout << "  test_halt_policy_stops_at_first_failure..." << std::flush;

    export_fixture f;
    auto ids = add_taxpayers(f.store, 45);
    f.taxpayers.set_failure_policy(fieldsync::failure_policy::halt_session);
    f.on_export = [](const fieldsync::http_request&, int call) {
        if (call == 2) return mock_http_client::respond(502);
        return mock_http_client::respond(200, "{}");
    };

    auto summary = f.taxpayers.export_all(20);
    assert(summary.chunk_count == 2);
    assert(summary.synced_count == 20);
    assert(summary.failed_count == 20);
    assert(summary.last_error == std::optional<std::string>("Export failed with HTTP 502"));

    // The tail was never attempted
    auto tail = f.ledger_of(ids[44]);
    assert(tail.status == fieldsync::sync_status::pending);
    assert(tail.attempts == 0);
    assert(f.store.count("contribuables") == 25);

    std::cout << " OK" << std::endl;
}

void test_accepted_chunk_removes_attachments() {
    std::cout << "  test_accepted_chunk_removes_attachments..." << std::flush;

    export_fixture f;
    temp_dir dir("export_files");
    auto kept_photo = dir.write_file("kept.jpg", "kept");
    auto sent_photo = dir.write_file("sent.jpg", "sent");

    auto sent_id = f.store.add_taxpayer(make_taxpayer(1, {sent_photo}));
    auto kept_id = f.store.add_taxpayer(make_taxpayer(2, {kept_photo}));

    f.on_export = [](const fieldsync::http_request&, int call) {
        if (call == 2) return mock_http_client::respond(500, "rejected");
        return mock_http_client::respond(200, "{}");
    };

    auto summary = f.taxpayers.export_all(1);
    assert(summary.synced_count == 1);
    assert(summary.failed_count == 1);

    assert(!f.store.find_taxpayer(sent_id));
    assert(!fs::exists(sent_photo));

    auto kept = f.store.find_taxpayer(kept_id);
    assert(kept && kept->ledger.status == fieldsync::sync_status::failed);
    assert(fs::exists(kept_photo));

    // The file went out with the record it belongs to
    auto first = export_requests(f.http)[0];
    auto part = find_part(first, fieldsync::attachment_part_name(sent_id));
    assert(part && part->filename == "sent.jpg");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Authentication
// ============================================================================

void test_authentication_failure_makes_no_progress() {
    std::cout << "  test_authentication_failure_makes_no_progress..." << std::flush;

    export_fixture f;
    auto ids = add_taxpayers(f.store, 5);
    f.creds.clear();

    bool threw = false;
    try {
        f.taxpayers.export_all(20);
    } catch (const fieldsync::authentication_error& e) {
        threw = true;
        assert(e.kind() == fieldsync::auth_error_kind::no_credentials);
    }
    assert(threw);
    assert(f.http.request_count() == 0);
    for (auto id : ids) {
        auto fields = f.ledger_of(id);
        assert(fields.status == fieldsync::sync_status::pending);
        assert(fields.attempts == 0);
    }

    // Rejected login: same outcome
    f.creds.save({"agent@example.org", "wrong"});
    f.http.set_handler([](const fieldsync::http_request&) { return mock_http_client::respond(401); });
    threw = false;
    try {
        f.taxpayers.export_all(20);
    } catch (const fieldsync::authentication_error& e) {
        threw = true;
        assert(e.kind() == fieldsync::auth_error_kind::invalid_credentials);
    }
    assert(threw);
    assert(f.ledger_of(ids[0]).attempts == 0);
    assert(!f.gate.any_active());

    std::cout << " OK" << std::endl;
}

void test_expired_credential_aborts_session() {
    std::cout << "  test_expired_credential_aborts_session..." << std::flush;

    export_fixture f;
    auto ids = add_taxpayers(f.store, 45);
    f.on_export = [](const fieldsync::http_request&, int call) {
        if (call == 2) return mock_http_client::respond(401, "token expired");
        return mock_http_client::respond(200, "{}");
    };

    auto summary = f.taxpayers.export_all(20);
    assert(summary.aborted);
    assert(summary.chunk_count == 2);
    assert(summary.synced_count == 20);
    assert(summary.failed_count == 20);
    assert(summary.last_error.has_value());
    assert(summary.outcome() == export_summary::outcome_kind::partial);

    assert(f.ledger_of(ids[20]).status == fieldsync::sync_status::failed);
    assert(f.ledger_of(ids[44]).status == fieldsync::sync_status::pending);

    // No second login inside the session
    size_t logins = 0;
    for (const auto& request : f.http.requests()) {
        if (is_login(request)) ++logins;
    }
    assert(logins == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Single-flight
// ============================================================================

void test_concurrent_export_rejected() {
    std::cout << "  test_concurrent_export_rejected..." << std::flush;

    export_fixture f;
    add_taxpayers(f.store, 3);

    int busy_rejections = 0;
    bool parcel_export_ran = false;
    f.on_export = [&](const fieldsync::http_request& request, int) {
        if (ends_with(request.url, "/contribuables/batch")) {
            try {
                f.taxpayers.export_all(20);
            } catch (const fieldsync::session_busy_error&) {
                ++busy_rejections;
            }
            // A different kind may run alongside
            auto parcels = f.parcels.export_all(20);
            parcel_export_ran = parcels.outcome() == export_summary::outcome_kind::nothing_to_do;
        }
        return mock_http_client::respond(200, "{}");
    };

    auto summary = f.taxpayers.export_all(20);
    assert(summary.synced_count == 3);
    assert(busy_rejections == 1);
    assert(parcel_export_ran);

    // Gate reopened afterwards
    assert(!f.gate.any_active());
    assert(f.taxpayers.export_all(20).outcome() == export_summary::outcome_kind::nothing_to_do);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Session edges
// ============================================================================

void test_nothing_to_do() {
    std::cout << "  test_nothing_to_do..." << std::flush;

    export_fixture f;
    auto summary = f.taxpayers.export_all(20);
    assert(summary.chunk_count == 0);
    assert(summary.outcome() == export_summary::outcome_kind::nothing_to_do);
    assert(export_requests(f.http).empty());

    std::cout << " OK" << std::endl;
}

void test_max_chunks_caps_session() {
    std::cout << "  test_max_chunks_caps_session..." << std::flush;

    export_fixture f;
    add_taxpayers(f.store, 45);

    auto summary = f.taxpayers.export_all(10, 2);
    assert(summary.chunk_count == 2);
    assert(summary.synced_count == 20);
    assert(f.store.count("contribuables") == 25);

    std::cout << " OK" << std::endl;
}

void test_zero_chunk_size_rejected() {
    std::cout << "  test_zero_chunk_size_rejected..." << std::flush;

    export_fixture f;
    add_taxpayers(f.store, 1);

    bool threw = false;
    try {
        f.taxpayers.export_all(0);
    } catch (const fieldsync::error&) {
        threw = true;
    }
    assert(threw);
    assert(f.http.request_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_failed_records_retried_next_session() {
    std::cout << "  test_failed_records_retried_next_session..." << std::flush;

    export_fixture f;
    auto ids = add_taxpayers(f.store, 4);
    f.on_export = [](const fieldsync::http_request&, int) {
        return fieldsync::http_response::transport_failure("Connection timed out");
    };

    auto first = f.taxpayers.export_all(2);
    assert(first.chunk_count == 2);
    assert(first.failed_count == 4);
    assert(first.outcome() == export_summary::outcome_kind::failed);
    assert(f.ledger_of(ids[0]).error == std::optional<std::string>("Connection timed out"));

    f.on_export = [](const fieldsync::http_request&, int) {
        return mock_http_client::respond(200, "{}");
    };
    auto second = f.taxpayers.export_all(2);
    assert(second.synced_count == 4);
    assert(second.outcome() == export_summary::outcome_kind::complete);
    assert(f.store.count("contribuables") == 0);

    std::cout << " OK" << std::endl;
}

void test_leftover_synced_rows_purged() {
    std::cout << "  test_leftover_synced_rows_purged..." << std::flush;

    export_fixture f;
    temp_dir dir("leftovers");
    auto photo = dir.write_file("left.jpg", "left");
    auto leftover = f.store.add_taxpayer(make_taxpayer(1, {photo}));
    auto pending = f.store.add_taxpayer(make_taxpayer(2));

    // Accepted remotely, then the process died before the purge
    fieldsync::sync_ledger(f.db, "contribuables").transition_to_synced({leftover});

    auto summary = f.taxpayers.export_all(20);
    assert(summary.synced_count == 1);
    assert(!f.store.find_taxpayer(leftover));
    assert(!fs::exists(photo));

    auto requests = export_requests(f.http);
    assert(requests.size() == 1);
    assert((local_ids(requests[0]) == std::vector<int64_t>{pending}));

    std::cout << " OK" << std::endl;
}

void test_storage_error_propagates() {
    std::cout << "  test_storage_error_propagates..." << std::flush;

    export_fixture f;
    add_taxpayers(f.store, 2);
    f.on_export = [&f](const fieldsync::http_request&, int) {
        f.db.execute("DROP TABLE contribuables");
        return mock_http_client::respond(200, "{}");
    };

    bool threw = false;
    try {
        f.taxpayers.export_all(20);
    } catch (const fieldsync::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(!f.gate.any_active());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Parcels
// ============================================================================

void test_parcel_export_purges_dependents() {
    std::cout << "  test_parcel_export_purges_dependents..." << std::flush;

    export_fixture f;
    temp_dir dir("parcel_export");
    auto photo = dir.write_file("parcel.jpg", "img");
    f.store.add_parcel(make_parcel(1, {photo}));
    f.store.add_parcel(make_parcel(2));
    f.store.add_parcel(make_parcel(3));

    auto summary = f.parcels.export_all(2);
    assert(summary.chunk_count == 2);
    assert(summary.synced_count == 3);
    assert(f.store.count("parcelles") == 0);
    assert(f.store.count("personnes") == 0);
    assert(f.store.count("batiments") == 0);
    assert(!fs::exists(photo));

    auto requests = export_requests(f.http);
    assert(ends_with(requests[0].url, "/parcelles/batch"));
    auto dto = data_part(requests[0])[0];
    assert(dto["batiments"].size() == 2);
    assert(dto["personnes"].size() == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing export coordinator..." << std::endl;
    test_all_chunks_accepted();
    test_middle_chunk_fails();
    test_halt_policy_stops_at_first_failure();
    test_accepted_chunk_removes_attachments();
    test_authentication_failure_makes_no_progress();
    test_expired_credential_aborts_session();
    test_concurrent_export_rejected();
    test_nothing_to_do();
    test_max_chunks_caps_session();
    test_zero_chunk_size_rejected();
    test_failed_records_retried_next_session();
    test_leftover_synced_rows_purged();
    test_storage_error_propagates();
    test_parcel_export_purges_dependents();
}

} // namespace export_tests
