#pragma once

#include <string>
#include <vector>
#include <functional>
#include <map>
#include <mutex>
#include <cstdint>

namespace fieldsync {

using headers_map = std::map<std::string, std::string>;
using byte_vector = std::vector<uint8_t>;

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. Implementations:
// - FieldSyncHttp: cpp-httplib
// - Tests: mock_http_client below

struct http_response {
    int status_code = 0;                // 0 when the request never reached a server
    headers_map headers;
    byte_vector body;
    std::string error;                  // transport failure description

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    bool is_transport_failure() const { return status_code == 0; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }

    static http_response transport_failure(std::string message) {
        http_response response;
        response.error = std::move(message);
        return response;
    }
};

// One part of a multipart/form-data body
struct multipart_part {
    std::string name;
    std::string filename;               // empty for plain fields
    std::string content_type;
    byte_vector content;
};

struct http_request {
    std::string method = "GET";
    std::string url;
    headers_map headers;
    byte_vector body;
    std::vector<multipart_part> parts;  // non-empty: send as multipart/form-data

    void set_body(const std::string& s) {
        body = byte_vector(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    void set_bearer_token(const std::string& token) {
        headers["Authorization"] = "Bearer " + token;
    }

    // The transport picks the boundary and writes the Content-Type header.
    void set_multipart(std::vector<multipart_part> form) {
        body.clear();
        headers.erase("Content-Type");
        parts = std::move(form);
    }

    bool is_multipart() const { return !parts.empty(); }
};

class http_client {
public:
    virtual ~http_client() = default;

    // Blocks until the response arrives or the transport gives up
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// Mock implementation for testing
// ============================================================================

class mock_http_client : public http_client {
public:
    using handler_fn = std::function<http_response(const http_request&)>;

    explicit mock_http_client(handler_fn handler = nullptr) : handler_(std::move(handler)) {}

    void set_handler(handler_fn handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    http_response send(const http_request& request) override {
        handler_fn handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (!handler) return http_response{200, {}, {}, {}};
        return handler(request);
    }

    // Test helpers
    std::vector<http_request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

    static http_response respond(int status, const std::string& body = "") {
        http_response response;
        response.status_code = status;
        response.body = byte_vector(body.begin(), body.end());
        return response;
    }

private:
    mutable std::mutex mutex_;
    handler_fn handler_;
    std::vector<http_request> requests_;
};

} // namespace fieldsync
