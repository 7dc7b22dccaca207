#include "fieldsync/credentials.hpp"
#include "fieldsync/log.hpp"
#include <nlohmann/json.hpp>

namespace fieldsync {

using json = nlohmann::json;

authenticator::authenticator(http_client& client, const sync_config& config, credential_store& store)
    : client_(client), config_(config), store_(store) {}

std::string authenticator::authenticate() {
    auto creds = store_.stored_credentials();
    if (!creds) {
        throw authentication_error("No stored credentials found",
                                   auth_error_kind::no_credentials);
    }
    if (!creds->complete()) {
        throw authentication_error("Stored credentials are incomplete",
                                   auth_error_kind::no_credentials);
    }
    return authenticate_with(*creds);
}

std::string authenticator::authenticate_with(const credentials& creds) {
    http_request request;
    request.method = "POST";
    request.url = config_.url_for(config_.login_path);
    request.headers["Accept"] = "application/json";
    request.set_json_body(json{{"email", creds.email}, {"password", creds.password}}.dump());

    LOG_DEBUG("auth", "POST %s", request.url.c_str());
    auto response = client_.send(request);

    if (response.is_transport_failure()) {
        LOG_WARN("auth", "Login request failed: %s", response.error.c_str());
        throw authentication_error("Network error: unable to reach the server. " + response.error,
                                   auth_error_kind::network_error);
    }

    int status = response.status_code;
    if (response.is_success()) {
        auto token = extract_token(response.body_string());
        if (!token) {
            throw authentication_error("Token not found in login response",
                                       auth_error_kind::invalid_response);
        }
        LOG_INFO("auth", "Authenticated as %s", creds.email.c_str());
        return *token;
    }
    if (status == 401 || status == 403) {
        throw authentication_error("Invalid credentials",
                                   auth_error_kind::invalid_credentials);
    }
    if (status >= 500) {
        throw authentication_error("Server error (" + std::to_string(status) + ")",
                                   auth_error_kind::server_error);
    }
    throw authentication_error("Authentication failed with status " + std::to_string(status) +
                               ": " + response.body_string(),
                               auth_error_kind::unknown_error);
}

std::optional<std::string> authenticator::extract_token(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (const char* key : {"token", "access_token", "jwt", "accessToken"}) {
            auto it = parsed.find(key);
            if (it == parsed.end() || it->is_null()) continue;
            std::string value = it->is_string() ? it->get<std::string>() : it->dump();
            if (!value.empty()) return value;
        }
        return std::nullopt;
    }

    // The body is the token itself
    if (body.front() != '{') {
        auto first = body.find_first_not_of(" \t\r\n\"");
        auto last = body.find_last_not_of(" \t\r\n\"");
        if (first == std::string::npos) return std::nullopt;
        return body.substr(first, last - first + 1);
    }
    return std::nullopt;
}

} // namespace fieldsync
