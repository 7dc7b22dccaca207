#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "network.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace fieldsync {

struct credentials {
    std::string email;
    std::string password;

    bool complete() const { return !email.empty() && !password.empty(); }
};

// ============================================================================
// credential_store - where the login secrets live
// ============================================================================
//
// Storage and encryption of the secrets belong to the application; the sync
// layer only reads them at the start of a session.

class credential_store {
public:
    virtual ~credential_store() = default;

    virtual std::optional<credentials> stored_credentials() = 0;
    virtual void save(const credentials& creds) = 0;
    virtual void clear() = 0;
};

class memory_credential_store : public credential_store {
public:
    memory_credential_store() = default;
    explicit memory_credential_store(credentials creds) : creds_(std::move(creds)) {}

    std::optional<credentials> stored_credentials() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return creds_;
    }

    void save(const credentials& creds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        creds_ = creds;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        creds_.reset();
    }

private:
    std::mutex mutex_;
    std::optional<credentials> creds_;
};

// ============================================================================
// authenticator - exchanges stored credentials for a bearer token
// ============================================================================

class authenticator {
public:
    authenticator(http_client& client, const sync_config& config, credential_store& store);

    /// Login with the stored credentials. Throws authentication_error.
    std::string authenticate();

    /// Login with explicit credentials. Throws authentication_error.
    std::string authenticate_with(const credentials& creds);

    /// Token from a 2xx login body: the first non-empty of token,
    /// access_token, jwt, accessToken, or the raw body when it is not JSON.
    static std::optional<std::string> extract_token(const std::string& body);

private:
    http_client& client_;
    const sync_config& config_;
    credential_store& store_;
};

} // namespace fieldsync
