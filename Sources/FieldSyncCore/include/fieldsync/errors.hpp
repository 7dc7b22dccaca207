#pragma once

#include <stdexcept>
#include <string>

namespace fieldsync {

class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Local storage failure. Propagates out of a session as a terminal error.
class db_error : public error {
public:
    explicit db_error(const std::string& msg) : error(msg) {}
};

enum class auth_error_kind {
    no_credentials,
    invalid_credentials,
    network_error,
    server_error,
    invalid_response,
    unknown_error
};

const char* to_string(auth_error_kind kind);

/// Could not obtain a session credential. Fatal to the session.
class authentication_error : public error {
public:
    authentication_error(const std::string& msg, auth_error_kind kind)
        : error(msg), kind_(kind) {}

    auth_error_kind kind() const { return kind_; }

private:
    auth_error_kind kind_;
};

/// Another session holds the gate this operation needs.
class session_busy_error : public error {
public:
    explicit session_busy_error(const std::string& msg) : error(msg) {}
};

/// A chunk's records could not be turned into a request body.
class payload_error : public error {
public:
    explicit payload_error(const std::string& msg) : error(msg) {}
};

class config_error : public error {
public:
    explicit config_error(const std::string& msg) : error(msg) {}
};

} // namespace fieldsync
