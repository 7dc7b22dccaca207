#pragma once

#include <fieldsync/config.hpp>
#include <fieldsync/network.hpp>
#include <optional>
#include <string>

namespace fieldsync {

// http_client over cpp-httplib. One connection per request; multipart
// requests are encoded by httplib, which also picks the boundary.
class httplib_client : public http_client {
public:
    explicit httplib_client(const sync_config& config);

    http_response send(const http_request& request) override;

    struct url_parts {
        std::string origin;   // scheme://host[:port]
        std::string path;     // at least "/"
    };

    /// Split an absolute URL. Returns nullopt for anything but http(s).
    static std::optional<url_parts> split_url(const std::string& url);

private:
    int connect_timeout_;
    int read_timeout_;
    int write_timeout_;
};

} // namespace fieldsync
