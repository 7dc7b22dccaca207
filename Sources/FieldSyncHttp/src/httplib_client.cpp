#include "fieldsync/httplib_client.hpp"
#include <fieldsync/log.hpp>
#include <httplib.h>

namespace fieldsync {

httplib_client::httplib_client(const sync_config& config)
    : connect_timeout_(config.connect_timeout)
    , read_timeout_(config.read_timeout)
    , write_timeout_(config.write_timeout) {}

std::optional<httplib_client::url_parts> httplib_client::split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    auto path_start = url.find('/', scheme_end + 3);
    url_parts parts;
    if (path_start == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, path_start);
        parts.path = url.substr(path_start);
    }
    if (parts.origin.size() <= scheme_end + 3) return std::nullopt;
    return parts;
}

http_response httplib_client::send(const http_request& request) {
    auto parts = split_url(request.url);
    if (!parts) {
        return http_response::transport_failure("Unsupported URL: " + request.url);
    }

    httplib::Client client(parts->origin);
    client.set_connection_timeout(connect_timeout_, 0);
    client.set_read_timeout(read_timeout_, 0);
    client.set_write_timeout(write_timeout_, 0);

    httplib::Headers headers;
    std::string content_type;
    for (const auto& [name, value] : request.headers) {
        if (name == "Content-Type") {
            content_type = value;
        } else {
            headers.emplace(name, value);
        }
    }
    std::string body(request.body.begin(), request.body.end());

    if (request.method != "GET" && request.method != "POST" &&
        request.method != "PUT" && request.method != "DELETE") {
        return http_response::transport_failure("Unsupported method: " + request.method);
    }
    if (request.is_multipart() && request.method != "POST") {
        return http_response::transport_failure("Multipart bodies are only sent with POST");
    }

    httplib::MultipartFormDataItems items;
    for (const auto& part : request.parts) {
        httplib::MultipartFormData item;
        item.name = part.name;
        item.content = std::string(part.content.begin(), part.content.end());
        item.filename = part.filename;
        item.content_type = part.content_type;
        items.push_back(std::move(item));
    }

    auto perform = [&]() -> httplib::Result {
        if (request.method == "GET") return client.Get(parts->path, headers);
        if (request.is_multipart()) return client.Post(parts->path, headers, items);
        if (request.method == "POST") return client.Post(parts->path, headers, body, content_type);
        if (request.method == "PUT") return client.Put(parts->path, headers, body, content_type);
        return client.Delete(parts->path, headers);
    };
    auto result = perform();

    if (!result) {
        auto message = httplib::to_string(result.error());
        LOG_WARN("http", "%s %s failed: %s", request.method.c_str(), request.url.c_str(), message.c_str());
        return http_response::transport_failure(message);
    }

    http_response response;
    response.status_code = result->status;
    for (const auto& [name, value] : result->headers) {
        response.headers[name] = value;
    }
    response.body = byte_vector(result->body.begin(), result->body.end());
    LOG_DEBUG("http", "%s %s -> %d", request.method.c_str(), request.url.c_str(), response.status_code);
    return response;
}

} // namespace fieldsync
