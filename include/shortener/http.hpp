#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shortener {

// Malformed or unsupported request. status() is the HTTP status to answer with.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int status, const std::string& msg) : std::runtime_error(msg), status_(status) {}
    int status() const noexcept { return status_; }

private:
    int status_;
};

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;
    std::string version;
    Headers headers;
    std::string body;

    // Header lookup, name is case-insensitive
    std::optional<std::string> header(std::string_view name) const;

    // Target without the query string
    std::string_view path() const;

    bool keep_alive() const;
};

struct HttpResponse {
    int status{200};
    Headers headers;
    std::string body;

    void set_header(std::string name, std::string value);
    std::optional<std::string> header(std::string_view name) const;
};

/*
 * HTTP/1.x message framing.
 * Requests are parsed incrementally from a connection's receive buffer,
 * responses are serialized whole.
 */
class HttpCodec {
public:
    static constexpr size_t MAX_HEADER_SIZE = 8 * 1024;
    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

    // Removes one complete request from the front of buffer.
    // Returns std::nullopt (buffer untouched) if more bytes are needed.
    // Throws ProtocolError if the request can never be valid.
    static std::optional<HttpRequest> parse(std::string& buffer);

    static std::string format(const HttpResponse& response, bool keep_alive);

    static std::string_view reason_phrase(int status);

private:
    static HttpRequest parse_head(std::string_view head);
    static size_t content_length(const HttpRequest& request);
};

bool iequals(std::string_view a, std::string_view b);

} // namespace shortener
