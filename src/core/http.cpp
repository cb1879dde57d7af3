#include "shortener/http.hpp"

#include <algorithm>
#include <cctype>

namespace shortener {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

// Comma separated header values like "keep-alive, Upgrade"
bool has_token(std::string_view value, std::string_view token) {
    while (!value.empty()) {
        size_t comma = value.find(',');
        if (iequals(trim(value.substr(0, comma)), token))
            return true;
        if (comma == std::string_view::npos)
            break;
        value.remove_prefix(comma + 1);
    }
    return false;
}

bool is_method(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isupper(c) != 0;
    });
}

} // namespace


bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name))
            return value;
    }
    return std::nullopt;
}

std::string_view HttpRequest::path() const {
    std::string_view view{target};
    return view.substr(0, view.find_first_of("?#"));
}

bool HttpRequest::keep_alive() const {
    auto connection = header("Connection");
    if (version == "HTTP/1.0")
        return connection && has_token(*connection, "keep-alive");
    return !(connection && has_token(*connection, "close"));
}

void HttpResponse::set_header(std::string name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name))
            return value;
    }
    return std::nullopt;
}


std::optional<HttpRequest> HttpCodec::parse(std::string& buffer) {
    // Tolerate stray line breaks between pipelined requests
    size_t skip = buffer.find_first_not_of("\r\n");
    buffer.erase(0, skip == std::string::npos ? buffer.size() : skip);

    // LF-only clients (netcat) end the head with "\n\n"
    size_t crlf_end = buffer.find("\r\n\r\n");
    size_t lf_end = buffer.find("\n\n");
    size_t head_end = std::min(crlf_end, lf_end);
    if (head_end == std::string::npos) {
        if (buffer.size() > MAX_HEADER_SIZE)
            throw ProtocolError{431, "request headers too large"};
        return std::nullopt;
    }
    if (head_end > MAX_HEADER_SIZE)
        throw ProtocolError{431, "request headers too large"};

    size_t body_start = head_end + (head_end == crlf_end ? 4 : 2);

    HttpRequest request = parse_head(std::string_view{buffer}.substr(0, head_end));
    size_t length = content_length(request);
    if (buffer.size() - body_start < length)
        return std::nullopt;

    request.body = buffer.substr(body_start, length);
    buffer.erase(0, body_start + length);
    return request;
}

HttpRequest HttpCodec::parse_head(std::string_view head) {
    std::vector<std::string_view> lines;
    while (!head.empty()) {
        size_t eol = head.find('\n');
        std::string_view line = head.substr(0, eol);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        if (eol == std::string_view::npos)
            break;
        head.remove_prefix(eol + 1);
    }
    if (lines.empty())
        throw ProtocolError{400, "empty request"};

    // Request line: METHOD SP target SP version
    std::string_view request_line = lines[0];
    size_t first = request_line.find(' ');
    size_t last = request_line.rfind(' ');
    if (first == std::string_view::npos || first == last)
        throw ProtocolError{400, "malformed request line"};

    HttpRequest request;
    request.method = std::string{request_line.substr(0, first)};
    request.target = std::string{request_line.substr(first + 1, last - first - 1)};
    request.version = std::string{request_line.substr(last + 1)};

    if (!is_method(request.method) || request.target.empty() ||
        request.target.find(' ') != std::string::npos)
        throw ProtocolError{400, "malformed request line"};

    if (request.version.rfind("HTTP/", 0) != 0)
        throw ProtocolError{400, "malformed request line"};
    if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0")
        throw ProtocolError{505, "http version not supported"};

    if (request.target.front() != '/')
        throw ProtocolError{400, "unsupported request target"};

    for (size_t i = 1; i < lines.size(); i++) {
        std::string_view line = lines[i];
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            throw ProtocolError{400, "malformed header line"};

        std::string_view name = line.substr(0, colon);
        if (name.find_first_of(" \t") != std::string_view::npos)
            throw ProtocolError{400, "malformed header line"};

        request.headers.emplace_back(std::string{name}, std::string{trim(line.substr(colon + 1))});
    }

    return request;
}

size_t HttpCodec::content_length(const HttpRequest& request) {
    if (request.header("Transfer-Encoding"))
        throw ProtocolError{501, "transfer encoding not supported"};

    auto value = request.header("Content-Length");
    if (!value)
        return 0;

    // Anything past 19 digits would overflow; it is far beyond the limit anyway
    if (value->empty() || value->size() > 19 ||
        !std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw ProtocolError{400, "invalid content-length"};

    size_t length = std::stoull(*value);
    if (length > MAX_BODY_SIZE)
        throw ProtocolError{413, "request body too large"};
    return length;
}

std::string HttpCodec::format(const HttpResponse& response, bool keep_alive) {
    std::string out;
    out.reserve(128 + response.body.size());

    out += "HTTP/1.1 " + std::to_string(response.status) + " ";
    out += reason_phrase(response.status);
    out += "\r\n";

    for (const auto& [name, value] : response.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Connection"))
            continue;
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += response.body;
    return out;
}

std::string_view HttpCodec::reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

} // namespace shortener
