#include "shortener/gateway.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace shortener {

namespace {

constexpr std::string_view kAllowedSchemes[] = {"http", "https"};

HttpResponse status_only(int status) {
    HttpResponse response;
    response.status = status;
    return response;
}

HttpResponse method_not_allowed(std::string allow) {
    HttpResponse response = status_only(405);
    response.set_header("Allow", std::move(allow));
    return response;
}

bool is_scheme(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front())))
        return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace


Gateway::Gateway(MappingStore& store, std::optional<std::filesystem::path> index_path)
    : store_(store), index_path_(std::move(index_path)) {}

HttpResponse Gateway::handle(const HttpRequest& request) const {
    std::string_view path = request.path();

    if (path == "/put") {
        if (request.method != "POST")
            return method_not_allowed("POST");
        return put(request);
    }

    if (path == "/") {
        if (request.method != "GET")
            return method_not_allowed("GET");
        return index();
    }

    std::string_view code = path.substr(1);
    if (code.find('/') != std::string_view::npos)
        return status_only(404);
    if (request.method != "GET")
        return method_not_allowed("GET");
    return lookup(code);
}

HttpResponse Gateway::put(const HttpRequest& request) const {
    try {
        std::string url = validate_url(request.body);
        std::string code = store_.put(url);
        std::cout << "[Gateway] stored " << code << " -> " << url << "\n";
        return json_response(201, true, code);
    } catch (const ValidationError& e) {
        return json_response(400, false, e.what());
    } catch (const ExhaustedError& e) {
        std::cerr << "[Gateway] " << e.what() << "\n";
        return json_response(500, false, "no free short code available");
    } catch (const StoreError& e) {
        std::cerr << "[Gateway] db error: " << e.what() << "\n";
        return json_response(500, false, "problem with database");
    }
}

HttpResponse Gateway::lookup(std::string_view code) const {
    std::optional<std::string> url;
    try {
        url = store_.get(std::string{code});
    } catch (const StoreError& e) {
        std::cerr << "[Gateway] db error: " << e.what() << "\n";
        return json_response(500, false, "problem with database");
    }

    if (!url)
        return status_only(404);

    std::cout << "[Gateway] found code " << code << " -> " << *url << "\n";
    HttpResponse response = status_only(308);
    response.set_header("Location", *url);
    return response;
}

HttpResponse Gateway::index() const {
    if (!index_path_)
        return status_only(404);

    // Read on every request so the page can be edited without a restart
    std::error_code ec;
    std::ifstream file(*index_path_, std::ios::binary);
    if (!std::filesystem::is_regular_file(*index_path_, ec) || !file) {
        std::cerr << "[Gateway] cannot read index file " << index_path_->string() << "\n";
        return status_only(404);
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        std::cerr << "[Gateway] cannot read index file " << index_path_->string() << "\n";
        return status_only(404);
    }

    HttpResponse response = status_only(200);
    response.set_header("Content-Type", "text/html; charset=utf-8");
    response.body = content.str();
    return response;
}

std::string Gateway::validate_url(std::string_view raw) {
    std::string_view url = raw;
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front())))
        url.remove_prefix(1);
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back())))
        url.remove_suffix(1);

    if (url.empty())
        throw ValidationError{"empty url"};

    // Only printable ASCII: spaces, controls and raw UTF-8 must be percent-encoded
    for (unsigned char c : url) {
        if (c <= 0x20 || c >= 0x7f)
            throw ValidationError{"invalid url: illegal character"};
    }

    size_t colon = url.find(':');
    if (colon == std::string_view::npos || !is_scheme(url.substr(0, colon)))
        throw ValidationError{"url missing scheme"};

    std::string_view scheme = url.substr(0, colon);
    bool allowed = std::any_of(std::begin(kAllowedSchemes), std::end(kAllowedSchemes),
                               [scheme](std::string_view s) { return iequals(s, scheme); });
    if (!allowed)
        throw ValidationError{"unsupported url scheme: " + std::string{scheme}};

    std::string_view rest = url.substr(colon + 1);
    if (!rest.starts_with("//"))
        throw ValidationError{"invalid url: missing host"};

    std::string_view authority = rest.substr(2, rest.find_first_of("/?#", 2) - 2);
    std::string_view host = authority.substr(authority.find('@') + 1);
    if (host.empty() || host.front() == ':')
        throw ValidationError{"invalid url: missing host"};

    return std::string{url};
}

HttpResponse Gateway::json_response(int status, bool ok, std::string_view msg) {
    nlohmann::ordered_json body;
    body["ok"] = ok;
    body["msg"] = std::string{msg};

    HttpResponse response = status_only(status);
    response.set_header("Content-Type", "application/json");
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

} // namespace shortener
