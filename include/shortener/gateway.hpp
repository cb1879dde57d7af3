#pragma once

#include "shortener/http.hpp"
#include "shortener/mapping_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace shortener {

/*
 * Maps HTTP requests onto store operations:
 *   POST /put     store the body as a new mapping, answer with its code
 *   GET  /<code>  permanent redirect to the stored url
 *   GET  /        the configured index page
 * This is the only place where store errors become status codes.
 */
class Gateway {
public:
    explicit Gateway(MappingStore& store,
                     std::optional<std::filesystem::path> index_path = std::nullopt);

    HttpResponse handle(const HttpRequest& request) const;

    // Trims surrounding whitespace and checks the url is an absolute
    // http(s) url. Returns the trimmed url, throws ValidationError.
    static std::string validate_url(std::string_view raw);

    // {"ok":<ok>,"msg":<msg>}
    static HttpResponse json_response(int status, bool ok, std::string_view msg);

private:
    HttpResponse put(const HttpRequest& request) const;
    HttpResponse lookup(std::string_view code) const;
    HttpResponse index() const;

    MappingStore& store_;
    std::optional<std::filesystem::path> index_path_;
};

} // namespace shortener
