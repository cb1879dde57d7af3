#pragma once

#include "shortener/mapping_store.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shortener {

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServeCommand {
    std::filesystem::path db_path;
    std::string host{"127.0.0.1"};
    uint16_t port{8080};
    std::optional<std::filesystem::path> index_path;
    size_t num_workers{5};
};

struct ListCommand {
    std::filesystem::path db_path;
};

struct HelpCommand {};

using CliCommand = std::variant<ServeCommand, ListCommand, HelpCommand>;

/*
 * Command line front end.
 *   serve <db> [--url host:port] [--index file] [--workers n]
 *   ls <db>
 */
class Cli {
public:
    // args excludes the program name. Throws UsageError.
    static CliCommand parse(const std::vector<std::string_view>& args);

    static std::string usage(std::string_view program);

    // Prints the mapping count followed by one "code -> url" line each.
    // Returns the process exit code.
    static int run_list(const ListCommand& command, std::ostream& out, std::ostream& err);

    static void print_listing(const std::vector<Mapping>& mappings,
                              const std::filesystem::path& db_path, std::ostream& out);

private:
    static ServeCommand parse_serve(const std::vector<std::string_view>& args);
    static ListCommand parse_list(const std::vector<std::string_view>& args);
    static std::pair<std::string, uint16_t> parse_address(std::string_view value);
    static size_t parse_workers(std::string_view value);
};

} // namespace shortener
