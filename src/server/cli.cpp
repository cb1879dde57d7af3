#include "cli.hpp"

#include "shortener/sqlite_store.hpp"

#include <charconv>
#include <system_error>
#include <tuple>

namespace shortener {

namespace {

constexpr size_t kMaxWorkers = 256;

// Splits "--name=value" into ("name", "value"); "--name" gives ("name", nullopt)
std::pair<std::string_view, std::optional<std::string_view>> split_flag(std::string_view arg) {
    arg.remove_prefix(2);
    size_t eq = arg.find('=');
    if (eq == std::string_view::npos)
        return {arg, std::nullopt};
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

} // namespace


CliCommand Cli::parse(const std::vector<std::string_view>& args) {
    if (args.empty())
        throw UsageError{"missing command"};

    std::string_view command = args[0];
    std::vector<std::string_view> rest(args.begin() + 1, args.end());

    if (command == "serve")
        return parse_serve(rest);
    if (command == "ls")
        return parse_list(rest);
    if (command == "help" || command == "-h" || command == "--help")
        return HelpCommand{};

    throw UsageError{"unknown command: " + std::string{command}};
}

ServeCommand Cli::parse_serve(const std::vector<std::string_view>& args) {
    ServeCommand serve;
    bool have_db = false;

    for (size_t i = 0; i < args.size(); i++) {
        std::string_view arg = args[i];

        if (!arg.starts_with("--")) {
            if (have_db)
                throw UsageError{"unexpected argument: " + std::string{arg}};
            serve.db_path = std::filesystem::path{std::string{arg}};
            have_db = true;
            continue;
        }

        auto [name, inline_value] = split_flag(arg);
        if (name != "url" && name != "index" && name != "workers")
            throw UsageError{"unknown option: " + std::string{arg}};

        std::string_view value;
        if (inline_value) {
            value = *inline_value;
        } else {
            if (i + 1 >= args.size())
                throw UsageError{"--" + std::string{name} + " requires a value"};
            value = args[++i];
        }
        if (value.empty())
            throw UsageError{"--" + std::string{name} + " requires a value"};

        if (name == "url") {
            std::tie(serve.host, serve.port) = parse_address(value);
        } else if (name == "index") {
            serve.index_path = std::filesystem::path{std::string{value}};
        } else {
            serve.num_workers = parse_workers(value);
        }
    }

    if (!have_db)
        throw UsageError{"missing database path"};
    return serve;
}

ListCommand Cli::parse_list(const std::vector<std::string_view>& args) {
    if (args.empty())
        throw UsageError{"missing database path"};
    if (args[0].starts_with("--"))
        throw UsageError{"unknown option: " + std::string{args[0]}};
    if (args.size() > 1)
        throw UsageError{"unexpected argument: " + std::string{args[1]}};
    return ListCommand{std::filesystem::path{std::string{args[0]}}};
}

std::pair<std::string, uint16_t> Cli::parse_address(std::string_view value) {
    size_t colon = value.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == value.size())
        throw UsageError{"invalid address, expected host:port: " + std::string{value}};

    std::string host{value.substr(0, colon)};
    if (host == "localhost")
        host = "127.0.0.1";

    // IPv6 literals are bracketed: [::1]:8080
    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']')
            throw UsageError{"invalid address, expected [ipv6]:port: " + std::string{value}};
        host = host.substr(1, host.size() - 2);
    } else if (host.find_first_of(":]") != std::string::npos) {
        throw UsageError{"invalid address, IPv6 hosts need brackets: " + std::string{value}};
    }

    std::string_view port_text = value.substr(colon + 1);
    uint16_t port = 0;
    auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || end != port_text.data() + port_text.size())
        throw UsageError{"invalid port: " + std::string{port_text}};

    return {host, port};
}

size_t Cli::parse_workers(std::string_view value) {
    size_t workers = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), workers);
    if (ec != std::errc{} || end != value.data() + value.size() || workers == 0 || workers > kMaxWorkers)
        throw UsageError{"--workers must be between 1 and " + std::to_string(kMaxWorkers)};
    return workers;
}

std::string Cli::usage(std::string_view program) {
    std::string name{program};
    return "Usage:\n"
           "  " + name + " serve <db> [--url <host:port>] [--index <file>] [--workers <n>]\n"
           "  " + name + " ls <db>\n"
           "\n"
           "  serve    run the HTTP service on the database file <db>\n"
           "           --url      listen address, IPv4 or [IPv6] (default 127.0.0.1:8080)\n"
           "           --index    html file served on /\n"
           "           --workers  request worker threads (default 5)\n"
           "  ls       list every code -> url mapping in <db>\n";
}

int Cli::run_list(const ListCommand& command, std::ostream& out, std::ostream& err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(command.db_path, ec)) {
        err << "database file does not exist or is not a file: " << command.db_path.string() << "\n";
        return 1;
    }

    try {
        SqliteMappingStore store(command.db_path, SqliteMappingStore::OpenMode::ReadOnly);
        print_listing(store.list(), command.db_path, out);
    } catch (const StoreError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

void Cli::print_listing(const std::vector<Mapping>& mappings,
                        const std::filesystem::path& db_path, std::ostream& out) {
    out << mappings.size() << " mapping" << (mappings.size() == 1 ? "" : "s")
        << " found in " << db_path.string() << ":\n";
    for (const auto& mapping : mappings)
        out << "  " << mapping.code << " -> " << mapping.url << "\n";
}

} // namespace shortener
