#include "cli.hpp"
#include "tcp_server.hpp"

#include "shortener/gateway.hpp"
#include "shortener/sqlite_store.hpp"

#include <iostream>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

/*
 * Entry point for the shortener executable.
 * parse CLI args
 * serve or list
 */

namespace {

int serve(const shortener::ServeCommand& command) {
    std::error_code ec;
    if (command.index_path && !std::filesystem::is_regular_file(*command.index_path, ec)) {
        std::cerr << "index file does not exist or is not a file: "
                  << command.index_path->string() << "\n";
        return 1;
    }

    try {
        shortener::SqliteMappingStore store(command.db_path);
        shortener::Gateway gateway(store, command.index_path);
        shortener::TcpServer server(command.host, command.port, gateway, command.num_workers);

        std::cout << "Starting shortener at http://" << shortener::format_address(command.host, command.port)
                  << ", db at " << command.db_path.string() << std::endl;
        server.start();
    } catch (const std::runtime_error& e) {
        // StorageError while opening the database, or a bind/listen failure
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    std::string_view program = argc > 0 ? argv[0] : "shortener";

    shortener::CliCommand command;
    try {
        command = shortener::Cli::parse(args);
    } catch (const shortener::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << shortener::Cli::usage(program);
        return 2;
    }

    return std::visit([&](const auto& cmd) -> int {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, shortener::ServeCommand>) {
            return serve(cmd);
        } else if constexpr (std::is_same_v<T, shortener::ListCommand>) {
            return shortener::Cli::run_list(cmd, std::cout, std::cerr);
        } else {
            std::cout << shortener::Cli::usage(program);
            return 0;
        }
    }, command);
}
