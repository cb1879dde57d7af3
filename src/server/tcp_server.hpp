#pragma once

#include "connection.hpp"
#include "waker.hpp"
#include "shortener/gateway.hpp"
#include "shortener/http.hpp"
#include "shortener/socket.hpp"
#include "shortener/task_deque.hpp"

#include <poll.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace shortener {

struct Task {
    std::weak_ptr<Connection> connection;
    HttpRequest request;
    std::function<void()> on_complete; // Reactor poke callback

    void execute(const Gateway& gateway) {
        if (auto client = connection.lock()) {
            HttpResponse response;
            try {
                response = gateway.handle(request);
            } catch (const std::exception& e) {
                // The client still gets an answer, otherwise the connection stalls in flight
                std::cerr << "[Worker] " << e.what() << std::endl;
                response = Gateway::json_response(500, false, "internal error");
            }
            bool keep_alive = request.keep_alive();
            client->append_response(HttpCodec::format(response, keep_alive), keep_alive);
            if (on_complete)
                on_complete();
        } else {
            // The Reactor already deleted this connection
            std::cout << "[Worker] Skipping task: Client already disconnected." << std::endl;
        }
    }
};


/*
 * HTTP server: one reactor thread moving bytes with poll(), and a pool of
 * workers running the gateway.
 */
class TcpServer {
public:
    TcpServer(std::string host, uint16_t port, const Gateway& gateway, size_t num_workers = 5)
        : host_(std::move(host)), port_(port), gateway_(gateway), num_workers_(num_workers) {}

    ~TcpServer() = default;

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    TcpServer(TcpServer&&) = delete;
    TcpServer& operator=(TcpServer&&) = delete;

    // Bind, listen and serve until stop() or SIGINT/SIGTERM.
    // Throws std::runtime_error if the listener cannot be set up.
    void start();

    // Ask the reactor to shut down. Safe from other threads and signal handlers.
    void stop() noexcept;

    // Returns true while the reactor is serving
    bool is_running() const noexcept;

    // Port the listener is bound to, 0 before start()
    uint16_t bound_port() const noexcept;

private:
    std::string host_;
    uint16_t port_{0};
    const Gateway& gateway_;
    Socket listen_socket_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint16_t> bound_port_{0};

    // Reactor event loop
    void run_reactor();
    void handle_new_connection();
    bool handle_client_read(size_t& poll_fds_idx);
    bool handle_client_write(size_t& poll_fds_idx);
    void handle_client_dc(size_t& poll_fds_idx);
    void dispatch(int fd, const std::shared_ptr<Connection>& client);
    void reject(int fd, Connection& client, int status, const std::string& message);
    void enable_write(int fd);
    void shutdown();

    // Thread pool
    size_t num_workers_{5};
    TaskDeque<Task> task_deque_;
    std::vector<pollfd> poll_fds_;
    std::map<int, std::shared_ptr<Connection>> clients_; // fd -> connection map
    void setup_workers();
    void worker_loop(std::stop_token stop_token);

    // Waker
    Waker waker_;
    inline static std::atomic<TcpServer*> s_this_server{nullptr}; // target of the signal handler
    static void signal_handler(int) {
        if (auto* server = s_this_server.load())
            server->stop();
    }

    // dirty list: fds whose outbox was filled by a worker
    std::mutex dirty_mutex_;
    std::vector<int> dirty_fds_;
    std::unordered_map<int, size_t> fd_idx_map_;

    void mark_as_dirty(int fd);
    void apply_dirty_updates();

    // Declared last so the workers are joined before anything they touch is destroyed
    std::vector<std::jthread> workers_;
};

} // namespace shortener
