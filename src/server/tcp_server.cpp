#include "tcp_server.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

namespace shortener {


void TcpServer::start() {
    if (running_)
        throw std::runtime_error("Server is already running");

    listen_socket_ = Socket::listen_tcp(host_, port_);
    bound_port_ = listen_socket_.local_port();

    std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE
    s_this_server = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    poll_fds_.push_back({listen_socket_.fd(), POLLIN, 0}); // The server listening socket
    poll_fds_.push_back({waker_.read_fd(), POLLIN, 0}); // The read-end of the self-pipe

    setup_workers();
    running_ = true;
    std::cout << "Listening on " << format_address(host_, bound_port_) << std::endl;

    try {
        run_reactor();
    } catch (const std::exception& e) {
        std::cerr << "[Reactor] " << e.what() << std::endl;
        shutdown();
        throw;
    }
    shutdown();
}

void TcpServer::run_reactor() {
    while (!stop_requested_) {
        apply_dirty_updates();
        int activity = ::poll(poll_fds_.data(), poll_fds_.size(), -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGCONT
                continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = 0; i < poll_fds_.size(); i++) {
            short revents = poll_fds_[i].revents;
            if (revents == 0)
                continue;

            // Waker poke
            if (poll_fds_[i].fd == waker_.read_fd()) {
                if (revents & POLLIN)
                    waker_.clear();
                continue;
            }

            // New client
            if (poll_fds_[i].fd == listen_socket_.fd()) {
                if (revents & POLLIN)
                    handle_new_connection();
                continue;
            }

            // Each handler returns false once the client at i is gone
            if ((revents & POLLIN) && !handle_client_read(i))
                continue;

            if ((revents & POLLOUT) && !handle_client_write(i))
                continue;

            if (revents & (POLLERR | POLLHUP | POLLNVAL))
                handle_client_dc(i);
        }
    }
}

void TcpServer::apply_dirty_updates() {
    std::vector<int> local_dirty;
    {
        // Swap to a local vector to keep the lock time minimal
        std::lock_guard lock(dirty_mutex_);
        local_dirty.swap(dirty_fds_);
    }

    for (auto fd : local_dirty) {
        auto it = fd_idx_map_.find(fd);
        if (it == fd_idx_map_.end())
            continue;
        poll_fds_[it->second].events |= POLLOUT;
        // The finished request may have been blocking a pipelined one
        dispatch(fd, clients_[fd]);
    }
}

void TcpServer::mark_as_dirty(int fd) {
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.push_back(fd);
    }
    waker_.notify();
}

void TcpServer::enable_write(int fd) {
    auto it = fd_idx_map_.find(fd);
    if (it != fd_idx_map_.end())
        poll_fds_[it->second].events |= POLLOUT;
}

bool TcpServer::handle_client_write(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto& client_connection = clients_[fd];

    try {
        if (!client_connection->write_from_outbox()) {  // if "everything has been written"
            poll_fds_[poll_fds_idx].events &= ~POLLOUT; // Outbox empty, turn off POLLOUT
            if (client_connection->finished()) {
                handle_client_dc(poll_fds_idx);
                return false;
            }
        }
    } catch (const IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }
    return true;
}

void TcpServer::handle_client_dc(size_t& poll_fds_idx) {
    int moving_fd = poll_fds_.back().fd;
    int dead_fd = poll_fds_[poll_fds_idx].fd;

    // swap & pop to remove dead connection in O(1)
    if (poll_fds_idx < poll_fds_.size() - 1) {
        std::swap(poll_fds_[poll_fds_idx], poll_fds_.back());
        fd_idx_map_[moving_fd] = poll_fds_idx;
    }
    fd_idx_map_.erase(dead_fd);
    clients_.erase(dead_fd);
    poll_fds_.pop_back();
    poll_fds_idx--;

    std::cout << "Client [" << dead_fd << "] disconnected\n";
}

void TcpServer::handle_new_connection() {
    // Drain the accept backlog, the listener is non-blocking
    try {
        while (auto client = listen_socket_.accept()) {
            int current_fd = client->fd();
            std::cout << "Client [" << current_fd << "] connected on port " << bound_port_ << "\n";
            poll_fds_.push_back({current_fd, POLLIN, 0});
            fd_idx_map_[current_fd] = poll_fds_.size() - 1;
            clients_[current_fd] = std::make_shared<Connection>(std::move(*client));
        }
    } catch (const std::runtime_error& e) {
        // e.g. EMFILE: keep serving the clients we have
        std::cerr << "[Reactor] " << e.what() << std::endl;
    }
}

bool TcpServer::handle_client_read(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto client_connection = clients_[fd];
    try {
        // Pull data from the OS into our buffer
        if (!client_connection->read_to_inbox()) {
            // EOF may only be a half-close: answer what was received first
            client_connection->shutdown_read();
            poll_fds_[poll_fds_idx].events &= ~POLLIN;
            dispatch(fd, client_connection);
            if (client_connection->finished()) {
                handle_client_dc(poll_fds_idx);
                return false;
            }
            return true;
        }
    } catch (const BufferOverflowError& e) {
        // Stop reading; the 413 goes out after any in-flight response
        poll_fds_[poll_fds_idx].events &= ~POLLIN;
        client_connection->defer_rejection(413, e.what());
        dispatch(fd, client_connection);
        return true;
    } catch (const IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }

    dispatch(fd, client_connection);
    return true;
}

void TcpServer::dispatch(int fd, const std::shared_ptr<Connection>& client_connection) {
    if (auto rejection = client_connection->take_rejection()) {
        reject(fd, *client_connection, rejection->status(), rejection->what());
        return;
    }

    try {
        auto request = client_connection->try_take_request();
        if (!request)
            return;
        // Push to worker pool
        task_deque_.push_back(Task{
            .connection = client_connection,
            .request = std::move(*request),
            .on_complete = [this, fd]() { mark_as_dirty(fd); }
        });
    } catch (const ProtocolError& e) {
        reject(fd, *client_connection, e.status(), e.what());
    }
}

void TcpServer::reject(int fd, Connection& client, int status, const std::string& message) {
    // The rest of the stream cannot be framed any more, so the connection closes
    HttpResponse response = Gateway::json_response(status, false, message);
    client.append_response(HttpCodec::format(response, false), false);
    enable_write(fd);
}

void TcpServer::stop() noexcept {
    stop_requested_ = true;
    waker_.notify();
}

void TcpServer::shutdown() {
    size_t dropped = task_deque_.clear();
    if (dropped > 0)
        std::cout << "Dropped " << dropped << " pending request(s)\n";

    workers_.clear(); // jthread requests stop and joins

    clients_.clear();
    poll_fds_.clear();
    fd_idx_map_.clear();
    listen_socket_ = Socket{}; // closes the listening fd

    s_this_server = nullptr;
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    running_ = false;
    std::cout << "Server stopped" << std::endl;
}

bool TcpServer::is_running() const noexcept {
    return running_;
}

uint16_t TcpServer::bound_port() const noexcept {
    return bound_port_;
}

void TcpServer::worker_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto task = task_deque_.wait_and_pop_front(stop_token);
        if (!task)
            continue;
        try {
            task->execute(gateway_);
        } catch (const std::exception& e) {
            std::cerr << "[Worker] " << e.what() << std::endl;
        }
    }
}

void TcpServer::setup_workers() {
    for (size_t i = 0; i < num_workers_; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}


} // namespace shortener
