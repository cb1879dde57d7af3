#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace shortener {

/*
 * RAII wrapper for a POSIX TCP socket
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Non-blocking listener bound to host:port (SO_REUSEADDR). host is an
    // IPv4 or IPv6 literal. Throws std::runtime_error naming the failing step.
    static Socket listen_tcp(const std::string& host, uint16_t port);

    // Accepts a pending client as a non-blocking socket.
    // Returns std::nullopt when nothing is pending.
    std::optional<Socket> accept() const;

    // Port actually bound, useful after binding port 0
    uint16_t local_port() const;

    bool valid() const noexcept;
    int fd() const noexcept;

private:
    void close() noexcept;

    int fd_;
};

// "host:port", or "[host]:port" for IPv6 literals
std::string format_address(const std::string& host, uint16_t port);

} // namespace shortener
