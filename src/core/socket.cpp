#include "shortener/socket.hpp"

#include <arpa/inet.h>   // inet_pton(), htons()
#include <netinet/in.h>  // sockaddr_in, sockaddr_in6
#include <sys/socket.h>  // socket(), bind(), listen(), accept4()
#include <unistd.h>      // close()

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace shortener {

namespace {

std::runtime_error sys_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

} // namespace


Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::listen_tcp(const std::string& host, uint16_t port) {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr);

    if (::inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port); // Converts port to network byte order
        addr_len = sizeof(sockaddr_in);
    } else if (::inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        addr_len = sizeof(sockaddr_in6);
    } else {
        throw std::runtime_error("Invalid IP address: " + host);
    }

    Socket listener{::socket(addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!listener.valid())
        throw sys_error("Failed to create socket");

    int opt = 1;
    if (::setsockopt(listener.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
        throw sys_error("setsockopt failed");

    if (::bind(listener.fd(), reinterpret_cast<sockaddr*>(&addr), addr_len) == -1)
        throw sys_error("Bind to " + format_address(host, port) + " failed");

    if (::listen(listener.fd(), SOMAXCONN) == -1)
        throw sys_error("Listen failed");

    return listener;
}

std::optional<Socket> Socket::accept() const {
    sockaddr_storage client_addr{};
    socklen_t client_len = sizeof(client_addr);

    int client_fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                              SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED)
            return std::nullopt;
        throw sys_error("Accept failed");
    }
    return Socket{client_fd};
}

uint16_t Socket::local_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        throw sys_error("getsockname failed");
    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

std::string format_address(const std::string& host, uint16_t port) {
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

void Socket::close() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace shortener
