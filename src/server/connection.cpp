#include "connection.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace shortener {


bool Connection::read_to_inbox() {
    char buffer[4096];
    ssize_t n = ::read(socket_.fd(), buffer, sizeof(buffer));

    if (n == 0)
        return false;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return true; // No data left to read
        throw IOError{"read failed"};
    }
    if (inbox_.size() + n > MAX_INBOX_SIZE) {
        inbox_.clear();
        throw BufferOverflowError{"request too large"};
    }

    inbox_.append(buffer, n);
    return true;
}

std::optional<HttpRequest> Connection::try_take_request() {
    if (in_flight_)
        return std::nullopt;
    {
        std::lock_guard lock(outbox_mutex_);
        if (closing_)
            return std::nullopt;
    }

    auto request = HttpCodec::parse(inbox_);
    if (request)
        in_flight_ = true;
    return request;
}

void Connection::append_response(std::string data, bool keep_alive) {
    {
        std::lock_guard lock(outbox_mutex_);
        outbox_.append(data);
        if (!keep_alive)
            closing_ = true;
    }
    in_flight_ = false;
}

bool Connection::write_from_outbox() {
    std::lock_guard lock(outbox_mutex_);
    if (outbox_.empty())
        return false;

    // MSG_NOSIGNAL: don't SIGPIPE us if the socket is dead
    ssize_t n = ::send(socket_.fd(), outbox_.data(), outbox_.size(), MSG_NOSIGNAL);
    if (n >= 0) {
        outbox_.erase(0, n); // Remove what was actually sent
        return !outbox_.empty();
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return true;
    throw IOError("write failed");
}

void Connection::defer_rejection(int status, std::string message) {
    rejection_.emplace(status, message);
}

std::optional<ProtocolError> Connection::take_rejection() {
    if (!rejection_ || in_flight_)
        return std::nullopt;
    {
        std::lock_guard lock(outbox_mutex_);
        if (closing_)
            return std::nullopt;
    }

    std::optional<ProtocolError> rejection = std::move(rejection_);
    rejection_.reset();
    return rejection;
}

bool Connection::finished() const {
    std::lock_guard lock(outbox_mutex_);
    if (!outbox_.empty())
        return false;
    return closing_ || (read_closed_ && !in_flight_);
}

bool Connection::inbox_has_data() const {
    return !inbox_.empty();
}

bool Connection::outbox_has_data() const {
    std::lock_guard lock(outbox_mutex_);
    return !outbox_.empty();
}

} // namespace shortener
