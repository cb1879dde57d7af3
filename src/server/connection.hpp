#pragma once

#include "shortener/http.hpp"
#include "shortener/socket.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace shortener {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * A single client connection.
 *
 * The inbox is only touched by the reactor thread. The outbox is filled by
 * workers and drained by the reactor, so it is locked.
 * At most one request is handed out at a time, which keeps responses in
 * request order when a client pipelines.
 */
class Connection {
public:
    explicit Connection(Socket socket) : socket_(std::move(socket)) {}

    int fd() const noexcept { return socket_.fd(); }

    // Returns false if the client disconnected
    bool read_to_inbox();

    // Next complete request from the inbox. std::nullopt if the inbox holds
    // no complete request, a request is still in flight, or the connection
    // is closing. Throws ProtocolError on a malformed request.
    std::optional<HttpRequest> try_take_request();

    // Queue a serialized response and end the in-flight request.
    // With keep_alive false the connection closes once the outbox drains.
    void append_response(std::string data, bool keep_alive = true);

    // Write to client. Return true if there is still data left to send
    bool write_from_outbox();

    // The client shut down its sending side. Requests already received are
    // still answered, then the connection closes.
    void shutdown_read() noexcept { read_closed_ = true; }
    bool read_closed() const noexcept { return read_closed_; }

    // An error to answer once the in-flight request has its response
    void defer_rejection(int status, std::string message);

    // The deferred error, once nothing is in flight and the connection is
    // not already closing
    std::optional<ProtocolError> take_rejection();

    // Nothing more will be sent: close was requested, or the client stopped
    // sending and nothing is in flight, and the outbox is empty
    bool finished() const;

    bool in_flight() const noexcept { return in_flight_; }

    // only used in tests to confirm partial reads/writes
    bool inbox_has_data() const;
    bool outbox_has_data() const;

private:
    static constexpr size_t MAX_INBOX_SIZE = 1024 * 1024 * 2; // 2MB limit
    Socket socket_;
    std::string inbox_;
    std::string outbox_;
    bool closing_{false};
    bool read_closed_{false};                   // reactor thread only
    std::optional<ProtocolError> rejection_;    // reactor thread only
    std::atomic<bool> in_flight_{false};
    mutable std::mutex outbox_mutex_;
};

} // namespace shortener
