#pragma once

namespace shortener {

/*
 * Self-pipe used to interrupt the reactor's poll().
 * notify() is async-signal-safe.
 */
class Waker {
public:
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const noexcept;

    void notify() noexcept;

    // Drain pending pokes
    void clear() noexcept;

private:
    int pipe_fds_[2];
};

} // namespace shortener
