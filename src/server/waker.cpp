#include "waker.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

namespace shortener {

Waker::Waker() {
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) == -1)
        throw std::runtime_error("Failed to create self-pipe");
}

Waker::~Waker() {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
}

int Waker::read_fd() const noexcept {
    return pipe_fds_[0];
}

void Waker::notify() noexcept {
    // Called from signal handlers, must not clobber errno.
    // A full pipe already guarantees a wake-up, so a failed write is fine.
    int saved_errno = errno;
    char c = 'x';
    [[maybe_unused]] ssize_t n = ::write(pipe_fds_[1], &c, 1);
    errno = saved_errno;
}

void Waker::clear() noexcept {
    char buf[64];
    while (::read(pipe_fds_[0], buf, sizeof(buf)) > 0);
}

} // namespace shortener
