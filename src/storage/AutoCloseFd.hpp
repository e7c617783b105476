#ifndef AUTOCLOSEFD_HPP
#define AUTOCLOSEFD_HPP

#include <unistd.h>

// Owns a POSIX file descriptor and closes it on destruction. Closing also
// drops any flock() held through it.
class AutoCloseFd {
public:
    AutoCloseFd() = default;
    explicit AutoCloseFd(int fd) : fd_(fd) {}

    ~AutoCloseFd() {
        reset();
    }

    AutoCloseFd(AutoCloseFd&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    AutoCloseFd& operator=(AutoCloseFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    AutoCloseFd(const AutoCloseFd&) = delete;
    AutoCloseFd& operator=(const AutoCloseFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    // Gives up ownership without closing.
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

#endif // AUTOCLOSEFD_HPP
