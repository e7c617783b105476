#ifndef SCOPEDFILELOCK_HPP
#define SCOPEDFILELOCK_HPP

#include <chrono>

#include "../errors/CacheErrors.hpp"
#include "../interfaces/IFileLock.hpp"

// Holds an advisory lock for the lifetime of the object. unlock() reports
// release failures; the destructor cannot, and relies on the descriptor
// being closed right after, which drops the lock as well.
class ScopedFileLock {
public:
    enum class Mode { Shared, Exclusive };

    ScopedFileLock(IFileLock& file_lock, int fd, Mode mode, std::chrono::milliseconds timeout)
        : file_lock_(&file_lock), fd_(fd) {
        if (mode == Mode::Exclusive) {
            file_lock_->acquireExclusive(fd_, timeout);
        } else {
            file_lock_->acquireShared(fd_, timeout);
        }
    }

    ~ScopedFileLock() {
        if (file_lock_) {
            try {
                file_lock_->release(fd_);
            } catch (const CacheError&) {
                // close() on the descriptor releases it
            }
        }
    }

    ScopedFileLock(ScopedFileLock&& other) noexcept
        : file_lock_(other.file_lock_), fd_(other.fd_) {
        other.file_lock_ = nullptr;
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(ScopedFileLock&&) = delete;

    void unlock() {
        if (file_lock_) {
            IFileLock* held = file_lock_;
            file_lock_ = nullptr;
            held->release(fd_);
        }
    }

private:
    IFileLock* file_lock_;
    int fd_;
};

#endif // SCOPEDFILELOCK_HPP
