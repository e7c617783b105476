#pragma once

#include <chrono>

// Advisory lock on an open file descriptor. Locks are tied to the
// descriptor, so the OS drops them when the owning process dies.
class IFileLock {
public:
    virtual ~IFileLock() = default;

    // Both acquire calls throw LockTimeout once timeout elapses.
    virtual void acquireShared(int fd, std::chrono::milliseconds timeout) = 0;
    virtual void acquireExclusive(int fd, std::chrono::milliseconds timeout) = 0;
    virtual void release(int fd) = 0;
};
