#include "FlockFileLock.hpp"

#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>
#include <thread>

#include <sys/file.h>

#include "../errors/CacheErrors.hpp"

namespace {

std::string errnoMessage(int err) {
    return std::error_code(err, std::generic_category()).message();
}

} // namespace

FlockFileLock::FlockFileLock(std::chrono::milliseconds max_backoff)
    : max_backoff_(std::max(max_backoff, std::chrono::milliseconds(1))) {}

void FlockFileLock::acquireShared(int fd, std::chrono::milliseconds timeout) {
    acquire(fd, false, timeout);
}

void FlockFileLock::acquireExclusive(int fd, std::chrono::milliseconds timeout) {
    acquire(fd, true, timeout);
}

bool FlockFileLock::tryAcquire(int fd, bool exclusive) {
    const int operation = (exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
    while (flock(fd, operation) != 0) {
        if (errno == EWOULDBLOCK) return false;
        if (errno != EINTR) {
            throw ConnectionError("Acquiring file lock failed: " + errnoMessage(errno));
        }
    }
    return true;
}

void FlockFileLock::acquire(int fd, bool exclusive, std::chrono::milliseconds timeout) {
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + timeout;
    milliseconds backoff(1);
    while (!tryAcquire(fd, exclusive)) {
        const auto now = steady_clock::now();
        if (now >= deadline) {
            throw LockTimeout(std::string("Timed out after ") + std::to_string(timeout.count()) +
                              "ms waiting for " + (exclusive ? "exclusive" : "shared") + " file lock");
        }
        std::this_thread::sleep_for(std::min<steady_clock::duration>(backoff, deadline - now));
        backoff = std::min(backoff * 2, max_backoff_);
    }
}

void FlockFileLock::release(int fd) {
    while (flock(fd, LOCK_UN) != 0) {
        if (errno != EINTR) {
            throw ConnectionError("Releasing file lock failed: " + errnoMessage(errno));
        }
    }
}
