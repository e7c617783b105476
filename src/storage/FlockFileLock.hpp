#ifndef FLOCKFILELOCK_HPP
#define FLOCKFILELOCK_HPP

#include <chrono>

#include "../interfaces/IFileLock.hpp"

// IFileLock on top of BSD flock(2). Waiting is done by polling with
// LOCK_NB and an exponential back-off capped at max_backoff, so the wait
// is bounded by the caller's timeout.
class FlockFileLock : public IFileLock {
public:
    explicit FlockFileLock(std::chrono::milliseconds max_backoff = std::chrono::milliseconds(50));
    ~FlockFileLock() override = default;

    void acquireShared(int fd, std::chrono::milliseconds timeout) override;
    void acquireExclusive(int fd, std::chrono::milliseconds timeout) override;
    void release(int fd) override;

    // Single non-blocking attempt. Returns false if another holder conflicts.
    bool tryAcquire(int fd, bool exclusive);

private:
    void acquire(int fd, bool exclusive, std::chrono::milliseconds timeout);

    std::chrono::milliseconds max_backoff_;
};

#endif // FLOCKFILELOCK_HPP
