#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Root of every failure raised by the cache layer.
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Backend unreachable: missing/unreadable root directory, refused or broken
// Redis connection, failed read.
class ConnectionError : public CacheError {
public:
    using CacheError::CacheError;
};

// Persisting failed after the backend was reached (disk full, server refused
// the write, file removal failed).
class WriteError : public CacheError {
public:
    using CacheError::CacheError;
};

// An advisory file lock was not acquired within the configured bound.
class LockTimeout : public CacheError {
public:
    using CacheError::CacheError;
};

class SerializationError : public CacheError {
public:
    using CacheError::CacheError;
};

class DeserializationError : public CacheError {
public:
    using CacheError::CacheError;
};

#endif // CACHEERRORS_HPP
