#ifndef STORAGEINTERFACE_HPP
#define STORAGEINTERFACE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Raw serialized payload of a cache entry.
using Bytes = std::vector<std::uint8_t>;

// Capability set every persistent backend provides. Values are opaque bytes;
// (de)serialization belongs to the caller. Failures are reported by throwing
// the types declared in errors/CacheErrors.hpp.
class StorageInterface {
public:
    virtual ~StorageInterface() = default;

    // Existence check, never mutates the store.
    virtual bool contains(const std::string& key) = 0;
    // Stored bytes for key, or std::nullopt on a miss.
    virtual std::optional<Bytes> get(const std::string& key) = 0;
    // Persists value, replacing any previous entry at key.
    virtual void set(const std::string& key, const Bytes& value) = 0;
    // Removes one entry. Absent keys are not an error.
    virtual void flush(const std::string& key) = 0;
    // Removes every entry carrying prefix() and nothing else.
    virtual void flushAll() = 0;

    virtual const std::string& prefix() const = 0;
};

#endif // STORAGEINTERFACE_HPP
