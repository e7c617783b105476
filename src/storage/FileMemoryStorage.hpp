#ifndef FILEMEMORYSTORAGE_HPP
#define FILEMEMORYSTORAGE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "FileStorage.hpp"
#include "../interfaces/StorageInterface.hpp"

class ILogger;

// FileStorage with a read-through map of entries already fetched by this
// process. Disk stays the source of truth: writes and flushes hit disk
// first and then drop the local copy. Entries changed by other processes
// may be served stale from the map until this process touches them.
class FileMemoryStorage : public StorageInterface {
public:
    FileMemoryStorage(const std::string& root_directory,
                      const std::string& prefix,
                      std::chrono::milliseconds lock_timeout,
                      std::shared_ptr<ILogger> logger,
                      std::shared_ptr<IFileLock> file_lock = nullptr);
    ~FileMemoryStorage() override = default;

    bool contains(const std::string& key) override;
    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value) override;
    void flush(const std::string& key) override;
    void flushAll() override;

    const std::string& prefix() const override { return disk_.prefix(); }

    // Number of entries currently held in memory.
    std::size_t memorySize() const;
    bool isMemoized(const std::string& key) const;

private:
    FileStorage disk_;
    std::shared_ptr<ILogger> logger_;
    std::unordered_map<std::string, Bytes> memory_;
    // Bumped by every local set/flush; a disk read that raced one of them
    // is returned but not memoized.
    std::uint64_t write_generation_ = 0;
    mutable std::mutex mutex_;
};

#endif // FILEMEMORYSTORAGE_HPP
