#ifndef FILESTORAGE_HPP
#define FILESTORAGE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "AutoCloseFd.hpp"
#include "ScopedFileLock.hpp"
#include "../interfaces/IFileLock.hpp"
#include "../interfaces/StorageInterface.hpp"

class ILogger;

// One regular file per key inside root_directory. The file holds the raw
// entry bytes with no header. Writers stage the value in a separate file and
// rename it over the entry while holding an exclusive flock on the current
// entry; readers take a shared flock. Different keys never contend and a
// crashed holder cannot leave a stale lock behind.
class FileStorage : public StorageInterface {
public:
    FileStorage(const std::string& root_directory,
                const std::string& prefix,
                std::chrono::milliseconds lock_timeout,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IFileLock> file_lock = nullptr);
    ~FileStorage() override = default;

    bool contains(const std::string& key) override;
    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value) override;
    void flush(const std::string& key) override;
    void flushAll() override;

    const std::string& prefix() const override { return prefix_; }
    const std::filesystem::path& rootDirectory() const { return root_; }
    std::filesystem::path pathFor(const std::string& key) const;
    // encodeFileName(key), or a SHA-256 based name when that exceeds the
    // filesystem's name limit.
    std::string fileNameFor(const std::string& key) const;

    // Keeps [A-Za-z0-9._-] and writes every other byte as %XX.
    static std::string encodeFileName(const std::string& key);
    // Inverse of encodeFileName, std::nullopt for names it cannot produce.
    static std::optional<std::string> decodeFileName(const std::string& name);

private:
    void ensureRootDirectory();
    // Empty descriptor if the file does not exist.
    AutoCloseFd openExisting(const std::filesystem::path& path, const std::string& key);
    // Writes value to a fresh file in root_ and returns its path.
    std::filesystem::path stageValue(const std::string& key, const Bytes& value);
    ScopedFileLock lock(int fd, ScopedFileLock::Mode mode, const std::string& key);
    // True once a concurrent flush has unlinked the file behind fd.
    bool isUnlinked(int fd, const std::string& key);
    bool removeEntry(const std::filesystem::path& path, const std::string& key);

    std::filesystem::path root_;
    std::string prefix_;
    std::string file_scope_;
    std::chrono::milliseconds lock_timeout_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IFileLock> file_lock_;
};

#endif // FILESTORAGE_HPP
