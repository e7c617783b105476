#include "FileStorage.hpp"

#include <atomic>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "FlockFileLock.hpp"
#include "../cache/KeyDeriver.hpp"
#include "../config/AppConfig.hpp"
#include "../errors/CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"
#include "../utils/Digest.hpp"

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(int err) {
    return std::error_code(err, std::generic_category()).message();
}

bool isFileNameSafe(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

// '~' never appears in an encoded key, so these names cannot collide with
// one, and no prefix can start with it, so flushAll never matches them.
constexpr char HASHED_NAME_MARKER = '~';
constexpr auto STAGING_NAME_PREFIX = "~staging.";
constexpr std::size_t SHA256_HEX_LENGTH = 64;

std::atomic<unsigned long> staging_counter{0};

// Unlinks the staged file unless keep() was called.
class StagedFile {
public:
    explicit StagedFile(fs::path path) : path_(std::move(path)) {}
    ~StagedFile() {
        if (!published_) {
            ::unlink(path_.c_str());
        }
    }
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const { return path_; }
    void keep() { published_ = true; }

private:
    fs::path path_;
    bool published_ = false;
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

FileStorage::FileStorage(const std::string& root_directory,
                         const std::string& prefix,
                         std::chrono::milliseconds lock_timeout,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IFileLock> file_lock)
    : root_(root_directory),
      prefix_(prefix),
      lock_timeout_(lock_timeout),
      logger_(std::move(logger)),
      file_lock_(std::move(file_lock)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for FileStorage");
    }
    if (root_.empty()) {
        throw std::invalid_argument("FileStorage requires a root directory");
    }
    KeyDeriver::validatePrefix(prefix_);
    if (!file_lock_) {
        file_lock_ = std::make_shared<FlockFileLock>();
    }
    file_scope_ = encodeFileName(KeyDeriver::scopeOf(prefix_));
    if (file_scope_.size() + 1 + SHA256_HEX_LENGTH > Constants::MAX_FILE_NAME_LENGTH) {
        throw std::invalid_argument("Key prefix '" + prefix_ + "' is too long for file names");
    }
    ensureRootDirectory();
    logger_->debug("FileStorage initialized at " + root_.string() + " with prefix " + prefix_);
}

void FileStorage::ensureRootDirectory() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_, ec)) {
        std::string error_msg = "Cannot use storage directory " + root_.string() + ": " +
                                (ec ? ec.message() : std::string("not a directory"));
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
}

fs::path FileStorage::pathFor(const std::string& key) const {
    return root_ / fileNameFor(key);
}

std::string FileStorage::fileNameFor(const std::string& key) const {
    std::string name = encodeFileName(key);
    if (name.size() <= Constants::MAX_FILE_NAME_LENGTH) {
        return name;
    }
    // Too long for the filesystem: name the entry by its digest, keeping the
    // scope for keys under this prefix so flushAll still finds them.
    const std::string scope = KeyDeriver::scopeOf(prefix_);
    const bool scoped = key.compare(0, scope.size(), scope) == 0;
    return (scoped ? file_scope_ : std::string()) + HASHED_NAME_MARKER + Digest::sha256Hex(key);
}

std::string FileStorage::encodeFileName(const std::string& key) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string name;
    name.reserve(key.size());
    for (unsigned char c : key) {
        if (isFileNameSafe(c)) {
            name.push_back(static_cast<char>(c));
        } else {
            name.push_back('%');
            name.push_back(digits[c >> 4]);
            name.push_back(digits[c & 0x0F]);
        }
    }
    return name;
}

std::optional<std::string> FileStorage::decodeFileName(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        if (c == '%') {
            if (i + 2 >= name.size()) {
                return std::nullopt;
            }
            const int hi = hexValue(name[i + 1]);
            const int lo = hexValue(name[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            const unsigned char decoded = static_cast<unsigned char>((hi << 4) | lo);
            if (isFileNameSafe(decoded)) {
                return std::nullopt;
            }
            key.push_back(static_cast<char>(decoded));
            i += 2;
        } else if (isFileNameSafe(c)) {
            key.push_back(static_cast<char>(c));
        } else {
            return std::nullopt;
        }
    }
    return key;
}

AutoCloseFd FileStorage::openExisting(const fs::path& path, const std::string& key) {
    while (true) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd >= 0) {
            return AutoCloseFd(fd);
        }
        if (errno == EINTR) continue;
        // A name too long for the filesystem can never have been stored.
        if (errno == ENOENT || errno == ENAMETOOLONG) {
            return AutoCloseFd();
        }
        std::string error_msg = "Failed to open cache entry for key " + key + ": " + errnoMessage(errno);
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
}

ScopedFileLock FileStorage::lock(int fd, ScopedFileLock::Mode mode, const std::string& key) {
    try {
        return ScopedFileLock(*file_lock_, fd, mode, lock_timeout_);
    } catch (const CacheError& e) {
        logger_->error("Locking cache entry for key " + key + " failed: " + e.what());
        throw;
    }
}

bool FileStorage::isUnlinked(int fd, const std::string& key) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        std::string error_msg = "Failed to stat cache entry for key " + key + ": " + errnoMessage(errno);
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
    return st.st_nlink == 0;
}

bool FileStorage::contains(const std::string& key) {
    const fs::path path = pathFor(key);
    while (true) {
        AutoCloseFd fd = openExisting(path, key);
        if (!fd) {
            return false;
        }
        auto held = lock(fd.get(), ScopedFileLock::Mode::Shared, key);
        struct stat st;
        if (::fstat(fd.get(), &st) != 0) {
            std::string error_msg = "Failed to stat cache entry for key " + key + ": " + errnoMessage(errno);
            logger_->error(error_msg);
            throw ConnectionError(error_msg);
        }
        held.unlock();
        if (st.st_nlink > 0) {
            // Zero-length files never hold an encoded value.
            return st.st_size > 0;
        }
    }
}

std::optional<Bytes> FileStorage::get(const std::string& key) {
    const fs::path path = pathFor(key);
    AutoCloseFd fd;
    std::optional<ScopedFileLock> held;
    while (true) {
        fd = openExisting(path, key);
        if (!fd) {
            if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
                logger_->debug("FileStorage miss for key: " + key);
            }
            return std::nullopt;
        }
        held.emplace(lock(fd.get(), ScopedFileLock::Mode::Shared, key));
        if (!isUnlinked(fd.get(), key)) {
            break;
        }
        // Replaced or flushed while we waited; look up the path again.
        held.reset();
    }

    Bytes data;
    std::uint8_t buffer[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            data.insert(data.end(), buffer, buffer + n);
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            std::string error_msg = "Failed to read cache entry for key " + key + ": " + errnoMessage(errno);
            logger_->error(error_msg);
            throw ConnectionError(error_msg);
        }
    }
    held->unlock();

    if (data.empty()) {
        return std::nullopt;
    }
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("FileStorage hit for key: " + key + " (" + std::to_string(data.size()) + " bytes)");
    }
    return data;
}

fs::path FileStorage::stageValue(const std::string& key, const Bytes& value) {
    const fs::path staged_path = root_ / (STAGING_NAME_PREFIX + std::to_string(::getpid()) + "." +
                                          std::to_string(staging_counter.fetch_add(1)));
    bool recreated_root = false;
    int raw_fd;
    while (true) {
        raw_fd = ::open(staged_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (raw_fd >= 0) break;
        if (errno == EINTR) continue;
        if (errno == ENOENT && !recreated_root) {
            // Root directory was removed underneath us.
            ensureRootDirectory();
            recreated_root = true;
            continue;
        }
        std::string error_msg = "Failed to create cache entry for key " + key + ": " + errnoMessage(errno);
        logger_->error(error_msg);
        throw WriteError(error_msg);
    }
    AutoCloseFd fd(raw_fd);
    StagedFile staged(staged_path);

    std::size_t written = 0;
    while (written < value.size()) {
        ssize_t n = ::write(fd.get(), value.data() + written, value.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string error_msg = "Failed to write cache entry for key " + key + ": " + errnoMessage(errno);
            logger_->error(error_msg);
            throw WriteError(error_msg);
        }
        written += static_cast<std::size_t>(n);
    }
    if (::close(fd.release()) != 0) {
        std::string error_msg = "Failed to write cache entry for key " + key + ": " + errnoMessage(errno);
        logger_->error(error_msg);
        throw WriteError(error_msg);
    }
    staged.keep();
    return staged_path;
}

void FileStorage::set(const std::string& key, const Bytes& value) {
    const fs::path path = pathFor(key);
    // The value is complete on disk before it replaces the old entry, so a
    // failed write leaves the previous entry untouched.
    StagedFile staged(stageValue(key, value));

    while (true) {
        AutoCloseFd fd = openExisting(path, key);
        std::optional<ScopedFileLock> held;
        if (fd) {
            // Waits for readers of the current entry.
            held.emplace(lock(fd.get(), ScopedFileLock::Mode::Exclusive, key));
            if (isUnlinked(fd.get(), key)) {
                continue;
            }
        }
        if (::rename(staged.path().c_str(), path.c_str()) != 0) {
            std::string error_msg = "Failed to publish cache entry for key " + key + ": " + errnoMessage(errno);
            logger_->error(error_msg);
            throw WriteError(error_msg);
        }
        staged.keep();
        if (held) {
            held->unlock();
        }
        break;
    }

    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("FileStorage stored key: " + key + " (" + std::to_string(value.size()) + " bytes)");
    }
}

bool FileStorage::removeEntry(const fs::path& path, const std::string& key) {
    AutoCloseFd fd = openExisting(path, key);
    if (!fd) {
        return false;
    }
    // Waits for an in-flight writer of this entry to finish.
    auto held = lock(fd.get(), ScopedFileLock::Mode::Exclusive, key);
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        std::string error_msg = "Failed to remove cache entry for key " + key + ": " + errnoMessage(errno);
        logger_->error(error_msg);
        throw WriteError(error_msg);
    }
    held.unlock();
    return true;
}

void FileStorage::flush(const std::string& key) {
    if (removeEntry(pathFor(key), key) && logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("FileStorage flushed key: " + key);
    }
}

void FileStorage::flushAll() {
    std::error_code ec;
    std::size_t removed = 0;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.compare(0, file_scope_.size(), file_scope_) != 0) {
            continue;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        // Entries removed by someone else mid-scan are simply skipped.
        if (removeEntry(it->path(), decodeFileName(name).value_or(name))) {
            ++removed;
        }
    }
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return;
        }
        std::string error_msg = "Failed to list storage directory " + root_.string() + ": " + ec.message();
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("FileStorage flushed " + std::to_string(removed) + " entries with prefix " + prefix_);
    }
}
