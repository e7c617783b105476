#include "FileMemoryStorage.hpp"

#include <utility>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

FileMemoryStorage::FileMemoryStorage(const std::string& root_directory,
                                     const std::string& prefix,
                                     std::chrono::milliseconds lock_timeout,
                                     std::shared_ptr<ILogger> logger,
                                     std::shared_ptr<IFileLock> file_lock)
    : disk_(root_directory, prefix, lock_timeout, logger, std::move(file_lock)),
      logger_(std::move(logger)) {}

bool FileMemoryStorage::contains(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (memory_.count(key) > 0) {
            return true;
        }
    }
    return disk_.contains(key);
}

std::optional<Bytes> FileMemoryStorage::get(const std::string& key) {
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = write_generation_;
        auto it = memory_.find(key);
        if (it != memory_.end()) {
            if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
                logger_->debug("FileMemoryStorage memory hit for key: " + key);
            }
            return it->second;
        }
    }

    // Disk I/O happens outside the mutex so other keys are not serialized
    // behind a slow or locked file.
    auto value = disk_.get(key);
    if (value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == write_generation_) {
            memory_.emplace(key, *value);
        }
    }
    return value;
}

void FileMemoryStorage::set(const std::string& key, const Bytes& value) {
    disk_.set(key, value);
    std::lock_guard<std::mutex> lock(mutex_);
    ++write_generation_;
    memory_.erase(key);
}

void FileMemoryStorage::flush(const std::string& key) {
    disk_.flush(key);
    std::lock_guard<std::mutex> lock(mutex_);
    ++write_generation_;
    memory_.erase(key);
}

void FileMemoryStorage::flushAll() {
    disk_.flushAll();
    std::lock_guard<std::mutex> lock(mutex_);
    ++write_generation_;
    memory_.clear();
}

std::size_t FileMemoryStorage::memorySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.size();
}

bool FileMemoryStorage::isMemoized(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.count(key) > 0;
}
