#include "CacheEngine.hpp"

#include <stdexcept>

namespace {

const std::string& prefixOf(const std::shared_ptr<StorageInterface>& storage) {
    if (!storage) {
        throw std::invalid_argument("Storage pointer cannot be null");
    }
    return storage->prefix();
}

} // namespace

CacheEngine::CacheEngine(std::shared_ptr<StorageInterface> storage, std::shared_ptr<ILogger> logger)
    : storage_(std::move(storage)),
      logger_(std::move(logger)),
      keys_(prefixOf(storage_)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    logger_->debug("CacheEngine initialized with prefix " + keys_.prefix());
}

bool CacheEngine::contains(const std::string& key) {
    return storage_->contains(key);
}

void CacheEngine::flush(const std::string& key) {
    storage_->flush(key);
}

void CacheEngine::flushAll() {
    logger_->info("Flushing every cache entry with prefix " + keys_.prefix());
    storage_->flushAll();
}
