#ifndef CACHEENGINE_HPP
#define CACHEENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "KeyDeriver.hpp"
#include "Serializer.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/StorageInterface.hpp"

// Joins a storage backend with the serializer. The engine holds no entries
// of its own; every call goes to the backend and every backend error
// reaches the caller.
class CacheEngine {
public:
    CacheEngine(std::shared_ptr<StorageInterface> storage, std::shared_ptr<ILogger> logger);

    // Returns the cached value for key, or runs compute, stores its result
    // and returns it. An exception from compute propagates and nothing is
    // written.
    template <typename T, typename Compute>
    T lookupOr(const std::string& key, Compute&& compute) {
        if (auto cached = fetch<T>(key)) {
            return std::move(*cached);
        }
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug("Cache miss for key: " + key + ", computing");
        }
        T value = std::forward<Compute>(compute)();
        store(key, value);
        return value;
    }

    // Always runs compute and overwrites whatever is stored under key.
    template <typename T, typename Compute>
    T recompute(const std::string& key, Compute&& compute) {
        T value = std::forward<Compute>(compute)();
        store(key, value);
        return value;
    }

    template <typename T>
    std::optional<T> fetch(const std::string& key) {
        auto bytes = storage_->get(key);
        if (!bytes) {
            return std::nullopt;
        }
        try {
            return Serializer::decode<T>(*bytes);
        } catch (const DeserializationError& e) {
            logger_->error("Cached entry for key " + key + " cannot be decoded: " + e.what());
            throw;
        }
    }

    template <typename T>
    void store(const std::string& key, const T& value) {
        storage_->set(key, Serializer::encode(value));
    }

    bool contains(const std::string& key);
    void flush(const std::string& key);
    void flushAll();

    const KeyDeriver& keys() const { return keys_; }
    const std::shared_ptr<StorageInterface>& storage() const { return storage_; }

private:
    std::shared_ptr<StorageInterface> storage_;
    std::shared_ptr<ILogger> logger_;
    KeyDeriver keys_;
};

#endif // CACHEENGINE_HPP
