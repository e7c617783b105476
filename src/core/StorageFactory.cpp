#include "StorageFactory.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../storage/FileMemoryStorage.hpp"
#include "../storage/FileStorage.hpp"
#include "../storage/RedisStorage.hpp"

std::shared_ptr<StorageInterface> StorageFactory::create(const StorageConfig& config,
                                                         std::shared_ptr<ILogger> logger) {
    if (!logger) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }

    switch (config.kind) {
        case StorageKind::File:
            logger->setup("Creating FileStorage at " + config.root_directory);
            return std::make_shared<FileStorage>(
                config.root_directory, config.key_prefix, config.lock_timeout, logger);
        case StorageKind::FileMemory:
            logger->setup("Creating FileMemoryStorage at " + config.root_directory);
            return std::make_shared<FileMemoryStorage>(
                config.root_directory, config.key_prefix, config.lock_timeout, logger);
        case StorageKind::Redis: {
            auto storage = std::make_shared<RedisStorage>(
                config.connection_string, config.key_prefix,
                config.redis_connect_timeout, config.redis_command_timeout, logger);
            logger->setup("Redis storage connected successfully.");
            return storage;
        }
    }
    throw std::invalid_argument("Unknown storage kind: " + storageKindToString(config.kind));
}
