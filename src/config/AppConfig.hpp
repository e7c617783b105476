#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <regex>
#include <string>
#include <sstream>

#include "../models/StorageConfig.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "persistcache.config";
    static constexpr auto CONFIG_PATH_ENV = "PERSISTCACHE_CONFIG";
    // Separates prefix, function identity and encoded arguments inside a key.
    static constexpr auto KEY_SEPARATOR = "::";
    // Longest file name accepted by common Linux filesystems.
    static constexpr std::size_t MAX_FILE_NAME_LENGTH = 255;
    static const std::regex prefix_regex(R"(^[A-Za-z0-9_.\-]+$)");
    // redis://[:password@]host[:port][/db] or host[:port]
    static const std::regex redis_url_regex(
        R"(^(?:redis:\/\/)?(?::([^@\/]*)@)?([^:\/@]+)(?::(\d+))?(?:\/(\d+))?\/?$)");
};

inline std::string storageKindToString(StorageKind kind) {
    switch (kind) {
        case StorageKind::File: return "file";
        case StorageKind::FileMemory: return "file_memory";
        case StorageKind::Redis: return "redis";
    }
    return "unknown";
}

// --- Configuration Struct ---
class AppConfig {
public:
    // Storage configuration
    StorageKind storage_kind;
    std::string root_directory;
    std::string connection_string;
    std::string key_prefix;

    // Timeouts
    int lock_timeout_in_millis;
    int redis_connect_timeout_in_millis;
    int redis_command_timeout_in_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    AppConfig() {
        // --- Set Defaults  ---
        storage_kind = StorageKind::File;
        root_directory = "persistcache_data";
        connection_string = "redis://127.0.0.1:6379";
        key_prefix = "pc";
        lock_timeout_in_millis = 5000;
        redis_connect_timeout_in_millis = 1000;
        redis_command_timeout_in_millis = 1000;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
    }

    StorageConfig storageConfig() const {
        StorageConfig storage;
        storage.kind = storage_kind;
        storage.root_directory = root_directory;
        storage.connection_string = connection_string;
        storage.key_prefix = key_prefix;
        storage.lock_timeout = std::chrono::milliseconds(lock_timeout_in_millis);
        storage.redis_connect_timeout = std::chrono::milliseconds(redis_connect_timeout_in_millis);
        storage.redis_command_timeout = std::chrono::milliseconds(redis_command_timeout_in_millis);
        return storage;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "storage_kind: " << storageKindToString(storage_kind) << std::endl
            << "root_directory: " << root_directory << std::endl
            << "connection_string: " << connection_string << std::endl
            << "key_prefix: " << key_prefix << std::endl
            << "// --- Timeouts --- //" << std::endl
            << "lock_timeout_in_millis: " << lock_timeout_in_millis << std::endl
            << "redis_connect_timeout_in_millis: " << redis_connect_timeout_in_millis << std::endl
            << "redis_command_timeout_in_millis: " << redis_command_timeout_in_millis << std::endl
            << "// --- Logging --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
