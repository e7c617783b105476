#pragma once

#include <chrono>
#include <string>

enum class StorageKind {
    File,
    FileMemory,
    Redis
};

// Setup-time description of one backend instance.
struct StorageConfig {
    StorageKind kind = StorageKind::File;
    std::string root_directory;     // File, FileMemory
    std::string connection_string;  // Redis
    std::string key_prefix = "pc";

    std::chrono::milliseconds lock_timeout{5000};
    std::chrono::milliseconds redis_connect_timeout{1000};
    std::chrono::milliseconds redis_command_timeout{1000};
};
