#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    static StorageKind stringToStorageKind(const std::string& kind) {
        if (kind == "file") return StorageKind::File;
        if (kind == "file_memory") return StorageKind::FileMemory;
        if (kind == "redis") return StorageKind::Redis;
        throw std::invalid_argument("Invalid storage kind: " + kind);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one setting. Returns false for keys that are not configuration
    // settings; invalid values are reported on stderr and leave config as is.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "storage_kind") {
            try {
                config.storage_kind = stringToStorageKind(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        } else if (key == "root_directory") {
            if (value.empty()) {
                std::cerr << "Warning: Empty root_directory ignored" << std::endl;
            } else {
                config.root_directory = value;
            }
        } else if (key == "connection_string") {
            config.connection_string = value;
        } else if (key == "key_prefix") {
            if (std::regex_match(value, Constants::prefix_regex)) {
                config.key_prefix = value;
            } else {
                std::cerr << "Warning: Invalid key_prefix: '" << value << "'. Expected characters from [A-Za-z0-9_.-]." << std::endl;
            }
        } else if (key == "lock_timeout_in_millis") {
            applyPositiveInt(config.lock_timeout_in_millis, key, value);
        } else if (key == "redis_connect_timeout_in_millis") {
            applyPositiveInt(config.redis_connect_timeout_in_millis, key, value);
        } else if (key == "redis_command_timeout_in_millis") {
            applyPositiveInt(config.redis_command_timeout_in_millis, key, value);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        } else {
            return false;
        }
        return true;
    }

    // Reads key = value lines into config. Returns false if the file cannot be opened.
    static bool loadConfigurationFile(const std::string& config_path, AppConfig& config) {
        std::ifstream configFile(config_path);
        if (!configFile.is_open()) {
            return false;
        }
        std::string line;
        while (getline(configFile, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                std::string key = trim(line.substr(0, delimiterPos));
                std::string value = trim(line.substr(delimiterPos + 1));
                if (!applySetting(config, key, value)) {
                    std::cerr << "Warning: Unknown setting '" << key << "' in " << config_path << std::endl;
                }
            }
        }
        return true;
    }

    // Defaults, then the config file, then command-line overrides.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        if (const char* env_path = std::getenv(Constants::CONFIG_PATH_ENV)) {
            config_paths.emplace_back(env_path);
        } else {
            config_paths = {
                Constants::CONFIG_FILE_NAME,                                   // Current directory
                std::string("../") + Constants::CONFIG_FILE_NAME,              // Parent directory
                std::string("/etc/persistcache/") + Constants::CONFIG_FILE_NAME
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            if (loadConfigurationFile(config_path, config)) {
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }
        return config;
    }

private:
    static void applyPositiveInt(int& target, const std::string& key, const std::string& value) {
        if (auto val = stringToInt(value); val && *val > 0) {
            target = *val;
        } else {
            std::cerr << "Warning: Invalid positive integer for " << key << ": " << value << std::endl;
        }
    }
};

#endif // UTILS_HPP
