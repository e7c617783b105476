#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cache/CacheEngine.hpp"
#include "config/AppConfig.hpp"
#include "core/StorageFactory.hpp"
#include "errors/CacheErrors.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

namespace {

constexpr int EXIT_ABSENT = 2;

void printUsage() {
    std::cerr << "Usage: persistcache_admin command=<contains|flush|flush_all|show_config> [key=<cache key>] [setting=value ...]" << std::endl
              << "Settings: storage_kind, root_directory, connection_string, key_prefix," << std::endl
              << "          lock_timeout_in_millis, redis_connect_timeout_in_millis," << std::endl
              << "          redis_command_timeout_in_millis, log_level" << std::endl;
}

std::optional<std::string> requireKey(const std::map<std::string, std::string>& args, std::shared_ptr<ILogger> logger) {
    auto it = args.find("key");
    if (it == args.end() || it->second.empty()) {
        logger->error("This command requires key=<cache key>");
        return std::nullopt;
    }
    return it->second;
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt || parsedArgsOpt->count("command") == 0) {
            printUsage();
            return 1;
        }
        const std::map<std::string, std::string>& startupArguments = *parsedArgsOpt;
        const std::string command = startupArguments.at("command");

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        if (logger_->getLogLevel() <= LogUtils::LogLevel::INFO) {
            logger_->setup(config_.to_string());
        }

        if (command == "show_config") {
            std::cout << config_.to_string();
            return 0;
        }
        if (command != "contains" && command != "flush" && command != "flush_all") {
            logger_->error("Unknown command: " + command);
            printUsage();
            return 1;
        }

        auto engine = std::make_shared<CacheEngine>(
            StorageFactory::create(config_.storageConfig(), logger_), logger_);

        if (command == "flush_all") {
            engine->flushAll();
            std::cout << "Flushed all entries with prefix " << config_.key_prefix << std::endl;
            return 0;
        }

        auto key = requireKey(startupArguments, logger_);
        if (!key) {
            return 1;
        }
        if (command == "flush") {
            engine->flush(*key);
            std::cout << "Flushed " << *key << std::endl;
            return 0;
        }

        const bool present = engine->contains(*key);
        std::cout << (present ? "present" : "absent") << std::endl;
        return present ? 0 : EXIT_ABSENT;
    } catch (const CacheError& e) {
        std::stringstream ss;
        ss << "Cache operation failed: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
