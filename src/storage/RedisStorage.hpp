#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/StorageInterface.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Cache entries as plain string values in a Redis database, one request
// per operation. The server provides the per-key atomicity; this class
// only serializes use of its single connection between threads.
class RedisStorage : public StorageInterface {
public:
    struct ConnectionInfo {
        std::string host;
        int port = 6379;
        int database = 0;
        std::string password;
    };

    // Connects immediately; throws ConnectionError if the server is unreachable.
    RedisStorage(const std::string& connection_string,
                 const std::string& prefix,
                 std::chrono::milliseconds connect_timeout,
                 std::chrono::milliseconds command_timeout,
                 std::shared_ptr<ILogger> logger);
    ~RedisStorage() override;

    bool contains(const std::string& key) override;
    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value) override;
    void flush(const std::string& key) override;
    void flushAll() override;

    const std::string& prefix() const override { return prefix_; }

    // Check if the storage currently holds a usable connection
    bool isConnected() const;

    // Accepts redis://[:password@]host[:port][/db] and host[:port].
    static ConnectionInfo parseConnectionString(const std::string& connection_string);

private:
    struct ContextDeleter {
        void operator()(redisContext* context) const;
    };
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    void connect();
    // Runs one command; the caller holds mutex_. A transport failure drops
    // the connection so the next call reconnects, and throws ConnectionError.
    ReplyPtr command(const std::vector<std::string>& args);
    [[noreturn]] void fail(const std::string& message, bool write_failure);

    ConnectionInfo info_;
    std::string prefix_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds command_timeout_;
    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<redisContext, ContextDeleter> context_;
    mutable std::mutex mutex_;
};
