#include "RedisStorage.hpp"

#include <regex>
#include <stdexcept>
#include <utility>

#include <sys/time.h>

#include <hiredis/hiredis.h>

#include "../cache/KeyDeriver.hpp"
#include "../config/AppConfig.hpp"
#include "../errors/CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"
#include "../utils/Utils.hpp"

namespace {

constexpr auto SCAN_BATCH_SIZE = "1000";

timeval toTimeval(std::chrono::milliseconds duration) {
    timeval tv;
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(duration.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((duration.count() % 1000) * 1000);
    return tv;
}

std::string replyText(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

} // namespace

void RedisStorage::ContextDeleter::operator()(redisContext* context) const {
    redisFree(context);
}

void RedisStorage::ReplyDeleter::operator()(redisReply* reply) const {
    freeReplyObject(reply);
}

RedisStorage::RedisStorage(const std::string& connection_string,
                           const std::string& prefix,
                           std::chrono::milliseconds connect_timeout,
                           std::chrono::milliseconds command_timeout,
                           std::shared_ptr<ILogger> logger)
    : info_(parseConnectionString(connection_string)),
      prefix_(prefix),
      connect_timeout_(connect_timeout),
      command_timeout_(command_timeout),
      logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisStorage");
    }
    KeyDeriver::validatePrefix(prefix_);
    std::lock_guard<std::mutex> lock(mutex_);
    connect();
}

RedisStorage::~RedisStorage() = default;

RedisStorage::ConnectionInfo RedisStorage::parseConnectionString(const std::string& connection_string) {
    std::smatch match;
    if (!std::regex_match(connection_string, match, Constants::redis_url_regex)) {
        throw std::invalid_argument("Invalid Redis connection string: '" + connection_string + "'");
    }
    ConnectionInfo info;
    info.password = match[1].str();
    info.host = match[2].str();
    if (match[3].matched) {
        auto port = Utils::stringToInt(match[3].str());
        if (!port || *port <= 0 || *port > 65535) {
            throw std::invalid_argument("Invalid port in Redis connection string: '" + connection_string + "'");
        }
        info.port = *port;
    }
    if (match[4].matched) {
        auto database = Utils::stringToInt(match[4].str());
        if (!database) {
            throw std::invalid_argument("Invalid database in Redis connection string: '" + connection_string + "'");
        }
        info.database = *database;
    }
    return info;
}

void RedisStorage::connect() {
    const std::string endpoint = info_.host + ":" + std::to_string(info_.port);
    context_.reset(redisConnectWithTimeout(info_.host.c_str(), info_.port, toTimeval(connect_timeout_)));
    if (!context_ || context_->err) {
        std::string error_msg = "Redis connection error (" + endpoint + "): " +
            (context_ ? std::string(context_->errstr) : std::string("can't allocate redis context"));
        context_.reset();
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }

    const timeval command_tv = toTimeval(command_timeout_);
    if (redisSetTimeout(context_.get(), command_tv) != REDIS_OK) {
        std::string error_msg = "Redis connection error (" + endpoint + "): failed to set command timeout";
        context_.reset();
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }

    if (!info_.password.empty()) {
        auto reply = command({"AUTH", info_.password});
        if (reply->type == REDIS_REPLY_ERROR) {
            context_.reset();
            fail("Redis AUTH rejected for " + endpoint + ": " + replyText(reply.get()), false);
        }
    }
    if (info_.database != 0) {
        auto reply = command({"SELECT", std::to_string(info_.database)});
        if (reply->type == REDIS_REPLY_ERROR) {
            context_.reset();
            fail("Redis SELECT " + std::to_string(info_.database) + " failed: " + replyText(reply.get()), false);
        }
    }
    logger_->debug("Connected to Redis at " + endpoint + " db " + std::to_string(info_.database));
}

RedisStorage::ReplyPtr RedisStorage::command(const std::vector<std::string>& args) {
    if (!context_) {
        connect();
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(args.size()), argv.data(), argvlen.data())));
    if (!reply) {
        std::string error_msg = "Redis " + args.front() + " failed: " +
            (context_->err ? std::string(context_->errstr) : std::string("no reply"));
        context_.reset();
        fail(error_msg, false);
    }
    return reply;
}

void RedisStorage::fail(const std::string& message, bool write_failure) {
    logger_->error(message);
    if (write_failure) {
        throw WriteError(message);
    }
    throw ConnectionError(message);
}

bool RedisStorage::contains(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command({"EXISTS", key});
    if (reply->type != REDIS_REPLY_INTEGER) {
        fail("Redis EXISTS returned an unexpected reply for key: " + key, false);
    }
    return reply->integer > 0;
}

std::optional<Bytes> RedisStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command({"GET", key});

    if (reply->type == REDIS_REPLY_NIL) {
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug("RedisStorage miss for key: " + key);
        }
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        std::string detail = reply->type == REDIS_REPLY_ERROR ? replyText(reply.get()) : "unexpected reply type";
        fail("Redis GET failed for key " + key + ": " + detail, false);
    }
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("RedisStorage hit for key: " + key);
    }
    return Bytes(reply->str, reply->str + reply->len);
}

void RedisStorage::set(const std::string& key, const Bytes& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command({"SET", key, std::string(value.begin(), value.end())});
    if (reply->type == REDIS_REPLY_ERROR) {
        fail("Redis SET failed for key " + key + ": " + replyText(reply.get()), true);
    }
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("RedisStorage stored key: " + key + " (" + std::to_string(value.size()) + " bytes)");
    }
}

void RedisStorage::flush(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = command({"DEL", key});
    if (reply->type == REDIS_REPLY_ERROR) {
        fail("Redis DEL failed for key " + key + ": " + replyText(reply.get()), true);
    }
}

void RedisStorage::flushAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string pattern = KeyDeriver::scopeOf(prefix_) + "*";
    std::string cursor = "0";
    long long removed = 0;

    // Keys written while the scan runs may or may not be removed.
    do {
        auto reply = command({"SCAN", cursor, "MATCH", pattern, "COUNT", SCAN_BATCH_SIZE});
        if (reply->type == REDIS_REPLY_ERROR) {
            fail("Redis SCAN failed for pattern " + pattern + ": " + replyText(reply.get()), false);
        }
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 ||
            reply->element[0]->type != REDIS_REPLY_STRING ||
            reply->element[1]->type != REDIS_REPLY_ARRAY) {
            fail("Redis SCAN returned an unexpected reply for pattern " + pattern, false);
        }
        cursor = replyText(reply->element[0]);

        const redisReply* keys = reply->element[1];
        if (keys->elements == 0) {
            continue;
        }
        std::vector<std::string> del_args;
        del_args.reserve(keys->elements + 1);
        del_args.emplace_back("DEL");
        for (size_t i = 0; i < keys->elements; ++i) {
            del_args.push_back(replyText(keys->element[i]));
        }
        auto del_reply = command(del_args);
        if (del_reply->type == REDIS_REPLY_ERROR) {
            fail("Redis DEL failed while flushing prefix " + prefix_ + ": " + replyText(del_reply.get()), true);
        }
        if (del_reply->type == REDIS_REPLY_INTEGER) {
            removed += del_reply->integer;
        }
    } while (cursor != "0");

    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("RedisStorage flushed " + std::to_string(removed) + " entries with prefix " + prefix_);
    }
}

bool RedisStorage::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_ != nullptr && context_->err == 0;
}
