#include <stdexcept>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "RedisRecordStore.hpp"
#include "StoreError.hpp"
#include "../interfaces/ILogger.hpp"

using json = nlohmann::json;

RedisRecordStore::RedisRecordStore(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : host_(config.redis_host), port_(config.redis_port), logger_(logger), redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisRecordStore");
    }
    connect();
}

RedisRecordStore::~RedisRecordStore() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

void RedisRecordStore::connect() {
    redis_context_ = redisConnect(host_.c_str(), port_);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        return;
    }
    logger_->setup("Connected to Redis at " + host_ + ":" + std::to_string(port_));
}

void RedisRecordStore::requireConnection(const std::string& operation, const std::string& id) const {
    if (!redis_context_) {
        throw StoreError("Redis not connected. Cannot " + operation + " id: " + id);
    }
}

std::optional<UserRecord> RedisRecordStore::load(const std::string& id) {
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnection("GET", id);

        redisReply* reply = (redisReply*)redisCommand(redis_context_, "GET %s", recordKey(id).c_str());
        if (reply == nullptr) {
            throw StoreError("Redis GET failed (nullptr reply) for id: " + id);
        }
        if (reply->type == REDIS_REPLY_NIL) {
            freeReplyObject(reply);
            return std::nullopt;
        }
        if (reply->type != REDIS_REPLY_STRING) {
            std::string reason = (reply->type == REDIS_REPLY_ERROR) ? std::string(reply->str, reply->len) : "unexpected reply type";
            freeReplyObject(reply);
            throw StoreError("Redis GET failed for id " + id + ": " + reason);
        }
        payload.assign(reply->str, reply->len);
        freeReplyObject(reply);
    }

    try {
        return json::parse(payload).get<UserRecord>();
    } catch (const json::exception& e) {
        throw StoreError("Corrupt record stored for id '" + id + "': " + e.what());
    }
}

void RedisRecordStore::persist(const UserRecord& record) {
    if (record.id.empty()) {
        throw StoreError("Cannot persist a record without an id");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    requireConnection("SET", record.id);

    redisReply* reply = (redisReply*)redisCommand(redis_context_, "INCR %s", versionKey(record.id).c_str());
    if (reply == nullptr || reply->type != REDIS_REPLY_INTEGER) {
        if (reply) freeReplyObject(reply);
        throw StoreError("Redis INCR failed for id: " + record.id);
    }
    UserRecord stored = record;
    stored.version = reply->integer;
    freeReplyObject(reply);

    std::string payload = json(stored).dump();
    reply = (redisReply*)redisCommand(redis_context_, "SET %s %b",
        recordKey(record.id).c_str(), payload.data(), payload.size());
    if (reply == nullptr) {
        throw StoreError("Redis SET failed (nullptr reply) for id: " + record.id);
    }
    bool success = (reply->type != REDIS_REPLY_ERROR);
    freeReplyObject(reply);
    if (!success) {
        throw StoreError("Redis SET returned an error for id: " + record.id);
    }
    if (logger_->isDebugEnabled()) {
        logger_->debug("Persisted to Redis " + stored.to_string());
    }
}

void RedisRecordStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnection("DEL", id);

    redisReply* reply = (redisReply*)redisCommand(redis_context_, "DEL %s %s",
        recordKey(id).c_str(), versionKey(id).c_str());
    if (reply == nullptr) {
        throw StoreError("Redis DEL failed (nullptr reply) for id: " + id);
    }
    bool success = (reply->type == REDIS_REPLY_INTEGER);
    freeReplyObject(reply);
    if (!success) {
        throw StoreError("Redis DEL returned an error for id: " + id);
    }
}

bool RedisRecordStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}
