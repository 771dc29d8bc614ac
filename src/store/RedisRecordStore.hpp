#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/IRecordLoader.hpp"
#include "../interfaces/IRecordWriter.hpp"
#include "../models/UserRecord.hpp"

// Forward declarations
struct redisContext;
class ILogger;

// UserRecords kept in Redis as JSON documents under "user:<id>", with the
// version counter in "user:<id>:version". One connection, serialized by a mutex.
class RedisRecordStore : public IRecordLoader<std::string, UserRecord>,
                         public IRecordWriter<std::string, UserRecord> {
public:
    // Connection failures are logged, not thrown; check isConnected().
    RedisRecordStore(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisRecordStore() override;

    // Throw StoreError when not connected or when Redis reports an error.
    std::optional<UserRecord> load(const std::string& id) override;
    void persist(const UserRecord& record) override;
    void erase(const std::string& id) override;

    bool isConnected() const;

    static std::string recordKey(const std::string& id) { return Constants::USER_KEY_PREFIX + id; }
    static std::string versionKey(const std::string& id) { return recordKey(id) + ":version"; }

private:
    void connect();
    void requireConnection(const std::string& operation, const std::string& id) const;

    const std::string host_;
    const int port_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;

    RedisRecordStore(const RedisRecordStore&) = delete;
    RedisRecordStore& operator=(const RedisRecordStore&) = delete;
};
