#ifndef INMEMORYRECORDSTORE_HPP
#define INMEMORYRECORDSTORE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IRecordLoader.hpp"
#include "../interfaces/IRecordWriter.hpp"
#include "../models/UserRecord.hpp"

// Slow system of record kept in process memory. Every load, persist and
// erase sleeps for the configured latency before touching the map.
class InMemoryRecordStore : public IRecordLoader<std::string, UserRecord>,
                            public IRecordWriter<std::string, UserRecord> {
public:
    InMemoryRecordStore(std::chrono::milliseconds latency, std::shared_ptr<ILogger> logger);
    ~InMemoryRecordStore() override = default;

    std::optional<UserRecord> load(const std::string& id) override;
    // Stores a copy with version set to one past the stored version.
    void persist(const UserRecord& record) override;
    void erase(const std::string& id) override;

    // Inserts without latency or version bump.
    void seed(const UserRecord& record);
    // While unavailable every operation throws StoreError.
    void setAvailable(bool available) { available_ = available; }

    size_t size() const;
    uint64_t loadCount() const { return load_count_; }
    uint64_t persistCount() const { return persist_count_; }

private:
    void simulateRoundTrip(const std::string& operation, const std::string& id);

    const std::chrono::milliseconds latency_;
    std::shared_ptr<ILogger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, UserRecord> records_;
    std::atomic<bool> available_{true};
    std::atomic<uint64_t> load_count_{0};
    std::atomic<uint64_t> persist_count_{0};

    InMemoryRecordStore(const InMemoryRecordStore&) = delete;
    InMemoryRecordStore& operator=(const InMemoryRecordStore&) = delete;
};

#endif // INMEMORYRECORDSTORE_HPP
