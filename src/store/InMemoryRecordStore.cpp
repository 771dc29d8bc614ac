#include "InMemoryRecordStore.hpp"

#include <stdexcept>
#include <thread>

#include "StoreError.hpp"

InMemoryRecordStore::InMemoryRecordStore(std::chrono::milliseconds latency, std::shared_ptr<ILogger> logger)
    : latency_(latency), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for InMemoryRecordStore");
    }
    if (latency_.count() < 0) {
        throw std::invalid_argument("Store latency cannot be negative");
    }
}

void InMemoryRecordStore::simulateRoundTrip(const std::string& operation, const std::string& id) {
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
    if (!available_) {
        throw StoreError("Record store unavailable during " + operation + " of id: " + id);
    }
}

std::optional<UserRecord> InMemoryRecordStore::load(const std::string& id) {
    ++load_count_;
    simulateRoundTrip("load", id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRecordStore::persist(const UserRecord& record) {
    if (record.id.empty()) {
        throw StoreError("Cannot persist a record without an id");
    }
    simulateRoundTrip("persist", record.id);

    std::lock_guard<std::mutex> lock(mutex_);
    UserRecord stored = record;
    auto it = records_.find(record.id);
    stored.version = (it == records_.end()) ? 1 : it->second.version + 1;
    records_[record.id] = stored;
    ++persist_count_;
    if (logger_->isDebugEnabled()) {
        logger_->debug("Persisted " + stored.to_string());
    }
}

void InMemoryRecordStore::erase(const std::string& id) {
    simulateRoundTrip("erase", id);

    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(id);
}

void InMemoryRecordStore::seed(const UserRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
}

size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
