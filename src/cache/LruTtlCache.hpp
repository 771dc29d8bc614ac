#ifndef LRUTTLCACHE_HPP
#define LRUTTLCACHE_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "CacheErrors.hpp"
#include "RecencyList.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/CacheStats.hpp"

// Bounded LRU cache with per-entry TTL.
//
// index_ maps each key to the RecencyList slot holding its entry; the list
// keeps entries most-recent-first and eviction takes from its tail. Expiry is
// checked lazily on every access, before promotion, so an expired entry is
// never returned even if purgeExpired() has not run yet.
//
// One mutex guards index and list together. get() needs it too because
// promotion rewrites list links.
template <typename Key,
          typename Value,
          typename Clock = std::chrono::steady_clock,
          typename Hash = std::hash<Key>>
class LruTtlCache : public CacheInterface<Key, Value> {
public:
    using TimePoint = typename Clock::time_point;
    using Entry = CacheEntry<Key, Value, TimePoint>;

    // Throws InvalidCapacity if capacity <= 0.
    explicit LruTtlCache(long long capacity)
        : capacity_(validateCapacity(capacity)),
          recency_(std::min<size_t>(capacity_, INITIAL_ARENA_SLOTS)) {
        index_.reserve(std::min<size_t>(capacity_, INITIAL_ARENA_SLOTS));
    }

    ~LruTtlCache() override = default;

    LruTtlCache(const LruTtlCache&) = delete;
    LruTtlCache& operator=(const LruTtlCache&) = delete;

    std::optional<Value> get(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }

        const Entry& entry = recency_.at(it->second);
        if (entry.isExpired(Clock::now())) {
            eraseLocked(it);
            ++stats_.expirations;
            ++stats_.misses;
            return std::nullopt;
        }

        recency_.moveToFront(it->second);
        ++stats_.hits;
        return entry.value;
    }

    void set(const Key& key, Value value, CacheTtl ttl) override {
        if (ttl && ttl->count() <= 0) {
            throw InvalidTTL(ttl->count());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<TimePoint> expires_at;
        if (ttl) {
            expires_at = deadlineFor(*ttl, Clock::now());
        }

        auto it = index_.find(key);
        if (it != index_.end()) {
            Entry& entry = recency_.at(it->second);
            entry.value = std::move(value);
            entry.expires_at = expires_at;
            recency_.moveToFront(it->second);
            ++stats_.updates;
            return;
        }

        if (index_.size() >= capacity_) {
            evictLeastRecentLocked();
        }

        auto slot = recency_.pushFront(Entry{key, std::move(value), expires_at});
        try {
            index_.emplace(key, slot);
        } catch (...) {
            recency_.remove(slot); // keep index and list in step, then rethrow
            throw;
        }
        ++stats_.insertions;
    }

    bool remove(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        eraseLocked(it);
        ++stats_.removals;
        return true;
    }

    bool exists(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        if (recency_.at(it->second).isExpired(Clock::now())) {
            eraseLocked(it);
            ++stats_.expirations;
            return false;
        }
        return true;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        recency_.clear();
    }

    // Walks from the least recent end; the count may include entries a
    // concurrent get() would otherwise have expired lazily.
    size_t purgeExpired() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimePoint now = Clock::now();
        size_t removed = 0;
        auto slot = recency_.leastRecent();
        while (slot != RecencyList<Entry>::NONE) {
            auto next = recency_.moreRecent(slot);
            if (recency_.at(slot).isExpired(now)) {
                index_.erase(recency_.at(slot).key);
                recency_.remove(slot);
                ++removed;
            }
            slot = next;
        }
        stats_.expirations += removed;
        return removed;
    }

    // Counts entries not yet removed, expired or not.
    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const override { return capacity_; }

    CacheStats stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    // Keys from most to least recently used. Diagnostic; does not promote or expire.
    std::vector<Key> keysByRecency() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(index_.size());
        for (auto slot = recency_.mostRecent(); slot != RecencyList<Entry>::NONE; slot = recency_.lessRecent(slot)) {
            keys.push_back(recency_.at(slot).key);
        }
        return keys;
    }

private:
    using Index = std::unordered_map<Key, typename RecencyList<Entry>::Index, Hash>;

    static constexpr size_t INITIAL_ARENA_SLOTS = 4096;

    static size_t validateCapacity(long long capacity) {
        if (capacity <= 0) {
            throw InvalidCapacity(capacity);
        }
        return static_cast<size_t>(capacity);
    }

    // Throws InvalidTTL rather than let now + ttl overflow the clock's rep.
    static TimePoint deadlineFor(std::chrono::milliseconds ttl, TimePoint now) {
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now);
        if (ttl > headroom) {
            throw InvalidTTL(ttl.count(), headroom.count());
        }
        return now + std::chrono::duration_cast<typename Clock::duration>(ttl);
    }

    void eraseLocked(typename Index::iterator it) {
        auto slot = it->second;
        index_.erase(it);
        recency_.remove(slot);
    }

    void evictLeastRecentLocked() {
        auto slot = recency_.leastRecent();
        if (slot == RecencyList<Entry>::NONE) {
            return;
        }
        index_.erase(recency_.at(slot).key);
        recency_.remove(slot);
        ++stats_.evictions;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    Index index_;
    RecencyList<Entry> recency_;
    CacheStats stats_;
};

#endif // LRUTTLCACHE_HPP
