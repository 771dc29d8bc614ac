#ifndef CACHEASIDE_HPP
#define CACHEASIDE_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "../cache/CacheErrors.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IRecordLoader.hpp"
#include "../interfaces/IRecordWriter.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../utils/Utils.hpp"

// Cache-aside coordination between callers, a cache and a backing store.
//
// read():  cache hit -> value. Miss -> loader; NotFound is returned without
//          caching, a found value is cached with the default TTL. Loader
//          exceptions propagate and nothing is cached.
// write(): persist first, invalidate second. If persist throws the cached
//          entry is left alone and the exception propagates.
//
// By default concurrent misses on one key each call the loader. With
// coalesce_loads the first miss loads and the others wait for its outcome.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class CacheAside {
public:
    using KeyExtractor = std::function<Key(const Value&)>;

    CacheAside(std::shared_ptr<CacheInterface<Key, Value>> cache,
               std::shared_ptr<IRecordLoader<Key, Value>> loader,
               std::shared_ptr<IRecordWriter<Key, Value>> writer,
               KeyExtractor key_of,
               std::chrono::milliseconds default_ttl,
               std::shared_ptr<ILogger> logger,
               std::shared_ptr<IStatsDClient> statsd_client,
               bool coalesce_loads = false)
        : cache_(std::move(cache)),
          loader_(std::move(loader)),
          writer_(std::move(writer)),
          key_of_(std::move(key_of)),
          default_ttl_(default_ttl),
          logger_(std::move(logger)),
          statsd_client_(std::move(statsd_client)),
          coalesce_loads_(coalesce_loads) {
        if (!cache_) {
            throw std::invalid_argument("Cache pointer cannot be null");
        }
        if (!loader_) {
            throw std::invalid_argument("Loader pointer cannot be null");
        }
        if (!writer_) {
            throw std::invalid_argument("Writer pointer cannot be null");
        }
        if (!key_of_) {
            throw std::invalid_argument("Key extractor cannot be empty");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient pointer cannot be null");
        }
        if (default_ttl_.count() <= 0) {
            throw InvalidTTL(default_ttl_.count());
        }
        logger_->debug(std::string("CacheAside initialized, coalesce_loads: ") + (coalesce_loads_ ? "true" : "false"));
    }

    CacheAside(const CacheAside&) = delete;
    CacheAside& operator=(const CacheAside&) = delete;
    CacheAside(CacheAside&&) = delete;
    CacheAside& operator=(CacheAside&&) = delete;

    std::optional<Value> read(const Key& key) {
        auto cached = cache_->get(key);
        if (cached) {
            statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
            if (logger_->isDebugEnabled()) {
                logger_->debug("Cache hit for key : " + Utils::describeKey(key));
            }
            return cached;
        }

        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Cache miss for key : " + Utils::describeKey(key));
        }
        if (coalesce_loads_) {
            return loadCoalesced(key);
        }
        return loadAndPopulate(key);
    }

    void write(const Value& record) {
        Key key = key_of_(record);
        try {
            writer_->persist(record);
        } catch (const std::exception& e) {
            logger_->warn("Persist failed for key " + Utils::describeKey(key) + ", cache left untouched: " + e.what());
            statsd_client_->increment(MetricsDefinitions::WRITE_ERROR);
            throw;
        }
        invalidate(key);
    }

    // Deletes from the backing store, then from the cache.
    void erase(const Key& key) {
        try {
            writer_->erase(key);
        } catch (const std::exception& e) {
            logger_->warn("Erase failed for key " + Utils::describeKey(key) + ", cache left untouched: " + e.what());
            statsd_client_->increment(MetricsDefinitions::WRITE_ERROR);
            throw;
        }
        invalidate(key);
    }

    // Cache-only invalidation for changes made to the store out of band.
    void invalidate(const Key& key) {
        bool removed = cache_->remove(key);
        detachInFlight(key);
        statsd_client_->increment(MetricsDefinitions::INVALIDATE);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Invalidated cache for key : " + Utils::describeKey(key) + (removed ? "" : " (was not cached)"));
        }
    }

    CacheStats stats() const { return cache_->stats(); }
    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }
    bool coalescesLoads() const { return coalesce_loads_; }

private:
    using LoadResult = std::optional<Value>;

    struct InFlightLoad {
        std::shared_ptr<std::promise<LoadResult>> owner;
        std::shared_future<LoadResult> result;
    };

    LoadResult loadAndPopulate(const Key& key) {
        auto start = std::chrono::steady_clock::now();
        LoadResult loaded;
        try {
            loaded = loader_->load(key);
        } catch (const std::exception& e) {
            logger_->warn("Loader failed for key " + Utils::describeKey(key) + ": " + e.what());
            statsd_client_->increment(MetricsDefinitions::LOAD_ERROR);
            throw;
        }
        statsd_client_->timingSince(MetricsDefinitions::STORE_LOAD_TIME, start);

        if (!loaded) {
            statsd_client_->increment(MetricsDefinitions::LOAD_NOT_FOUND);
            if (logger_->isDebugEnabled()) {
                logger_->debug("Backing store has no record for key : " + Utils::describeKey(key));
            }
            return std::nullopt;
        }

        cache_->set(key, *loaded, default_ttl_);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Populated cache for key : " + Utils::describeKey(key));
        }
        return loaded;
    }

    LoadResult loadCoalesced(const Key& key) {
        std::shared_ptr<std::promise<LoadResult>> owner;
        std::shared_future<LoadResult> result;
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) {
                result = it->second.result;
            } else {
                owner = std::make_shared<std::promise<LoadResult>>();
                result = owner->get_future().share();
                in_flight_.emplace(key, InFlightLoad{owner, result});
            }
        }

        if (!owner) {
            if (logger_->isDebugEnabled()) {
                logger_->debug("Joining in-flight load for key : " + Utils::describeKey(key));
            }
            return result.get(); // rethrows the leader's exception
        }

        try {
            LoadResult loaded = loadAndPopulate(key);
            owner->set_value(loaded);
            releaseInFlight(key, owner);
            return loaded;
        } catch (...) {
            owner->set_exception(std::current_exception());
            releaseInFlight(key, owner);
            throw;
        }
    }

    // Removes the marker only if it still belongs to this load; a write may
    // already have detached it and a newer load may own the slot.
    void releaseInFlight(const Key& key, const std::shared_ptr<std::promise<LoadResult>>& owner) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end() && it->second.owner == owner) {
            in_flight_.erase(it);
        }
    }

    void detachInFlight(const Key& key) {
        if (!coalesce_loads_) {
            return;
        }
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(key);
    }

    std::shared_ptr<CacheInterface<Key, Value>> cache_;
    std::shared_ptr<IRecordLoader<Key, Value>> loader_;
    std::shared_ptr<IRecordWriter<Key, Value>> writer_;
    KeyExtractor key_of_;
    const std::chrono::milliseconds default_ttl_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const bool coalesce_loads_;

    std::mutex in_flight_mutex_;
    std::unordered_map<Key, InFlightLoad, Hash> in_flight_;
};

#endif // CACHEASIDE_HPP
