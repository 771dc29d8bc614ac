#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <optional>

#include "../models/CacheStats.hpp"

// Lifetime of a cached value. An empty CacheTtl means the entry never expires;
// callers must spell it out with NEVER_EXPIRES, set() has no default.
using CacheTtl = std::optional<std::chrono::milliseconds>;
inline constexpr CacheTtl NEVER_EXPIRES = std::nullopt;

// The part of a cache the expiration sweeper needs.
class ISweepable {
public:
    virtual ~ISweepable() = default;
    // Removes every expired entry and returns how many were removed.
    virtual size_t purgeExpired() = 0;
    virtual size_t size() const = 0;
};

template <typename Key, typename Value>
class CacheInterface : public ISweepable {
public:
    ~CacheInterface() override = default;

    // Returns a copy of the live value and marks it most recently used.
    // An expired entry is removed and reported as a miss.
    virtual std::optional<Value> get(const Key& key) = 0;
    // Throws InvalidTTL if ttl is zero or negative.
    virtual void set(const Key& key, Value value, CacheTtl ttl) = 0;
    // Returns false if the key was absent; that is not an error.
    virtual bool remove(const Key& key) = 0;
    // Liveness check without promotion.
    virtual bool exists(const Key& key) = 0;
    virtual void clear() = 0;
    virtual size_t capacity() const = 0;
    virtual CacheStats stats() const = 0;
};

#endif // CACHEINTERFACE_HPP
