#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <optional>

// Unit stored in the cache. The recency links live in the RecencyList slot
// that holds the entry, not here.
template <typename Key, typename Value, typename TimePoint>
struct CacheEntry {
    Key key;
    Value value;
    std::optional<TimePoint> expires_at; // nullopt = never expires

    bool isExpired(TimePoint now) const {
        return expires_at && now >= *expires_at;
    }
};

#endif // CACHEENTRY_HPP
