#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstdint>
#include <sstream>
#include <string>

// Snapshot of a cache's counters, taken under the cache lock.
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t updates = 0;
    uint64_t evictions = 0;   // capacity evictions only
    uint64_t expirations = 0; // lazy expirations plus purged entries
    uint64_t removals = 0;    // explicit remove() of a present key

    double hitRatio() const {
        uint64_t lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats {"
            << " hits: " << hits
            << ", misses: " << misses
            << ", insertions: " << insertions
            << ", updates: " << updates
            << ", evictions: " << evictions
            << ", expirations: " << expirations
            << ", removals: " << removals
            << ", hit_ratio: " << hitRatio()
            << " }";
        return oss.str();
    }
};

#endif // CACHESTATS_HPP
