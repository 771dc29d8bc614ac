#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Thrown when a cache is constructed with capacity <= 0.
class InvalidCapacity : public std::invalid_argument {
public:
    explicit InvalidCapacity(long long capacity)
        : std::invalid_argument("Cache capacity must be positive, got " + std::to_string(capacity)) {}
};

// Thrown when set() is given a zero or negative TTL, or one whose deadline
// the cache clock cannot represent.
class InvalidTTL : public std::invalid_argument {
public:
    explicit InvalidTTL(long long ttl_millis)
        : std::invalid_argument("Cache TTL must be positive, got " + std::to_string(ttl_millis) + "ms") {}

    InvalidTTL(long long ttl_millis, long long max_millis)
        : std::invalid_argument("Cache TTL of " + std::to_string(ttl_millis)
                                + "ms exceeds the clock range, at most " + std::to_string(max_millis) + "ms") {}
};

#endif // CACHEERRORS_HPP
