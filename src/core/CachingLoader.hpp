#ifndef CACHINGLOADER_HPP
#define CACHINGLOADER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../cache/CacheErrors.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IRecordLoader.hpp"

template <typename Key, typename Value>
using LoaderFn = std::function<std::optional<Value>(const Key&)>;

// Wraps loader_fn so that it consults cache first and stores what it loads
// with the given ttl. NotFound results and exceptions pass through uncached.
template <typename Key, typename Value>
LoaderFn<Key, Value> makeCachingLoader(std::shared_ptr<CacheInterface<Key, Value>> cache,
                                       LoaderFn<Key, Value> loader_fn,
                                       CacheTtl ttl) {
    if (!cache) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!loader_fn) {
        throw std::invalid_argument("Loader function cannot be empty");
    }
    if (ttl && ttl->count() <= 0) {
        throw InvalidTTL(ttl->count());
    }
    return [cache = std::move(cache), loader_fn = std::move(loader_fn), ttl](const Key& key) -> std::optional<Value> {
        if (auto cached = cache->get(key)) {
            return cached;
        }
        std::optional<Value> loaded = loader_fn(key);
        if (loaded) {
            cache->set(key, *loaded, ttl);
        }
        return loaded;
    };
}

// Adapts a plain function to IRecordLoader.
template <typename Key, typename Value>
class FunctionLoader : public IRecordLoader<Key, Value> {
public:
    explicit FunctionLoader(LoaderFn<Key, Value> fn) : fn_(std::move(fn)) {
        if (!fn_) {
            throw std::invalid_argument("Loader function cannot be empty");
        }
    }

    std::optional<Value> load(const Key& key) override { return fn_(key); }

private:
    LoaderFn<Key, Value> fn_;
};

#endif // CACHINGLOADER_HPP
