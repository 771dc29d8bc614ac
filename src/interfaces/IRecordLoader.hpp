#ifndef IRECORDLOADER_HPP
#define IRECORDLOADER_HPP

#include <optional>

// Read side of a backing store.
// load() returns the value (Found), std::nullopt (NotFound), or throws (Error).
// It may be called concurrently and more than once for the same key.
template <typename Key, typename Value>
class IRecordLoader {
public:
    virtual ~IRecordLoader() = default;
    virtual std::optional<Value> load(const Key& key) = 0;
};

#endif // IRECORDLOADER_HPP
