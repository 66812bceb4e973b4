#ifndef STOREINTERFACE_HPP
#define STOREINTERFACE_HPP

#include <any>
#include <chrono>
#include <cstddef>
#include <optional>

#include "../models/CacheKey.hpp"

// Result of a store lookup. found && !fresh means the entry had outlived the
// TTL and was dropped by the lookup itself.
struct StoreLookup {
    bool found = false;
    bool fresh = false;
    std::any value;
};

class StoreInterface {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~StoreInterface() = default;
    virtual StoreLookup get(const CacheKey& key, TimePoint now) = 0;
    // Returns true if the write pushed the least-recently-used entry out.
    virtual bool put(const CacheKey& key, std::any value, TimePoint now) = 0;
    virtual bool remove(const CacheKey& key) = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;
    virtual std::size_t maxSize() const = 0;
    virtual std::optional<std::chrono::milliseconds> ttl() const = 0;
};

#endif // STOREINTERFACE_HPP
