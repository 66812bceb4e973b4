#ifndef LRUSTORE_HPP
#define LRUSTORE_HPP

#include <any>
#include <chrono>
#include <list>
#include <optional>
#include <unordered_map>

#include "../interfaces/StoreInterface.hpp"
#include "../models/CacheKey.hpp"

struct StoreEntry {
    CacheKey key;
    std::any value;
    StoreInterface::TimePoint stored_at; // Insertion or last overwrite
};

// Bounded key -> value map with least-recently-used eviction and lazy TTL
// expiry. Not synchronized: the owner serializes access.
class LruStore : public StoreInterface {
private:
    std::list<StoreEntry> lru_list_; // front = most recently used, back = least recently used
    std::unordered_map<CacheKey, std::list<StoreEntry>::iterator, CacheKeyHash> index_;

    const std::size_t max_size_;
    const std::optional<std::chrono::milliseconds> ttl_;

    bool isExpired(const StoreEntry& entry, TimePoint now) const;
    bool evictIfNeeded();

public:
    explicit LruStore(std::size_t max_size, std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    ~LruStore() override = default;

    StoreLookup get(const CacheKey& key, TimePoint now) override;
    bool put(const CacheKey& key, std::any value, TimePoint now) override;
    bool remove(const CacheKey& key) override;
    void clear() override;
    std::size_t size() const override { return index_.size(); }
    std::size_t maxSize() const override { return max_size_; }
    std::optional<std::chrono::milliseconds> ttl() const override { return ttl_; }
};

#endif // LRUSTORE_HPP
