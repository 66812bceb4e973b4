#include "LruStore.hpp"

#include <string>
#include <utility>

#include "../core/CacheErrors.hpp"

LruStore::LruStore(std::size_t max_size, std::optional<std::chrono::milliseconds> ttl)
    : max_size_(max_size), ttl_(ttl) {
    if (max_size_ == 0) {
        throw CacheConfigurationError("max_size must be > 0");
    }
    if (ttl_ && ttl_->count() <= 0) {
        throw CacheConfigurationError("ttl must be positive, got " + std::to_string(ttl_->count()) + "ms");
    }
}

StoreLookup LruStore::get(const CacheKey& key, TimePoint now) {
    StoreLookup lookup;
    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return lookup;
    }
    lookup.found = true;

    auto entry_it = index_it->second;
    if (isExpired(*entry_it, now)) {
        // Lazy expiry: the stale entry goes away on the access that notices it
        lru_list_.erase(entry_it);
        index_.erase(index_it);
        return lookup;
    }

    // Move accessed entry to the front of the recency list
    lru_list_.splice(lru_list_.begin(), lru_list_, entry_it);
    lookup.fresh = true;
    lookup.value = entry_it->value;
    return lookup;
}

bool LruStore::put(const CacheKey& key, std::any value, TimePoint now) {
    auto index_it = index_.find(key);
    if (index_it != index_.end()) {
        // Overwrite refreshes both the timestamp and the recency position
        auto entry_it = index_it->second;
        entry_it->value = std::move(value);
        entry_it->stored_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, entry_it);
        return false;
    }

    lru_list_.push_front(StoreEntry{key, std::move(value), now});
    index_.emplace(key, lru_list_.begin());
    return evictIfNeeded();
}

bool LruStore::remove(const CacheKey& key) {
    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return false;
    }
    lru_list_.erase(index_it->second);
    index_.erase(index_it);
    return true;
}

void LruStore::clear() {
    lru_list_.clear();
    index_.clear();
}

bool LruStore::isExpired(const StoreEntry& entry, TimePoint now) const {
    return ttl_.has_value() && (now - entry.stored_at) >= *ttl_;
}

// A single write grows the store by at most one entry, so one eviction restores the bound.
bool LruStore::evictIfNeeded() {
    if (index_.size() <= max_size_ || lru_list_.empty()) {
        return false;
    }
    index_.erase(lru_list_.back().key);
    lru_list_.pop_back();
    return true;
}
