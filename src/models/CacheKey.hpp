#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "KeyValue.hpp"

// Identity of one call's arguments. The hash is computed once on construction.
class CacheKey {
public:
    CacheKey() : hash_(value_.hash()) {}
    explicit CacheKey(KeyValue value) : value_(std::move(value)), hash_(value_.hash()) {}

    const KeyValue& value() const { return value_; }
    std::size_t hash() const { return hash_; }
    std::string to_string() const { return value_.to_string(); }

    bool operator==(const CacheKey& other) const {
        return hash_ == other.hash_ && value_ == other.value_;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    KeyValue value_;
    std::size_t hash_;
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept { return key.hash(); }
};

namespace std {
    template <>
    struct hash<CacheKey> {
        std::size_t operator()(const CacheKey& key) const noexcept { return key.hash(); }
    };
}

#endif // CACHEKEY_HPP
