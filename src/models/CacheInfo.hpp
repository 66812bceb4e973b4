#ifndef CACHEINFO_HPP
#define CACHEINFO_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- Snapshot returned by MemoCache::info() ---
class CacheInfo {
public:
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t size = 0;
    std::size_t max_size = 0;
    std::optional<std::chrono::milliseconds> ttl;
    std::size_t inflight = 0;

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheInfo {"
            << " hits: " << hits
            << ", misses: " << misses
            << ", size: " << size
            << ", max_size: " << max_size
            << ", ttl: ";
        if (ttl) {
            oss << ttl->count() << "ms";
        } else {
            oss << "none";
        }
        oss << ", inflight: " << inflight << " }";
        return oss.str();
    }
};

inline void to_json(nlohmann::json& j, const CacheInfo& info) {
    j = nlohmann::json{
        {"hits", info.hits},
        {"misses", info.misses},
        {"size", info.size},
        {"maxsize", info.max_size},
        {"inflight", info.inflight}};
    if (info.ttl) {
        j["ttl_ms"] = info.ttl->count();
    } else {
        j["ttl_ms"] = nullptr;
    }
}

#endif // CACHEINFO_HPP
