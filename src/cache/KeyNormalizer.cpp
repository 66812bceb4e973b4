#include "KeyNormalizer.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

KeyValue KeyNormalizer::normalizeJson(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return KeyValue::null();
        case nlohmann::json::value_t::boolean:
            return KeyValue::boolean(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return KeyValue::integer(value.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return normalize(value.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return KeyValue::floating(value.get<double>());
        case nlohmann::json::value_t::string:
            return KeyValue::text(value.get<std::string>());
        case nlohmann::json::value_t::binary: {
            const auto& binary = value.get_binary();
            return KeyValue::bytes(Bytes(binary.begin(), binary.end()));
        }
        case nlohmann::json::value_t::array: {
            KeyValue::List items;
            items.reserve(value.size());
            for (const auto& element : value) {
                items.push_back(normalizeJson(element));
            }
            return KeyValue::set(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            std::vector<KeyValue::Entry> entries;
            entries.reserve(value.size());
            for (auto it = value.begin(); it != value.end(); ++it) {
                entries.emplace_back(KeyValue::text(it.key()), normalizeJson(it.value()));
            }
            return KeyValue::mapping(std::move(entries));
        }
    }
    return KeyValue::opaque(value.dump());
}

CacheKey KeyNormalizer::makeKey(const KeyValue::List& positional, const Keywords& keywords) {
    std::vector<KeyValue::Entry> keyword_entries;
    keyword_entries.reserve(keywords.size());
    for (const auto& [name, value] : keywords) {
        keyword_entries.emplace_back(KeyValue::text(name), value);
    }
    KeyValue::List parts;
    parts.reserve(2);
    parts.push_back(KeyValue::sequence(positional));
    parts.push_back(KeyValue::mapping(std::move(keyword_entries)));
    return CacheKey(KeyValue::sequence(std::move(parts)));
}
