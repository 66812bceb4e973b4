#ifndef KEYNORMALIZER_HPP
#define KEYNORMALIZER_HPP

#include <cstdint>
#include <array>
#include <cstddef>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../models/CacheKey.hpp"
#include "../models/KeyValue.hpp"

using Keywords = std::map<std::string, KeyValue>;

namespace KeyNormalizerTraits {
    template <typename T, typename = void>
    struct is_iterable : std::false_type {};
    template <typename T>
    struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                      decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

    template <typename T, typename = void>
    struct has_key_type : std::false_type {};
    template <typename T>
    struct has_key_type<T, std::void_t<typename T::key_type>> : std::true_type {};

    template <typename T, typename = void>
    struct has_mapped_type : std::false_type {};
    template <typename T>
    struct has_mapped_type<T, std::void_t<typename T::mapped_type>> : std::true_type {};

    template <typename T>
    struct is_tuple_like : std::false_type {};
    template <typename... Ts>
    struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};
    template <typename A, typename B>
    struct is_tuple_like<std::pair<A, B>> : std::true_type {};

    template <typename T>
    struct is_std_array : std::false_type {};
    template <typename T, std::size_t N>
    struct is_std_array<std::array<T, N>> : std::true_type {};

    template <typename T>
    struct is_optional : std::false_type {};
    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    // Records: types that expose a field view through nlohmann's to_json.
    template <typename T, typename = void>
    struct has_json_fields : std::false_type {};
    template <typename T>
    struct has_json_fields<T, std::void_t<decltype(nlohmann::adl_serializer<T>::to_json(
                                  std::declval<nlohmann::json&>(), std::declval<const T&>()))>> : std::true_type {};

    template <typename T, typename = void>
    struct is_streamable : std::false_type {};
    template <typename T>
    struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
        : std::true_type {};

    template <typename T>
    struct always_false : std::false_type {};
}

// Reduces call arguments to a canonical CacheKey.
//
// Fixed-size shapes (tuples, pairs, std::array) keep their order.
// Dynamic collections (vectors, lists, deques) and set-like containers are
// sorted into the Set shape, keeping duplicates. Map-like containers are
// sorted by key, so two structurally equal argument sets always yield the
// same key.
// Types that are none of the recognized shapes fall back to their
// operator<< text; distinct objects that print identically share a key.
class KeyNormalizer {
public:
    template <typename T>
    static KeyValue normalize(const T& value) {
        using D = std::decay_t<T>;
        using namespace KeyNormalizerTraits;

        if constexpr (std::is_same_v<D, KeyValue>) {
            return value;
        } else if constexpr (std::is_same_v<D, nlohmann::json>) {
            return normalizeJson(value);
        } else if constexpr (std::is_same_v<D, std::nullptr_t> || std::is_same_v<D, std::nullopt_t>) {
            return KeyValue::null();
        } else if constexpr (is_optional<D>::value) {
            return value ? normalize(*value) : KeyValue::null();
        } else if constexpr (std::is_same_v<D, bool>) {
            return KeyValue::boolean(value);
        } else if constexpr (std::is_same_v<D, char>) {
            return KeyValue::text(std::string(1, value));
        } else if constexpr (std::is_integral_v<D>) {
            if constexpr (std::is_unsigned_v<D>) {
                if (static_cast<std::uint64_t>(value) >
                    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return KeyValue::opaque(std::to_string(value));
                }
            }
            return KeyValue::integer(static_cast<std::int64_t>(value));
        } else if constexpr (std::is_enum_v<D>) {
            return normalize(static_cast<std::underlying_type_t<D>>(value));
        } else if constexpr (std::is_floating_point_v<D>) {
            return KeyValue::floating(static_cast<double>(value));
        } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            return KeyValue::text(std::string(std::string_view(value)));
        } else if constexpr (std::is_same_v<D, Bytes>) {
            return KeyValue::bytes(value);
        } else if constexpr (is_tuple_like<D>::value) {
            KeyValue::List items;
            std::apply([&items](const auto&... element) { (items.push_back(normalize(element)), ...); }, value);
            return KeyValue::sequence(std::move(items));
        } else if constexpr (is_iterable<D>::value && has_mapped_type<D>::value) {
            std::vector<KeyValue::Entry> entries;
            for (const auto& entry : value) {
                entries.emplace_back(normalize(entry.first), normalize(entry.second));
            }
            return KeyValue::mapping(std::move(entries));
        } else if constexpr (is_std_array<D>::value) {
            KeyValue::List items;
            for (const auto& element : value) {
                items.push_back(normalize(element));
            }
            return KeyValue::sequence(std::move(items));
        } else if constexpr (is_iterable<D>::value) {
            KeyValue::List items;
            for (const auto& element : value) {
                items.push_back(normalize(element));
            }
            return KeyValue::set(std::move(items));
        } else if constexpr (has_json_fields<D>::value) {
            nlohmann::json fields = value;
            return normalizeJson(fields);
        } else if constexpr (is_streamable<D>::value) {
            std::ostringstream oss;
            oss << value;
            return KeyValue::opaque(oss.str());
        } else {
            static_assert(always_false<D>::value,
                          "argument type has no cache key shape: provide to_json or operator<<");
        }
    }

    // Mirrors the JSON document: objects become mappings, arrays are sorted
    // like any other dynamic collection.
    static KeyValue normalizeJson(const nlohmann::json& value);

    // Key for a full argument set: (positional sequence, keyword mapping).
    static CacheKey makeKey(const KeyValue::List& positional, const Keywords& keywords = Keywords());

    template <typename... Args>
    static CacheKey fromArguments(const Args&... args) {
        KeyValue::List positional;
        positional.reserve(sizeof...(Args));
        (positional.push_back(normalize(args)), ...);
        return makeKey(positional);
    }
};

#endif // KEYNORMALIZER_HPP
