#ifndef KEYVALUE_HPP
#define KEYVALUE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using Bytes = std::vector<std::uint8_t>;

// Canonical form of a call argument. The set of shapes is closed: anything a
// caller passes is reduced to one of these kinds by KeyNormalizer.
//
// KeyValue is totally ordered (kind first, then contents) so that unordered
// collections and mappings can be sorted into a reproducible sequence, and
// its hash agrees with its equality.
class KeyValue {
public:
    enum class Kind {
        Null = 0,
        Boolean,
        Integer,
        Float,
        Text,
        Bytes,
        Sequence,
        Set,
        Mapping,
        Opaque
    };

    using List = std::vector<KeyValue>;
    using Entry = std::pair<KeyValue, KeyValue>;

    KeyValue() = default;

    static KeyValue null() { return KeyValue(); }
    static KeyValue boolean(bool value);
    static KeyValue integer(std::int64_t value);
    static KeyValue floating(double value);
    static KeyValue text(std::string value);
    static KeyValue bytes(const Bytes& value);
    static KeyValue opaque(std::string representation);

    static KeyValue sequence(List items);
    // Elements are sorted; insertion order is not significant.
    static KeyValue set(List items);
    // Entries are sorted by key (then value, for multimaps).
    static KeyValue mapping(std::vector<Entry> entries);

    Kind kind() const { return kind_; }
    bool asBool() const { return bool_; }
    std::int64_t asInteger() const { return integer_; }
    double asFloat() const { return float_; }
    // Text, Bytes (raw octets) and Opaque payloads.
    const std::string& asText() const { return text_; }
    // Sequence and Set elements; Mapping entries are stored flattened as key, value, key, value...
    const List& items() const { return items_; }
    std::size_t size() const;

    int compare(const KeyValue& other) const;
    std::size_t hash() const;
    std::string to_string() const;

    bool operator==(const KeyValue& other) const { return compare(other) == 0; }
    bool operator!=(const KeyValue& other) const { return compare(other) != 0; }
    bool operator<(const KeyValue& other) const { return compare(other) < 0; }

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    std::int64_t integer_ = 0;
    double float_ = 0.0;
    std::string text_;
    List items_;
};

#endif // KEYVALUE_HPP
