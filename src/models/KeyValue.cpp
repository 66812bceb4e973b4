#include "KeyValue.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include <boost/container_hash/hash.hpp>

namespace {
    // NaN sorts after every number and equals itself; -0.0 equals 0.0.
    int compareFloats(double lhs, double rhs) {
        bool lhs_nan = std::isnan(lhs);
        bool rhs_nan = std::isnan(rhs);
        if (lhs_nan || rhs_nan) {
            if (lhs_nan == rhs_nan) return 0;
            return lhs_nan ? 1 : -1;
        }
        if (lhs < rhs) return -1;
        if (rhs < lhs) return 1;
        return 0;
    }

    template <typename T>
    int compareValues(const T& lhs, const T& rhs) {
        if (lhs < rhs) return -1;
        if (rhs < lhs) return 1;
        return 0;
    }

    std::string quoted(const std::string& text) {
        std::ostringstream oss;
        oss << std::quoted(text);
        return oss.str();
    }
}

KeyValue KeyValue::boolean(bool value) {
    KeyValue kv;
    kv.kind_ = Kind::Boolean;
    kv.bool_ = value;
    return kv;
}

KeyValue KeyValue::integer(std::int64_t value) {
    KeyValue kv;
    kv.kind_ = Kind::Integer;
    kv.integer_ = value;
    return kv;
}

KeyValue KeyValue::floating(double value) {
    KeyValue kv;
    kv.kind_ = Kind::Float;
    kv.float_ = value;
    return kv;
}

KeyValue KeyValue::text(std::string value) {
    KeyValue kv;
    kv.kind_ = Kind::Text;
    kv.text_ = std::move(value);
    return kv;
}

KeyValue KeyValue::bytes(const Bytes& value) {
    KeyValue kv;
    kv.kind_ = Kind::Bytes;
    kv.text_.assign(value.begin(), value.end());
    return kv;
}

KeyValue KeyValue::opaque(std::string representation) {
    KeyValue kv;
    kv.kind_ = Kind::Opaque;
    kv.text_ = std::move(representation);
    return kv;
}

KeyValue KeyValue::sequence(List items) {
    KeyValue kv;
    kv.kind_ = Kind::Sequence;
    kv.items_ = std::move(items);
    return kv;
}

KeyValue KeyValue::set(List items) {
    std::sort(items.begin(), items.end());
    KeyValue kv;
    kv.kind_ = Kind::Set;
    kv.items_ = std::move(items);
    return kv;
}

KeyValue KeyValue::mapping(std::vector<Entry> entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& lhs, const Entry& rhs) {
        int by_key = lhs.first.compare(rhs.first);
        if (by_key != 0) return by_key < 0;
        return lhs.second < rhs.second;
    });
    KeyValue kv;
    kv.kind_ = Kind::Mapping;
    kv.items_.reserve(entries.size() * 2);
    for (auto& entry : entries) {
        kv.items_.push_back(std::move(entry.first));
        kv.items_.push_back(std::move(entry.second));
    }
    return kv;
}

std::size_t KeyValue::size() const {
    switch (kind_) {
        case Kind::Sequence:
        case Kind::Set:
            return items_.size();
        case Kind::Mapping:
            return items_.size() / 2;
        case Kind::Text:
        case Kind::Bytes:
        case Kind::Opaque:
            return text_.size();
        default:
            return 0;
    }
}

int KeyValue::compare(const KeyValue& other) const {
    if (kind_ != other.kind_) {
        return compareValues(static_cast<int>(kind_), static_cast<int>(other.kind_));
    }
    switch (kind_) {
        case Kind::Null:
            return 0;
        case Kind::Boolean:
            return compareValues(bool_, other.bool_);
        case Kind::Integer:
            return compareValues(integer_, other.integer_);
        case Kind::Float:
            return compareFloats(float_, other.float_);
        case Kind::Text:
        case Kind::Bytes:
        case Kind::Opaque: {
            int cmp = text_.compare(other.text_);
            return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
        }
        case Kind::Sequence:
        case Kind::Set:
        case Kind::Mapping: {
            std::size_t common = std::min(items_.size(), other.items_.size());
            for (std::size_t i = 0; i < common; ++i) {
                int cmp = items_[i].compare(other.items_[i]);
                if (cmp != 0) return cmp;
            }
            return compareValues(items_.size(), other.items_.size());
        }
    }
    return 0;
}

std::size_t KeyValue::hash() const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(kind_));
    switch (kind_) {
        case Kind::Null:
            break;
        case Kind::Boolean:
            boost::hash_combine(seed, bool_);
            break;
        case Kind::Integer:
            boost::hash_combine(seed, integer_);
            break;
        case Kind::Float:
            if (std::isnan(float_)) {
                boost::hash_combine(seed, std::numeric_limits<std::size_t>::max());
            } else {
                // Adding 0.0 folds -0.0 into 0.0 so equal values hash equally.
                boost::hash_combine(seed, float_ + 0.0);
            }
            break;
        case Kind::Text:
        case Kind::Bytes:
        case Kind::Opaque:
            boost::hash_combine(seed, text_);
            break;
        case Kind::Sequence:
        case Kind::Set:
        case Kind::Mapping:
            for (const auto& item : items_) {
                boost::hash_combine(seed, item.hash());
            }
            break;
    }
    return seed;
}

std::string KeyValue::to_string() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::Null:
            oss << "null";
            break;
        case Kind::Boolean:
            oss << std::boolalpha << bool_;
            break;
        case Kind::Integer:
            oss << integer_;
            break;
        case Kind::Float:
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << float_;
            break;
        case Kind::Text:
            oss << quoted(text_);
            break;
        case Kind::Bytes:
            oss << "b'" << std::hex << std::setfill('0');
            for (unsigned char c : text_) {
                oss << std::setw(2) << static_cast<int>(c);
            }
            oss << "'";
            break;
        case Kind::Opaque:
            oss << "<" << text_ << ">";
            break;
        case Kind::Sequence:
        case Kind::Set: {
            oss << (kind_ == Kind::Sequence ? "(" : "{");
            for (std::size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << items_[i].to_string();
            }
            oss << (kind_ == Kind::Sequence ? ")" : "}");
            break;
        }
        case Kind::Mapping: {
            oss << "{";
            for (std::size_t i = 0; i + 1 < items_.size(); i += 2) {
                if (i > 0) oss << ", ";
                oss << items_[i].to_string() << ": " << items_[i + 1].to_string();
            }
            oss << "}";
            break;
        }
    }
    return oss.str();
}
