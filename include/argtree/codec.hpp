#ifndef ARGTREE_CODEC_HPP
#define ARGTREE_CODEC_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "error.hpp"
#include "json.hpp"

namespace argtree {

// Specialize for an enum to make it usable as an option or argument type:
//
//   template <> struct argtree::EnumNames<Level> {
//       static std::vector<std::pair<Level, std::string_view>> entries() { ... }
//   };
template <typename E>
struct EnumNames;

namespace detail {

bool parseBool(std::string_view s, bool& out);
// Base 10 only. `overflow` is set when the text is a well formed number out of range.
bool parseSigned(std::string_view s, long long& out, bool& overflow);
bool parseUnsigned(std::string_view s, unsigned long long& out, bool& overflow);
bool parseDouble(std::string_view s, double& out, bool& overflow);
bool parseDuration(std::string_view s, std::chrono::milliseconds& out);
std::string formatDouble(double v);

[[noreturn]] void throwInvalid(std::string_view type, std::string_view raw);
[[noreturn]] void throwOverflow(std::string_view type, std::string_view raw);

template <typename T, typename = void>
struct HasEnumNames : std::false_type {};
template <typename T>
struct HasEnumNames<T, std::void_t<decltype(EnumNames<T>::entries())>> : std::true_type {};

template <typename T, typename = void>
struct HasFromJson : std::false_type {};
template <typename T>
struct HasFromJson<T, std::void_t<decltype(fromJson(std::declval<const json::Value&>(), std::declval<T&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct HasToJson : std::false_type {};
template <typename T>
struct HasToJson<T, std::void_t<decltype(toJson(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
struct IsVector : std::false_type {};
template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type {};

} // namespace detail

// String <-> typed value conversion. decode() throws Error on malformed input.
template <typename T, typename Enable = void>
struct Codec;

template <>
struct Codec<std::string> {
    static std::string typeName() { return "string"; }
    static std::string decode(std::string_view raw) { return std::string(raw); }
    static std::string encode(const std::string& v) { return v; }
};

template <>
struct Codec<bool> {
    static std::string typeName() { return "bool"; }
    static bool decode(std::string_view raw) {
        bool out = false;
        if (!detail::parseBool(raw, out)) detail::throwInvalid(typeName(), raw);
        return out;
    }
    static std::string encode(bool v) { return v ? "true" : "false"; }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::string typeName() {
        if constexpr (std::is_signed_v<T>) {
            return sizeof(T) > 4 ? "int64" : "int";
        } else {
            return sizeof(T) > 4 ? "uint64" : "uint";
        }
    }

    static T decode(std::string_view raw) {
        bool overflow = false;
        if constexpr (std::is_signed_v<T>) {
            long long v = 0;
            if (!detail::parseSigned(raw, v, overflow)) {
                if (overflow) detail::throwOverflow(typeName(), raw);
                detail::throwInvalid(typeName(), raw);
            }
            if (v < static_cast<long long>(std::numeric_limits<T>::min()) ||
                v > static_cast<long long>(std::numeric_limits<T>::max())) {
                detail::throwOverflow(typeName(), raw);
            }
            return static_cast<T>(v);
        } else {
            unsigned long long v = 0;
            if (!detail::parseUnsigned(raw, v, overflow)) {
                if (overflow) detail::throwOverflow(typeName(), raw);
                detail::throwInvalid(typeName(), raw);
            }
            if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) detail::throwOverflow(typeName(), raw);
            return static_cast<T>(v);
        }
    }

    static std::string encode(T v) { return std::to_string(v); }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static std::string typeName() { return std::is_same_v<T, float> ? "float" : "double"; }

    static T decode(std::string_view raw) {
        double v = 0.0;
        bool overflow = false;
        if (!detail::parseDouble(raw, v, overflow)) {
            if (overflow) detail::throwOverflow(typeName(), raw);
            detail::throwInvalid(typeName(), raw);
        }
        if constexpr (std::is_same_v<T, float>) {
            if (v > std::numeric_limits<float>::max() || v < std::numeric_limits<float>::lowest()) {
                detail::throwOverflow(typeName(), raw);
            }
        }
        return static_cast<T>(v);
    }

    static std::string encode(T v) { return detail::formatDouble(static_cast<double>(v)); }
};

template <>
struct Codec<std::chrono::milliseconds> {
    static std::string typeName() { return "duration"; }
    static std::chrono::milliseconds decode(std::string_view raw) {
        std::chrono::milliseconds out{};
        if (!detail::parseDuration(raw, out)) detail::throwInvalid(typeName(), raw);
        return out;
    }
    static std::string encode(std::chrono::milliseconds v) { return std::to_string(v.count()) + "ms"; }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_enum_v<T> && detail::HasEnumNames<T>::value>> {
    static std::string typeName() { return "enum"; }

    static T decode(std::string_view raw) {
        std::string allowed;
        for (const auto& [value, name] : EnumNames<T>::entries()) {
            if (name == raw) return value;
            if (!allowed.empty()) allowed += ", ";
            allowed += std::string(name);
        }
        throw Error(ErrorCode::InvalidEnumValue,
                    "invalid value \"" + std::string(raw) + "\" (allowed: " + allowed + ")");
    }

    static std::string encode(T v) {
        for (const auto& [value, name] : EnumNames<T>::entries()) {
            if (value == v) return std::string(name);
        }
        return std::to_string(static_cast<std::underlying_type_t<T>>(v));
    }
};

// Struct types decode from a JSON document through an ADL `fromJson(const json::Value&, T&)`.
// Encoding (needed for typed defaults) requires `json::Value toJson(const T&)`.
template <typename T>
struct Codec<T, std::enable_if_t<std::is_class_v<T> && detail::HasFromJson<T>::value>> {
    static std::string typeName() { return "json"; }

    static T decode(std::string_view raw) {
        const auto doc = json::parse(raw);
        T out{};
        fromJson(doc, out);
        return out;
    }

    static std::string encode(const T& v) {
        static_assert(detail::HasToJson<T>::value, "encoding a struct value requires toJson(const T&)");
        return json::dump(toJson(v));
    }
};

template <typename T>
std::string typeName() {
    return Codec<T>::typeName();
}

template <typename T>
T decode(std::string_view raw) {
    return Codec<T>::decode(raw);
}

template <typename T>
std::string encode(const T& v) {
    return Codec<T>::encode(v);
}

// Converts a JSON node to T. Scalars go through Codec<T> using their text form,
// arrays map to std::vector, and struct types recurse into fromJson.
template <typename T>
T fromJsonValue(const json::Value& v) {
    if constexpr (detail::HasFromJson<T>::value) {
        T out{};
        fromJson(v, out);
        return out;
    } else if constexpr (detail::IsVector<T>::value) {
        if (!v.isArray()) throw Error(ErrorCode::InvalidFormat, "expected json array");
        T out;
        out.reserve(v.size());
        for (const auto& item : v.items()) out.push_back(fromJsonValue<typename T::value_type>(item));
        return out;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return v.asString();
    } else if constexpr (std::is_same_v<T, bool>) {
        return v.asBool();
    } else {
        return Codec<T>::decode(v.scalarText());
    }
}

namespace json {

// Required member of an object; Error{MissingField} when absent.
template <typename T>
T get(const Value& obj, std::string_view key) {
    return fromJsonValue<T>(obj.at(key));
}

template <typename T>
T getOr(const Value& obj, std::string_view key, T fallback) {
    const auto* v = obj.find(key);
    if (!v || v->isNull()) return fallback;
    return fromJsonValue<T>(*v);
}

} // namespace json

} // namespace argtree

#endif // ARGTREE_CODEC_HPP
