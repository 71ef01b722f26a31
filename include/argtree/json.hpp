#ifndef ARGTREE_JSON_HPP
#define ARGTREE_JSON_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argtree::json {

// Minimal JSON document model used to decode struct-typed values.
// Numbers keep their source token so integer precision is never lost.
class Value {
public:
    enum class Kind { Null, Bool, Number, String, Array, Object };

    Value() = default;

    static Value boolean(bool v);
    static Value number(std::string token);
    static Value string(std::string text);
    static Value array();
    static Value object();

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isNull() const { return kind_ == Kind::Null; }
    [[nodiscard]] bool isBool() const { return kind_ == Kind::Bool; }
    [[nodiscard]] bool isNumber() const { return kind_ == Kind::Number; }
    [[nodiscard]] bool isString() const { return kind_ == Kind::String; }
    [[nodiscard]] bool isArray() const { return kind_ == Kind::Array; }
    [[nodiscard]] bool isObject() const { return kind_ == Kind::Object; }

    // Throws Error{InvalidFormat} when the kind does not match.
    [[nodiscard]] bool asBool() const;
    [[nodiscard]] const std::string& asString() const;
    // Text of a string, number or bool.
    [[nodiscard]] std::string scalarText() const;

    // Array elements or object member values, in document order.
    [[nodiscard]] const std::vector<Value>& items() const { return items_; }
    // Object member names, parallel to items().
    [[nodiscard]] const std::vector<std::string>& keys() const { return keys_; }
    [[nodiscard]] std::size_t size() const { return items_.size(); }

    [[nodiscard]] const Value* find(std::string_view key) const;
    // Throws Error{MissingField} naming the key.
    [[nodiscard]] const Value& at(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    Value& push(Value v);
    // Replaces an existing member with the same name.
    Value& set(std::string key, Value v);

private:
    Kind kind_{Kind::Null};
    bool bool_{false};
    std::string text_;
    std::vector<std::string> keys_;
    std::vector<Value> items_;
};

// Throws Error{InvalidJsonFormat} on malformed input or trailing garbage.
Value parse(std::string_view text);

// Compact serialization ({"a":1,"b":[true,null]}).
std::string dump(const Value& v);

std::string quote(std::string_view s);

} // namespace argtree::json

#endif // ARGTREE_JSON_HPP
