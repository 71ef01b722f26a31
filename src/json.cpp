#include "argtree/json.hpp"

#include <cctype>
#include <cstdio>
#include <optional>

#include "argtree/error.hpp"

namespace argtree::json {

namespace {

const char* kindName(Value::Kind k) {
    switch (k) {
    case Value::Kind::Null: return "null";
    case Value::Kind::Bool: return "bool";
    case Value::Kind::Number: return "number";
    case Value::Kind::String: return "string";
    case Value::Kind::Array: return "array";
    case Value::Kind::Object: return "object";
    }
    return "value";
}

[[noreturn]] void typeMismatch(const char* want, Value::Kind got) {
    throw Error(ErrorCode::InvalidFormat, std::string("expected json ") + want + ", got " + kindName(got));
}

constexpr int kMaxDepth = 256;

void appendUtf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct Reader {
    const char* p{nullptr};
    const char* end{nullptr};
    const char* begin{nullptr};
    int depth{0};

    static bool isWs(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

    void skipWs() {
        while (p < end && isWs(*p)) ++p;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw Error(ErrorCode::InvalidJsonFormat,
                    "invalid json at offset " + std::to_string(p - begin) + ": " + what);
    }

    bool consume(char c) {
        skipWs();
        if (p >= end || *p != c) return false;
        ++p;
        return true;
    }

    void expect(char c) {
        if (!consume(c)) fail(std::string("expected '") + c + "'");
    }

    bool startsWith(std::string_view lit) const {
        return static_cast<std::size_t>(end - p) >= lit.size() && std::string_view(p, lit.size()) == lit;
    }

    std::optional<unsigned> hex4() {
        if (end - p < 4) return std::nullopt;
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = *p++;
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<unsigned>(c - 'A' + 10);
            else return std::nullopt;
        }
        return cp;
    }

    // After "\\u". A high surrogate must be followed by "\\u" and a low one.
    unsigned parseCodePoint() {
        const auto hi = hex4();
        if (!hi) fail("bad \\u escape");
        if (*hi >= 0xDC00 && *hi <= 0xDFFF) fail("unpaired low surrogate");
        if (*hi < 0xD800 || *hi > 0xDBFF) return *hi;
        if (end - p < 2 || p[0] != '\\' || p[1] != 'u') fail("unpaired high surrogate");
        p += 2;
        const auto lo = hex4();
        if (!lo || *lo < 0xDC00 || *lo > 0xDFFF) fail("unpaired high surrogate");
        return 0x10000 + ((*hi - 0xD800) << 10) + (*lo - 0xDC00);
    }

    std::string parseString() {
        skipWs();
        if (p >= end || *p != '"') fail("expected string");
        ++p;
        std::string out;
        while (p < end) {
            const char ch = *p++;
            if (ch == '"') return out;
            if (static_cast<unsigned char>(ch) < 0x20) fail("control character in string");
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (p >= end) break;
            const char esc = *p++;
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': appendUtf8(out, parseCodePoint()); break;
            default: fail(std::string("unsupported escape '\\") + esc + "'");
            }
        }
        fail("unterminated string");
    }

    std::string parseNumberToken() {
        const char* start = p;
        if (p < end && *p == '-') ++p;
        bool any = false;
        while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
            any = true;
            ++p;
        }
        if (p < end && *p == '.') {
            ++p;
            bool frac = false;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
                frac = true;
                ++p;
            }
            if (!frac) fail("digit expected after '.'");
        }
        if (!any) fail("unexpected character");
        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            if (p < end && (*p == '+' || *p == '-')) ++p;
            bool expAny = false;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
                expAny = true;
                ++p;
            }
            if (!expAny) fail("digit expected in exponent");
        }
        return std::string(start, p);
    }

    Value parseValue() {
        skipWs();
        if (p >= end) fail("unexpected end of input");
        const char c = *p;
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return Value::string(parseString());
        if (startsWith("true")) {
            p += 4;
            return Value::boolean(true);
        }
        if (startsWith("false")) {
            p += 5;
            return Value::boolean(false);
        }
        if (startsWith("null")) {
            p += 4;
            return Value{};
        }
        return Value::number(parseNumberToken());
    }

    void enter() {
        if (++depth > kMaxDepth) fail("nesting too deep");
    }

    Value parseArray() {
        expect('[');
        enter();
        Value arr = Value::array();
        if (!consume(']')) {
            while (true) {
                arr.push(parseValue());
                if (consume(']')) break;
                expect(',');
            }
        }
        --depth;
        return arr;
    }

    Value parseObject() {
        expect('{');
        enter();
        Value obj = Value::object();
        if (!consume('}')) {
            while (true) {
                auto key = parseString();
                expect(':');
                obj.set(std::move(key), parseValue());
                if (consume('}')) break;
                expect(',');
            }
        }
        --depth;
        return obj;
    }
};

void dumpTo(std::string& out, const Value& v) {
    switch (v.kind()) {
    case Value::Kind::Null: out += "null"; return;
    case Value::Kind::Bool: out += v.asBool() ? "true" : "false"; return;
    case Value::Kind::Number: out += v.scalarText(); return;
    case Value::Kind::String: out += quote(v.asString()); return;
    case Value::Kind::Array:
        out.push_back('[');
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i) out.push_back(',');
            dumpTo(out, v.items()[i]);
        }
        out.push_back(']');
        return;
    case Value::Kind::Object:
        out.push_back('{');
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i) out.push_back(',');
            out += quote(v.keys()[i]);
            out.push_back(':');
            dumpTo(out, v.items()[i]);
        }
        out.push_back('}');
        return;
    }
}

} // namespace

Value Value::boolean(bool v) {
    Value out;
    out.kind_ = Kind::Bool;
    out.bool_ = v;
    return out;
}

Value Value::number(std::string token) {
    Value out;
    out.kind_ = Kind::Number;
    out.text_ = std::move(token);
    return out;
}

Value Value::string(std::string text) {
    Value out;
    out.kind_ = Kind::String;
    out.text_ = std::move(text);
    return out;
}

Value Value::array() {
    Value out;
    out.kind_ = Kind::Array;
    return out;
}

Value Value::object() {
    Value out;
    out.kind_ = Kind::Object;
    return out;
}

bool Value::asBool() const {
    if (kind_ != Kind::Bool) typeMismatch("bool", kind_);
    return bool_;
}

const std::string& Value::asString() const {
    if (kind_ != Kind::String) typeMismatch("string", kind_);
    return text_;
}

std::string Value::scalarText() const {
    switch (kind_) {
    case Kind::Bool: return bool_ ? "true" : "false";
    case Kind::Number:
    case Kind::String: return text_;
    default: typeMismatch("scalar", kind_);
    }
}

const Value* Value::find(std::string_view key) const {
    if (kind_ != Kind::Object) return nullptr;
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) return &items_[i];
    }
    return nullptr;
}

const Value& Value::at(std::string_view key) const {
    if (kind_ != Kind::Object) typeMismatch("object", kind_);
    if (const auto* v = find(key)) return *v;
    throw Error(ErrorCode::MissingField, "missing required field \"" + std::string(key) + "\"", std::string(key));
}

Value& Value::push(Value v) {
    if (kind_ != Kind::Array) typeMismatch("array", kind_);
    items_.push_back(std::move(v));
    return *this;
}

Value& Value::set(std::string key, Value v) {
    if (kind_ != Kind::Object) typeMismatch("object", kind_);
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            items_[i] = std::move(v);
            return *this;
        }
    }
    keys_.push_back(std::move(key));
    items_.push_back(std::move(v));
    return *this;
}

Value parse(std::string_view text) {
    Reader r;
    r.begin = text.data();
    r.p = text.data();
    r.end = text.data() + text.size();
    Value v = r.parseValue();
    r.skipWs();
    if (r.p != r.end) r.fail("trailing characters");
    return v;
}

std::string dump(const Value& v) {
    std::string out;
    dumpTo(out, v);
    return out;
}

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char ch : s) {
        switch (ch) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                out += buf;
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace argtree::json
