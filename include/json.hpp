#pragma once

#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <variant>
#include <stdexcept>
#include <charconv>
#include <cstdint>

namespace json {

class Value;
using Null = std::monostate;
using Boolean = bool;
using Number = double;
using String = std::string;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& what, size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    size_t offset() const { return offset_; }
private:
    size_t offset_;
};

class Value {
public:
    using VariantType = std::variant<Null, Boolean, Number, String, Array, Object>;
    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(int i) : data_(static_cast<double>(i)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Boolean>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    bool as_bool() const { return std::get<Boolean>(data_); }
    double as_number() const { return std::get<Number>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }

    bool contains(const std::string& key) const {
        return is_object() && as_object().count(key) > 0;
    }

    const Value& operator[](const std::string& key) const {
        static const Value null_value;
        if (!is_object()) return null_value;
        const auto& obj = as_object();
        auto it = obj.find(key);
        return it != obj.end() ? it->second : null_value;
    }

    std::string dump() const;

private:
    VariantType data_;
};

namespace detail {

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    Value parse_document() {
        auto v = parse_value(0);
        skip_ws();
        if (pos_ != in_.size()) fail("Trailing characters");
        return v;
    }

private:
    static constexpr int kMaxDepth = 256;

    std::string_view in_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const char* what) const { throw ParseError(what, pos_); }

    void skip_ws() {
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool consume_literal(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    Value parse_value(int depth) {
        if (depth > kMaxDepth) fail("Nesting too deep");
        skip_ws();
        if (pos_ >= in_.size()) fail("Unexpected end of input");
        char c = in_[pos_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return Value(parse_string());
        if (consume_literal("true")) return Value(true);
        if (consume_literal("false")) return Value(false);
        if (consume_literal("null")) return Value();
        if (c == '-' || (c >= '0' && c <= '9')) return Value(parse_number());
        fail("Unexpected character");
    }

    Value parse_object(int depth) {
        ++pos_;
        Object obj;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '}') { ++pos_; return Value(std::move(obj)); }
        while (true) {
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != '"') fail("Expected object key");
            auto key = parse_string();
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != ':') fail("Expected ':'");
            ++pos_;
            obj[std::move(key)] = parse_value(depth + 1);
            skip_ws();
            if (pos_ >= in_.size()) fail("Unterminated object");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == '}') { ++pos_; break; }
            fail("Expected ',' or '}'");
        }
        return Value(std::move(obj));
    }

    Value parse_array(int depth) {
        ++pos_;
        Array arr;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == ']') { ++pos_; return Value(std::move(arr)); }
        while (true) {
            arr.push_back(parse_value(depth + 1));
            skip_ws();
            if (pos_ >= in_.size()) fail("Unterminated array");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == ']') { ++pos_; break; }
            fail("Expected ',' or ']'");
        }
        return Value(std::move(arr));
    }

    uint32_t parse_hex4() {
        if (pos_ + 4 > in_.size()) fail("Truncated \\u escape");
        uint32_t v = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + pos_, in_.data() + pos_ + 4, v, 16);
        if (ec != std::errc() || ptr != in_.data() + pos_ + 4) fail("Invalid \\u escape");
        pos_ += 4;
        return v;
    }

    std::string parse_string() {
        ++pos_;
        std::string out;
        while (true) {
            if (pos_ >= in_.size()) fail("Unterminated string");
            char c = in_[pos_++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') { out += c; continue; }
            if (pos_ >= in_.size()) fail("Unterminated escape");
            char e = in_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) fail("Unpaired surrogate");
                        uint32_t lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("Invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: fail("Invalid escape");
            }
        }
        return out;
    }

    bool digit_at(size_t i) const { return i < in_.size() && in_[i] >= '0' && in_[i] <= '9'; }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    double parse_number() {
        size_t start = pos_;
        auto invalid = [&] { pos_ = start; fail("Invalid number"); };
        if (in_[pos_] == '-') ++pos_;
        if (!digit_at(pos_)) invalid();
        if (in_[pos_] == '0') {
            ++pos_;
            if (digit_at(pos_)) invalid();  // leading zero
        } else {
            while (digit_at(pos_)) ++pos_;
        }
        if (pos_ < in_.size() && in_[pos_] == '.') {
            ++pos_;
            if (!digit_at(pos_)) invalid();
            while (digit_at(pos_)) ++pos_;
        }
        if (pos_ < in_.size() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < in_.size() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            if (!digit_at(pos_)) invalid();
            while (digit_at(pos_)) ++pos_;
        }
        double d = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, d);
        if (ec != std::errc() || ptr != in_.data() + pos_) {
            pos_ = start;
            fail("Invalid number");
        }
        return d;
    }
};

inline void dump_string(std::string& out, const std::string& s) {
    static const char hex[] = "0123456789abcdef";
    out += '"';
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += hex[c >> 4];
                    out += hex[c & 0xF];
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

inline void dump_value(std::string& out, const Value& v) {
    if (v.is_null()) { out += "null"; return; }
    if (v.is_bool()) { out += v.as_bool() ? "true" : "false"; return; }
    if (v.is_number()) {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.as_number());
        out.append(buf, ec == std::errc() ? ptr : buf);
        return;
    }
    if (v.is_string()) { dump_string(out, v.as_string()); return; }
    if (v.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : v.as_array()) {
            if (!first) out += ',';
            first = false;
            dump_value(out, item);
        }
        out += ']';
        return;
    }
    out += '{';
    bool first = true;
    for (const auto& [key, item] : v.as_object()) {
        if (!first) out += ',';
        first = false;
        dump_string(out, key);
        out += ':';
        dump_value(out, item);
    }
    out += '}';
}

} // namespace detail

// Throws json::ParseError on malformed input
inline Value parse(std::string_view input) {
    return detail::Parser(input).parse_document();
}

inline std::string Value::dump() const {
    std::string out;
    detail::dump_value(out, *this);
    return out;
}

} // namespace json
