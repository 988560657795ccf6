/**
 * Cloak - Obfuscating C Compiler
 *
 * json_parser.hpp - Reader for cloak's JSON configuration files
 *
 * Objects keep their keys in document order so that unknown option
 * warnings come out in the order the user wrote them. Errors carry the
 * line and column of the offending character.
 */

#ifndef CLOAK_JSON_PARSER_HPP
#define CLOAK_JSON_PARSER_HPP

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {

enum class JsonType {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/**
 * A parsed JSON document or one of its members
 */
class JsonValue {
public:
    JsonType type = JsonType::Null;

    bool bool_value = false;
    double number_value = 0.0;
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::unordered_map<std::string, JsonValue> object_value;
    std::vector<std::string> key_order;

    JsonValue() = default;
    JsonValue(bool v) : type(JsonType::Bool), bool_value(v) {}
    JsonValue(int v) : type(JsonType::Number), number_value(v) {}
    JsonValue(double v) : type(JsonType::Number), number_value(v) {}
    JsonValue(const std::string& v) : type(JsonType::String), string_value(v) {}
    JsonValue(const char* v) : type(JsonType::String), string_value(v) {}

    static JsonValue array() {
        JsonValue v;
        v.type = JsonType::Array;
        return v;
    }

    static JsonValue object() {
        JsonValue v;
        v.type = JsonType::Object;
        return v;
    }

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Bool; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    // values of the wrong type read as the default
    bool asBool(bool def = false) const { return isBool() ? bool_value : def; }
    double asDouble(double def = 0.0) const { return isNumber() ? number_value : def; }
    int asInt(int def = 0) const { return isNumber() ? static_cast<int>(number_value) : def; }

    std::string asString(const std::string& def = "") const {
        return isString() ? string_value : def;
    }

    // string members of an array; other members are skipped
    std::vector<std::string> asStringArray() const {
        std::vector<std::string> out;
        for (const auto& item : array_value) {
            if (item.isString()) out.push_back(item.string_value);
        }
        return out;
    }

    size_t size() const {
        if (isArray()) return array_value.size();
        if (isObject()) return object_value.size();
        return 0;
    }

    const JsonValue& operator[](size_t index) const {
        if (!isArray() || index >= array_value.size()) return null();
        return array_value[index];
    }

    const JsonValue& operator[](const std::string& key) const {
        if (!isObject()) return null();
        auto it = object_value.find(key);
        return it != object_value.end() ? it->second : null();
    }

    bool has(const std::string& key) const {
        return isObject() && object_value.count(key) != 0;
    }

    const std::vector<std::string>& keys() const { return key_order; }

    /**
     * Member lookup along a dotted path, "optimization.level" for example.
     * A missing step yields null.
     */
    const JsonValue& get(const std::string& path) const {
        const JsonValue* node = this;
        size_t start = 0;
        while (true) {
            size_t dot = path.find('.', start);
            node = &(*node)[path.substr(start, dot == std::string::npos ? std::string::npos : dot - start)];
            if (dot == std::string::npos || node->isNull()) return *node;
            start = dot + 1;
        }
    }

    void set(const std::string& key, JsonValue value) {
        if (!object_value.count(key)) key_order.push_back(key);
        object_value[key] = std::move(value);
    }

private:
    static const JsonValue& null() {
        static const JsonValue value;
        return value;
    }
};

/**
 * Malformed JSON, with the position where reading stopped
 */
class JsonError : public std::runtime_error {
public:
    JsonError(const std::string& message, int line, int column)
        : std::runtime_error("line " + std::to_string(line) + ", column " +
                             std::to_string(column) + ": " + message),
          line_(line), column_(column) {}

    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

class JsonParser {
public:
    /**
     * Parses a complete document; anything but whitespace after the
     * top-level value is an error
     *
     * @throws JsonError on malformed input
     */
    static JsonValue parse(const std::string& text) {
        JsonParser parser(text);
        JsonValue value = parser.value();
        parser.skipSpace();
        if (!parser.atEnd()) parser.fail("unexpected text after the document");
        return value;
    }

    /**
     * @throws std::runtime_error when the file cannot be read,
     *         JsonError when it is not valid JSON
     */
    static JsonValue parseFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw std::runtime_error("cannot open '" + path + "'");
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return parse(text);
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;

    // nesting beyond this is rejected rather than recursed into
    static constexpr int kMaxDepth = 64;
    int depth_ = 0;

    explicit JsonParser(const std::string& text) : text_(text) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    char next() {
        if (atEnd()) fail("unexpected end of input");
        char c = text_[pos_++];
        if (c == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        return c;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw JsonError(message, line_, column_);
    }

    void skipSpace() {
        while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
            next();
        }
    }

    void expect(char c) {
        skipSpace();
        if (peek() != c) fail(std::string("expected '") + c + "'");
        next();
    }

    void literal(const char* word) {
        for (const char* p = word; *p; p++) {
            if (peek() != *p) fail(std::string("expected '") + word + "'");
            next();
        }
    }

    JsonValue value() {
        skipSpace();
        switch (peek()) {
            case '{': return object();
            case '[': return array();
            case '"': return JsonValue(string());
            case 't': literal("true"); return JsonValue(true);
            case 'f': literal("false"); return JsonValue(false);
            case 'n': literal("null"); return JsonValue();
            default:
                if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
                if (atEnd()) fail("unexpected end of input");
                fail(std::string("unexpected character '") + peek() + "'");
        }
    }

    JsonValue number() {
        size_t start = pos_;
        if (peek() == '-') next();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected a digit");
        auto digits = [this] {
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        };
        digits();
        if (peek() == '.') {
            next();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected a digit after '.'");
            digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected an exponent");
            digits();
        }
        return JsonValue(std::strtod(text_.substr(start, pos_ - start).c_str(), nullptr));
    }

    unsigned hex4() {
        unsigned code = 0;
        for (int i = 0; i < 4; i++) {
            char h = next();
            if (!std::isxdigit(static_cast<unsigned char>(h))) fail("bad \\u escape");
            code = code * 16 + static_cast<unsigned>(std::isdigit(static_cast<unsigned char>(h))
                ? h - '0' : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
        }
        return code;
    }

    // BMP only; surrogate halves are written as-is
    static void appendUtf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string string() {
        expect('"');
        std::string out;
        while (true) {
            if (atEnd()) fail("unterminated string");
            char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            char e = next();
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': appendUtf8(out, hex4()); break;
                default: fail(std::string("unknown escape '\\") + e + "'");
            }
        }
    }

    JsonValue array() {
        expect('[');
        if (++depth_ > kMaxDepth) fail("nesting too deep");
        JsonValue v = JsonValue::array();
        skipSpace();
        if (peek() == ']') {
            next();
        } else {
            while (true) {
                v.array_value.push_back(value());
                skipSpace();
                if (peek() == ']') {
                    next();
                    break;
                }
                expect(',');
            }
        }
        depth_--;
        return v;
    }

    JsonValue object() {
        expect('{');
        if (++depth_ > kMaxDepth) fail("nesting too deep");
        JsonValue v = JsonValue::object();
        skipSpace();
        if (peek() == '}') {
            next();
        } else {
            while (true) {
                skipSpace();
                if (peek() != '"') fail("expected a member name");
                std::string key = string();
                expect(':');
                // a repeated key keeps its first position and its last value
                v.set(key, value());
                skipSpace();
                if (peek() == '}') {
                    next();
                    break;
                }
                expect(',');
            }
        }
        depth_--;
        return v;
    }
};

} // namespace cloak

#endif // CLOAK_JSON_PARSER_HPP
