/**
 * @file gc_json.hpp
 * @brief Lightweight JSON document model for history input and report output
 * @author GymCoach Analytics Team
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - JSON value representation
 * - JSON parsing with Result-based error reporting
 * - JSON serialization (compact or indented)
 * - Lenient typed field accessors used by the record loaders
 */

#ifndef GYMCOACH_GC_JSON_HPP
#define GYMCOACH_GC_JSON_HPP

#include "result.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <cstdint>
#include <functional>

namespace gymcoach {
namespace json {

class JsonValue;

using JsonNull = std::monostate;
using JsonBool = bool;
using JsonNumber = double;
using JsonString = std::string;
using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

enum class JsonType { Null, Bool, Number, String, Array, Object };

/**
 * @brief JSON value class
 */
class JsonValue {
public:
    using ValueType = std::variant<JsonNull, JsonBool, JsonNumber, JsonString,
                                   JsonArray, JsonObject>;

    JsonValue() : value_(JsonNull{}) {}
    JsonValue(std::nullptr_t) : value_(JsonNull{}) {}
    JsonValue(bool b) : value_(b) {}
    JsonValue(int i) : value_(static_cast<double>(i)) {}
    JsonValue(long l) : value_(static_cast<double>(l)) {}
    JsonValue(long long ll) : value_(static_cast<double>(ll)) {}
    JsonValue(unsigned long ul) : value_(static_cast<double>(ul)) {}
    JsonValue(unsigned long long ull) : value_(static_cast<double>(ull)) {}
    JsonValue(double d) : value_(d) {}
    JsonValue(const char* s) : value_(JsonString(s)) {}
    JsonValue(std::string s) : value_(std::move(s)) {}
    JsonValue(JsonArray arr) : value_(std::move(arr)) {}
    JsonValue(JsonObject obj) : value_(std::move(obj)) {}

    [[nodiscard]] JsonType type() const noexcept { return static_cast<JsonType>(value_.index()); }
    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<JsonNull>(value_); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<JsonBool>(value_); }
    [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<JsonNumber>(value_); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<JsonString>(value_); }
    [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(value_); }
    [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(value_); }

    // Value access (throws on type mismatch)
    [[nodiscard]] bool asBool() const { return checked<JsonBool>("boolean"); }
    [[nodiscard]] double asNumber() const { return checked<JsonNumber>("number"); }
    [[nodiscard]] int asInt() const { return static_cast<int>(asNumber()); }
    [[nodiscard]] const JsonString& asString() const { return checked<JsonString>("string"); }
    [[nodiscard]] const JsonArray& asArray() const { return checked<JsonArray>("array"); }
    [[nodiscard]] const JsonObject& asObject() const { return checked<JsonObject>("object"); }
    [[nodiscard]] JsonArray& asArray() { return checkedMut<JsonArray>("array"); }
    [[nodiscard]] JsonObject& asObject() { return checkedMut<JsonObject>("object"); }

    // Optional access (nullopt on type mismatch)
    [[nodiscard]] std::optional<bool> getBool() const noexcept {
        if (auto* p = std::get_if<JsonBool>(&value_)) return *p;
        return std::nullopt;
    }
    [[nodiscard]] std::optional<double> getNumber() const noexcept {
        if (auto* p = std::get_if<JsonNumber>(&value_)) return *p;
        return std::nullopt;
    }
    [[nodiscard]] std::optional<std::string> getString() const noexcept {
        if (auto* p = std::get_if<JsonString>(&value_)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* arr = std::get_if<JsonArray>(&value_)) return arr->size();
        if (auto* obj = std::get_if<JsonObject>(&value_)) return obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] const JsonValue& operator[](std::size_t index) const { return asArray().at(index); }
    void push_back(JsonValue val) { asArray().push_back(std::move(val)); }

    [[nodiscard]] bool contains(const std::string& key) const noexcept { return find(key) != nullptr; }
    [[nodiscard]] const JsonValue& operator[](const std::string& key) const {
        const JsonValue* v = find(key);
        if (!v) throw std::runtime_error("Key not found: " + key);
        return *v;
    }
    [[nodiscard]] JsonValue& operator[](const std::string& key) { return asObject()[key]; }

    /// Member lookup that tolerates non-objects and missing keys.
    [[nodiscard]] const JsonValue* find(const std::string& key) const noexcept {
        if (auto* obj = std::get_if<JsonObject>(&value_)) {
            auto it = obj->find(key);
            if (it != obj->end()) return &it->second;
        }
        return nullptr;
    }

    // Lenient field accessors used by the loaders
    [[nodiscard]] std::optional<double> numberAt(const std::string& key) const noexcept {
        const JsonValue* v = find(key);
        return v ? v->getNumber() : std::nullopt;
    }
    [[nodiscard]] std::optional<std::string> stringAt(const std::string& key) const noexcept {
        const JsonValue* v = find(key);
        return v ? v->getString() : std::nullopt;
    }
    [[nodiscard]] double numberOr(const std::string& key, double fallback) const noexcept {
        return numberAt(key).value_or(fallback);
    }
    [[nodiscard]] std::string stringOr(const std::string& key, const std::string& fallback) const {
        return stringAt(key).value_or(fallback);
    }
    /// String array field; non-string elements are skipped.
    [[nodiscard]] std::vector<std::string> stringListAt(const std::string& key) const {
        std::vector<std::string> out;
        const JsonValue* v = find(key);
        if (!v || !v->isArray()) return out;
        for (const auto& item : v->asArray()) {
            if (auto s = item.getString()) out.push_back(*s);
        }
        return out;
    }

    [[nodiscard]] std::string dump(int indent = -1) const {
        std::ostringstream oss;
        dumpImpl(oss, indent, 0);
        return oss.str();
    }

    [[nodiscard]] bool operator==(const JsonValue& other) const { return value_ == other.value_; }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    ValueType value_;

    template<typename T>
    const T& checked(const char* what) const {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw std::runtime_error(std::string("JSON value is not a ") + what);
    }
    template<typename T>
    T& checkedMut(const char* what) {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw std::runtime_error(std::string("JSON value is not a ") + what);
    }

    static void dumpString(std::ostringstream& oss, const std::string& s);
    void dumpImpl(std::ostringstream& oss, int indent, int currentIndent) const;
};

// ============================================================================
// JSON Parser
// ============================================================================

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& msg, std::size_t pos)
        : std::runtime_error(msg + " at position " + std::to_string(pos))
        , position_(pos) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

/**
 * @brief Recursive-descent JSON parser
 */
class JsonParser {
public:
    static constexpr int MAX_DEPTH = 128;

    /**
     * @brief Parse JSON text
     * @throws JsonParseError on invalid JSON
     */
    [[nodiscard]] static JsonValue parse(std::string_view json) {
        JsonParser parser(json);
        parser.skipWhitespace();
        JsonValue result = parser.parseValue(0);
        parser.skipWhitespace();
        if (parser.pos_ < parser.json_.size()) {
            throw JsonParseError("Unexpected characters after JSON", parser.pos_);
        }
        return result;
    }

    /**
     * @brief Parse JSON text into a Result
     * @return Parsed value, or PARSE_ERROR carrying the parser message
     */
    [[nodiscard]] static Result<JsonValue> parseDocument(std::string_view json) {
        try {
            return parse(json);
        } catch (const JsonParseError& e) {
            return Error{ErrorCode::PARSE_ERROR, e.what()};
        } catch (const std::invalid_argument& e) {
            return Error{ErrorCode::PARSE_ERROR, e.what()};
        } catch (const std::out_of_range& e) {
            return Error{ErrorCode::PARSE_ERROR, std::string("numeric literal out of range: ") + e.what()};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_ = 0;

    explicit JsonParser(std::string_view json) : json_(json) {}

    JsonValue parseValue(int depth);
    JsonValue parseLiteral();
    JsonValue parseNumber();
    JsonValue parseArray(int depth);
    JsonValue parseObject(int depth);
    std::string parseString();
    void appendEscape(std::string& out);

    void skipWhitespace() {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }
    char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }
    char consume() { return pos_ < json_.size() ? json_[pos_++] : '\0'; }
    bool match(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }
    void expect(char c) {
        if (!match(c)) throw JsonParseError(std::string("Expected '") + c + "'", pos_);
    }
    bool isDigit() const { return peek() >= '0' && peek() <= '9'; }
};

// ============================================================================
// JSON Builder
// ============================================================================

/**
 * @brief Fluent JSON object builder
 */
class JsonObjectBuilder {
public:
    template<typename T>
    JsonObjectBuilder& add(const std::string& key, T&& value) {
        obj_[key] = JsonValue(std::forward<T>(value));
        return *this;
    }

    /// Adds the value only when engaged, otherwise writes null.
    template<typename T>
    JsonObjectBuilder& addOptional(const std::string& key, const std::optional<T>& value) {
        obj_[key] = value ? JsonValue(*value) : JsonValue(nullptr);
        return *this;
    }

    [[nodiscard]] JsonValue build() { return JsonValue(std::move(obj_)); }

private:
    JsonObject obj_;
};

/**
 * @brief Fluent JSON array builder
 */
class JsonArrayBuilder {
public:
    template<typename T>
    JsonArrayBuilder& add(T&& value) {
        arr_.push_back(JsonValue(std::forward<T>(value)));
        return *this;
    }

    [[nodiscard]] JsonValue build() { return JsonValue(std::move(arr_)); }

private:
    JsonArray arr_;
};

[[nodiscard]] inline Result<JsonValue> parse(std::string_view json) {
    return JsonParser::parseDocument(json);
}

[[nodiscard]] inline JsonObjectBuilder object() { return JsonObjectBuilder(); }
[[nodiscard]] inline JsonArrayBuilder array() { return JsonArrayBuilder(); }

/// Builds a JSON array of strings.
[[nodiscard]] inline JsonValue stringArray(const std::vector<std::string>& items) {
    JsonArray arr;
    arr.reserve(items.size());
    for (const auto& s : items) arr.emplace_back(s);
    return JsonValue(std::move(arr));
}

// ============================================================================
// Implementation
// ============================================================================

inline void JsonValue::dumpString(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

inline void JsonValue::dumpImpl(std::ostringstream& oss, int indent, int currentIndent) const {
    const bool pretty = indent >= 0;
    const std::string newline = pretty ? "\n" : "";
    const std::string closingPad = pretty ? std::string(currentIndent, ' ') : "";
    const std::string childPad = pretty ? std::string(currentIndent + indent, ' ') : "";

    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, JsonNull>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, JsonBool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, JsonNumber>) {
            // Non-finite numbers have no JSON spelling
            if (!std::isfinite(arg)) {
                oss << "null";
            } else if (arg == std::floor(arg) && std::abs(arg) < 1e15) {
                oss << static_cast<int64_t>(arg);
            } else {
                oss << std::setprecision(10) << arg;
            }
        } else if constexpr (std::is_same_v<T, JsonString>) {
            dumpString(oss, arg);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
            oss << "[";
            if (!arg.empty()) {
                oss << newline;
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    oss << childPad;
                    arg[i].dumpImpl(oss, indent, currentIndent + indent);
                    if (i + 1 < arg.size()) oss << ",";
                    oss << newline;
                }
                oss << closingPad;
            }
            oss << "]";
        } else {
            oss << "{";
            if (!arg.empty()) {
                oss << newline;
                std::size_t i = 0;
                for (const auto& [key, val] : arg) {
                    oss << childPad;
                    dumpString(oss, key);
                    oss << (pretty ? ": " : ":");
                    val.dumpImpl(oss, indent, currentIndent + indent);
                    if (++i < arg.size()) oss << ",";
                    oss << newline;
                }
                oss << closingPad;
            }
            oss << "}";
        }
    }, value_);
}

inline JsonValue JsonParser::parseValue(int depth) {
    if (depth > MAX_DEPTH) throw JsonParseError("Nesting too deep", pos_);
    skipWhitespace();
    if (pos_ >= json_.size()) throw JsonParseError("Unexpected end of input", pos_);

    char c = peek();
    if (c == 'n' || c == 't' || c == 'f') return parseLiteral();
    if (c == '"') return JsonValue(parseString());
    if (c == '[') return parseArray(depth);
    if (c == '{') return parseObject(depth);
    if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();

    throw JsonParseError(std::string("Unexpected character: ") + c, pos_);
}

inline JsonValue JsonParser::parseLiteral() {
    if (json_.substr(pos_, 4) == "null") { pos_ += 4; return JsonValue(nullptr); }
    if (json_.substr(pos_, 4) == "true") { pos_ += 4; return JsonValue(true); }
    if (json_.substr(pos_, 5) == "false") { pos_ += 5; return JsonValue(false); }
    throw JsonParseError("Invalid literal", pos_);
}

inline JsonValue JsonParser::parseNumber() {
    std::size_t start = pos_;
    match('-');

    if (match('0')) {
        // leading zero stands alone
    } else if (isDigit()) {
        while (isDigit()) consume();
    } else {
        throw JsonParseError("Invalid number", pos_);
    }

    if (match('.')) {
        if (!isDigit()) throw JsonParseError("Invalid number", pos_);
        while (isDigit()) consume();
    }

    if (peek() == 'e' || peek() == 'E') {
        consume();
        if (peek() == '+' || peek() == '-') consume();
        if (!isDigit()) throw JsonParseError("Invalid number", pos_);
        while (isDigit()) consume();
    }

    return JsonValue(std::stod(std::string(json_.substr(start, pos_ - start))));
}

inline std::string JsonParser::parseString() {
    expect('"');
    std::string result;
    while (pos_ < json_.size() && peek() != '"') {
        if (peek() == '\\') {
            consume();
            appendEscape(result);
        } else {
            result += consume();
        }
    }
    expect('"');
    return result;
}

inline void JsonParser::appendEscape(std::string& out) {
    if (pos_ >= json_.size()) throw JsonParseError("Unexpected end of string", pos_);

    char c = consume();
    switch (c) {
        case '"': out += '"'; return;
        case '\\': out += '\\'; return;
        case '/': out += '/'; return;
        case 'b': out += '\b'; return;
        case 'f': out += '\f'; return;
        case 'n': out += '\n'; return;
        case 'r': out += '\r'; return;
        case 't': out += '\t'; return;
        case 'u': break;
        default:
            throw JsonParseError(std::string("Invalid escape sequence: \\") + c, pos_);
    }

    if (pos_ + 4 > json_.size()) throw JsonParseError("Invalid unicode escape", pos_);
    unsigned cp = 0;
    for (int i = 0; i < 4; ++i) {
        char h = consume();
        cp <<= 4;
        if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
        else throw JsonParseError("Invalid unicode escape", pos_);
    }

    // BMP only; surrogate halves are kept as individual code units
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline JsonValue JsonParser::parseArray(int depth) {
    expect('[');
    skipWhitespace();

    JsonArray arr;
    if (!match(']')) {
        do {
            arr.push_back(parseValue(depth + 1));
            skipWhitespace();
        } while (match(','));
        expect(']');
    }
    return JsonValue(std::move(arr));
}

inline JsonValue JsonParser::parseObject(int depth) {
    expect('{');
    skipWhitespace();

    JsonObject obj;
    if (!match('}')) {
        do {
            skipWhitespace();
            std::string key = parseString();
            skipWhitespace();
            expect(':');
            obj[key] = parseValue(depth + 1);
            skipWhitespace();
        } while (match(','));
        expect('}');
    }
    return JsonValue(std::move(obj));
}

} // namespace json
} // namespace gymcoach

#endif // GYMCOACH_GC_JSON_HPP
