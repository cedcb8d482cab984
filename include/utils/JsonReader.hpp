/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSON_READER_HPP
#define JSON_READER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Skybound {

class JsonValue;

// Ordered so saved config files are stable between runs
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

const char* toString(JsonType type);
inline std::ostream& operator<<(std::ostream& os, JsonType type) { return os << toString(type); }

class JsonValue {
public:
    using ValueType = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

    JsonValue() : m_value(nullptr) {}
    explicit JsonValue(bool value) : m_value(value) {}
    explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
    explicit JsonValue(double value) : m_value(value) {}
    explicit JsonValue(std::string value) : m_value(std::move(value)) {}
    explicit JsonValue(const char* value) : m_value(std::string(value)) {}
    explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
    explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

    JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
    bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
    bool isBool() const { return std::holds_alternative<bool>(m_value); }
    bool isNumber() const { return std::holds_alternative<double>(m_value); }
    bool isString() const { return std::holds_alternative<std::string>(m_value); }
    bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
    bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

    // Throw std::bad_variant_access on a type mismatch
    bool asBool() const { return std::get<bool>(m_value); }
    double asNumber() const { return std::get<double>(m_value); }
    int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
    const std::string& asString() const { return std::get<std::string>(m_value); }
    const JsonArray& asArray() const { return std::get<JsonArray>(m_value); }
    const JsonObject& asObject() const { return std::get<JsonObject>(m_value); }
    JsonArray& asArray() { return std::get<JsonArray>(m_value); }
    JsonObject& asObject() { return std::get<JsonObject>(m_value); }

    std::optional<bool> tryAsBool() const;
    std::optional<double> tryAsNumber() const;
    std::optional<int> tryAsInt() const;
    std::optional<std::string> tryAsString() const;
    const JsonArray* tryAsArray() const { return std::get_if<JsonArray>(&m_value); }
    const JsonObject* tryAsObject() const { return std::get_if<JsonObject>(&m_value); }

    bool hasKey(const std::string& key) const;
    // Missing keys and non-objects yield a shared null value
    const JsonValue& operator[](const std::string& key) const;
    // Converts a null value into an object on first use
    JsonValue& operator[](const std::string& key);
    const JsonValue& operator[](size_t index) const;
    size_t size() const;

    /**
     * @brief Serializes the value
     * @param indent spaces per nesting level, 0 for a single line
     */
    std::string toString(int indent = 0) const;

private:
    ValueType m_value;

    void write(std::ostream& out, int indent, int depth) const;
};

/**
 * Strict RFC 8259 reader for config files. Errors carry the line and
 * column of the offending character.
 */
class JsonReader {
public:
    bool loadFromFile(const std::string& path);
    bool parse(std::string_view json);

    const JsonValue& getRoot() const { return m_root; }
    const std::string& getLastError() const { return m_lastError; }
    void clearError() { m_lastError.clear(); }

private:
    std::string_view m_input;
    size_t m_pos{0};
    size_t m_line{1};
    size_t m_column{1};
    int m_depth{0};
    std::string m_lastError;
    JsonValue m_root;

    static constexpr int MAX_DEPTH = 64;

    bool atEnd() const { return m_pos >= m_input.size(); }
    char peek() const { return atEnd() ? '\0' : m_input[m_pos]; }
    char advance();
    void skipWhitespace();
    bool expect(char c);
    bool expectLiteral(std::string_view literal);

    bool parseValue(JsonValue& out);
    bool parseObject(JsonValue& out);
    bool parseArray(JsonValue& out);
    bool parseString(std::string& out);
    bool parseNumber(JsonValue& out);
    bool parseHex4(uint32_t& out);

    bool fail(const std::string& message);
};

} // namespace Skybound

#endif // JSON_READER_HPP
