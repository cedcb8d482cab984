/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace Skybound {

const char* toString(JsonType type) {
    switch (type) {
    case JsonType::Null:
        return "Null";
    case JsonType::Boolean:
        return "Boolean";
    case JsonType::Number:
        return "Number";
    case JsonType::String:
        return "String";
    case JsonType::Array:
        return "Array";
    case JsonType::Object:
        return "Object";
    }
    return "Unknown";
}

std::optional<bool> JsonValue::tryAsBool() const {
    if (isBool()) {
        return asBool();
    }
    return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
    if (isNumber()) {
        return asNumber();
    }
    return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
    if (isNumber()) {
        return asInt();
    }
    return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
    if (isString()) {
        return asString();
    }
    return std::nullopt;
}

bool JsonValue::hasKey(const std::string& key) const {
    const JsonObject* obj = tryAsObject();
    return obj && obj->contains(key);
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    const JsonObject* obj = tryAsObject();
    if (!obj) {
        return nullValue;
    }
    auto it = obj->find(key);
    return it != obj->end() ? it->second : nullValue;
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (isNull()) {
        m_value = JsonObject{};
    }
    return asObject()[key];
}

const JsonValue& JsonValue::operator[](size_t index) const {
    static const JsonValue nullValue;
    const JsonArray* arr = tryAsArray();
    if (!arr || index >= arr->size()) {
        return nullValue;
    }
    return (*arr)[index];
}

size_t JsonValue::size() const {
    if (const JsonArray* arr = tryAsArray()) {
        return arr->size();
    }
    if (const JsonObject* obj = tryAsObject()) {
        return obj->size();
    }
    return 0;
}

std::string JsonValue::toString(int indent) const {
    std::ostringstream out;
    write(out, indent, 0);
    return out.str();
}

namespace {

void writeEscaped(std::ostream& out, const std::string& s) {
    out << '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (c < 0x20) {
                out << std::format("\\u{:04x}", static_cast<unsigned>(c));
            } else {
                out << static_cast<char>(c);
            }
        }
    }
    out << '"';
}

void newline(std::ostream& out, int indent, int depth) {
    if (indent > 0) {
        out << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
    }
}

void appendUtf8(std::string& out, uint32_t cp) {
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

} // namespace

void JsonValue::write(std::ostream& out, int indent, int depth) const {
    switch (getType()) {
    case JsonType::Null:
        out << "null";
        break;
    case JsonType::Boolean:
        out << (asBool() ? "true" : "false");
        break;
    case JsonType::Number: {
        const double n = asNumber();
        if (!std::isfinite(n)) {
            out << "null";
        } else if (n == std::floor(n) && std::abs(n) < 1e15) {
            out << static_cast<long long>(n);
        } else {
            out << std::format("{}", n);
        }
        break;
    }
    case JsonType::String:
        writeEscaped(out, asString());
        break;
    case JsonType::Array: {
        const JsonArray& arr = asArray();
        out << '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out << ',';
            }
            newline(out, indent, depth + 1);
            arr[i].write(out, indent, depth + 1);
        }
        if (!arr.empty()) {
            newline(out, indent, depth);
        }
        out << ']';
        break;
    }
    case JsonType::Object: {
        const JsonObject& obj = asObject();
        out << '{';
        bool first = true;
        for (const auto& [key, value] : obj) {
            if (!first) {
                out << ',';
            }
            first = false;
            newline(out, indent, depth + 1);
            writeEscaped(out, key);
            out << (indent > 0 ? ": " : ":");
            value.write(out, indent, depth + 1);
        }
        if (!obj.empty()) {
            newline(out, indent, depth);
        }
        out << '}';
        break;
    }
    }
}

bool JsonReader::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        m_lastError = "Could not open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();
    return parse(content);
}

bool JsonReader::parse(std::string_view json) {
    m_input = json;
    m_pos = 0;
    m_line = 1;
    m_column = 1;
    m_depth = 0;
    m_lastError.clear();
    m_root = JsonValue();

    JsonValue root;
    skipWhitespace();
    if (!parseValue(root)) {
        m_input = {};
        return false;
    }
    skipWhitespace();
    if (!atEnd()) {
        fail(std::format("Unexpected trailing character '{}'", peek()));
        m_input = {};
        return false;
    }

    m_root = std::move(root);
    m_input = {};
    return true;
}

char JsonReader::advance() {
    const char c = m_input[m_pos++];
    if (c == '\n') {
        ++m_line;
        m_column = 1;
    } else {
        ++m_column;
    }
    return c;
}

void JsonReader::skipWhitespace() {
    while (!atEnd()) {
        const char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

bool JsonReader::expect(char c) {
    if (peek() != c || atEnd()) {
        return fail(std::format("Expected '{}'", c));
    }
    advance();
    return true;
}

bool JsonReader::expectLiteral(std::string_view literal) {
    if (m_input.substr(m_pos, literal.size()) != literal) {
        return fail(std::format("Invalid literal, expected '{}'", literal));
    }
    for (size_t i = 0; i < literal.size(); ++i) {
        advance();
    }
    return true;
}

bool JsonReader::parseValue(JsonValue& out) {
    if (atEnd()) {
        return fail("Unexpected end of input");
    }
    switch (peek()) {
    case '{':
        return parseObject(out);
    case '[':
        return parseArray(out);
    case '"': {
        std::string s;
        if (!parseString(s)) {
            return false;
        }
        out = JsonValue(std::move(s));
        return true;
    }
    case 't':
        out = JsonValue(true);
        return expectLiteral("true");
    case 'f':
        out = JsonValue(false);
        return expectLiteral("false");
    case 'n':
        out = JsonValue();
        return expectLiteral("null");
    default:
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return parseNumber(out);
        }
        return fail(std::format("Unexpected character '{}'", peek()));
    }
}

bool JsonReader::parseObject(JsonValue& out) {
    if (++m_depth > MAX_DEPTH) {
        return fail("Nesting too deep");
    }
    advance(); // {
    JsonObject obj;
    skipWhitespace();
    if (peek() == '}') {
        advance();
        out = JsonValue(std::move(obj));
        --m_depth;
        return true;
    }

    while (true) {
        skipWhitespace();
        if (peek() != '"') {
            return fail("Expected string key");
        }
        std::string key;
        if (!parseString(key)) {
            return false;
        }
        skipWhitespace();
        if (!expect(':')) {
            return false;
        }
        skipWhitespace();
        JsonValue value;
        if (!parseValue(value)) {
            return false;
        }
        obj.insert_or_assign(std::move(key), std::move(value));

        skipWhitespace();
        if (peek() == ',' && !atEnd()) {
            advance();
            continue;
        }
        if (!expect('}')) {
            return false;
        }
        break;
    }

    out = JsonValue(std::move(obj));
    --m_depth;
    return true;
}

bool JsonReader::parseArray(JsonValue& out) {
    if (++m_depth > MAX_DEPTH) {
        return fail("Nesting too deep");
    }
    advance(); // [
    JsonArray arr;
    skipWhitespace();
    if (peek() == ']') {
        advance();
        out = JsonValue(std::move(arr));
        --m_depth;
        return true;
    }

    while (true) {
        skipWhitespace();
        JsonValue value;
        if (!parseValue(value)) {
            return false;
        }
        arr.push_back(std::move(value));

        skipWhitespace();
        if (peek() == ',' && !atEnd()) {
            advance();
            continue;
        }
        if (!expect(']')) {
            return false;
        }
        break;
    }

    out = JsonValue(std::move(arr));
    --m_depth;
    return true;
}

bool JsonReader::parseHex4(uint32_t& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
        if (atEnd()) {
            return fail("Unexpected end of input in unicode escape");
        }
        const char c = advance();
        out <<= 4;
        if (c >= '0' && c <= '9') {
            out |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            out |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            out |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return fail("Invalid hex digit in unicode escape");
        }
    }
    return true;
}

bool JsonReader::parseString(std::string& out) {
    advance(); // opening quote
    while (true) {
        if (atEnd()) {
            return fail("Unterminated string");
        }
        const char c = advance();
        if (c == '"') {
            return true;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return fail("Control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        if (atEnd()) {
            return fail("Unexpected end of input in string escape");
        }
        const char esc = advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
            out += esc;
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            uint32_t cp = 0;
            if (!parseHex4(cp)) {
                return false;
            }
            // Surrogate pair
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (m_input.substr(m_pos, 2) != "\\u") {
                    return fail("Unpaired high surrogate");
                }
                advance();
                advance();
                uint32_t low = 0;
                if (!parseHex4(low)) {
                    return false;
                }
                if (low < 0xDC00 || low > 0xDFFF) {
                    return fail("Invalid low surrogate");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            appendUtf8(out, cp);
            break;
        }
        default:
            return fail(std::format("Invalid escape '\\{}'", esc));
        }
    }
}

bool JsonReader::parseNumber(JsonValue& out) {
    const size_t start = m_pos;
    auto digits = [this]() {
        size_t count = 0;
        while (!atEnd() && peek() >= '0' && peek() <= '9') {
            advance();
            ++count;
        }
        return count;
    };

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0' && !atEnd()) {
        advance();
    } else if (digits() == 0) {
        return fail("Expected digit");
    }
    if (peek() == '.' && !atEnd()) {
        advance();
        if (digits() == 0) {
            return fail("Expected digit after decimal point");
        }
    }
    if ((peek() == 'e' || peek() == 'E') && !atEnd()) {
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (digits() == 0) {
            return fail("Expected digit in exponent");
        }
    }

    double value = 0.0;
    const char* first = m_input.data() + start;
    const char* last = m_input.data() + m_pos;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return fail(std::format("Invalid number '{}'", std::string_view(first, last - first)));
    }
    out = JsonValue(value);
    return true;
}

bool JsonReader::fail(const std::string& message) {
    if (m_lastError.empty()) {
        m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
    }
    return false;
}

} // namespace Skybound
