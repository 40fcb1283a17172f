#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace parley {

namespace {

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

void appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        out += '\\';
        pos++;
        return;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return;
        case '\\': out += '\\'; pos += 2; return;
        case '/': out += '/'; pos += 2; return;
        case 'n': out += '\n'; pos += 2; return;
        case 'r': out += '\r'; pos += 2; return;
        case 't': out += '\t'; pos += 2; return;
        case 'b': out += '\b'; pos += 2; return;
        case 'f': out += '\f'; pos += 2; return;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                out += 'u';
                pos += 2;
                return;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u') {
                    uint32_t low = 0;
                    if (parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
            }
            appendUtf8(out, codepoint);
            return;
        }
        default:
            out += esc;
            pos += 2;
            return;
    }
}

void skipWhitespace(const std::string& input, size_t& pos) {
    while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
        pos++;
    }
}

[[noreturn]] void fail(const std::string& what, size_t pos) {
    throw std::invalid_argument("Malformed JSON: " + what + " at offset " + std::to_string(pos));
}

constexpr int kMaxNestingDepth = 64;

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Advances pos past a quoted string starting at pos (which must be '"').
void scanString(const std::string& input, size_t& pos) {
    pos++; // opening quote
    while (pos < input.size()) {
        const char c = input[pos];
        if (static_cast<unsigned char>(c) < 0x20) {
            fail("control character in string", pos);
        }
        if (c == '\\') {
            if (pos + 1 >= input.size()) {
                break;
            }
            const char esc = input[pos + 1];
            if (esc == 'u') {
                uint32_t ignored = 0;
                if (!parseHex4(input, pos + 2, ignored)) {
                    fail("invalid unicode escape", pos);
                }
                pos += 6;
                continue;
            }
            if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' &&
                esc != 'f' && esc != 'n' && esc != 'r' && esc != 't') {
                fail("invalid escape", pos);
            }
            pos += 2;
            continue;
        }
        if (c == '"') {
            pos++;
            return;
        }
        pos++;
    }
    fail("unterminated string", pos);
}

void scanNumber(const std::string& input, size_t& pos) {
    if (input[pos] == '-') {
        pos++;
    }
    if (pos >= input.size() || !isDigit(input[pos])) {
        fail("invalid number", pos);
    }
    if (input[pos] == '0') {
        pos++;
    } else {
        while (pos < input.size() && isDigit(input[pos])) pos++;
    }
    if (pos < input.size() && input[pos] == '.') {
        pos++;
        if (pos >= input.size() || !isDigit(input[pos])) {
            fail("invalid number", pos);
        }
        while (pos < input.size() && isDigit(input[pos])) pos++;
    }
    if (pos < input.size() && (input[pos] == 'e' || input[pos] == 'E')) {
        pos++;
        if (pos < input.size() && (input[pos] == '+' || input[pos] == '-')) {
            pos++;
        }
        if (pos >= input.size() || !isDigit(input[pos])) {
            fail("invalid number", pos);
        }
        while (pos < input.size() && isDigit(input[pos])) pos++;
    }
}

void scanKeyword(const std::string& input, size_t& pos, const char* word) {
    const std::string expected(word);
    if (input.compare(pos, expected.size(), expected) != 0) {
        fail("unexpected literal", pos);
    }
    pos += expected.size();
}

void scanValue(const std::string& input, size_t& pos, int depth);

void scanObject(const std::string& input, size_t& pos, int depth) {
    pos++; // '{'
    skipWhitespace(input, pos);
    if (pos < input.size() && input[pos] == '}') {
        pos++;
        return;
    }
    while (true) {
        skipWhitespace(input, pos);
        if (pos >= input.size() || input[pos] != '"') {
            fail("expected key", pos);
        }
        scanString(input, pos);
        skipWhitespace(input, pos);
        if (pos >= input.size() || input[pos] != ':') {
            fail("expected ':'", pos);
        }
        pos++;
        scanValue(input, pos, depth + 1);
        skipWhitespace(input, pos);
        if (pos >= input.size()) {
            fail("unterminated object", pos);
        }
        if (input[pos] == ',') {
            pos++;
            continue;
        }
        if (input[pos] == '}') {
            pos++;
            return;
        }
        fail("expected ',' or '}'", pos);
    }
}

void scanArray(const std::string& input, size_t& pos, int depth) {
    pos++; // '['
    skipWhitespace(input, pos);
    if (pos < input.size() && input[pos] == ']') {
        pos++;
        return;
    }
    while (true) {
        scanValue(input, pos, depth + 1);
        skipWhitespace(input, pos);
        if (pos >= input.size()) {
            fail("unterminated array", pos);
        }
        if (input[pos] == ',') {
            pos++;
            continue;
        }
        if (input[pos] == ']') {
            pos++;
            return;
        }
        fail("expected ',' or ']'", pos);
    }
}

// Advances pos past one complete JSON value, rejecting anything malformed.
void scanValue(const std::string& input, size_t& pos, int depth) {
    if (depth > kMaxNestingDepth) {
        fail("nesting too deep", pos);
    }
    skipWhitespace(input, pos);
    if (pos >= input.size()) {
        fail("missing value", pos);
    }

    const char c = input[pos];
    if (c == '"') {
        scanString(input, pos);
    } else if (c == '{') {
        scanObject(input, pos, depth);
    } else if (c == '[') {
        scanArray(input, pos, depth);
    } else if (c == 't') {
        scanKeyword(input, pos, "true");
    } else if (c == 'f') {
        scanKeyword(input, pos, "false");
    } else if (c == 'n') {
        scanKeyword(input, pos, "null");
    } else if (c == '-' || isDigit(c)) {
        scanNumber(input, pos);
    } else {
        fail("unexpected character", pos);
    }
}

} // namespace

std::map<std::string, std::string> JsonParser::parseRaw(const std::string& json) {
    std::map<std::string, std::string> result;

    size_t pos = 0;
    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '{') {
        fail("expected object", pos);
    }
    pos++;

    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == '}') {
        pos++;
    } else {
        while (true) {
            skipWhitespace(json, pos);
            if (pos >= json.size() || json[pos] != '"') {
                fail("expected key", pos);
            }

            // Extract key
            std::string key;
            pos++;
            while (pos < json.size() && json[pos] != '"') {
                if (json[pos] == '\\') {
                    appendEscapedChar(json, pos, key);
                    continue;
                }
                key += json[pos];
                pos++;
            }
            if (pos >= json.size()) {
                fail("unterminated key", pos);
            }
            pos++; // closing quote

            skipWhitespace(json, pos);
            if (pos >= json.size() || json[pos] != ':') {
                fail("expected ':'", pos);
            }
            pos++;
            skipWhitespace(json, pos);
            if (pos >= json.size()) {
                fail("missing value", pos);
            }

            // Extract raw value
            const size_t value_start = pos;
            scanValue(json, pos, 1);
            result[key] = json.substr(value_start, pos - value_start);

            skipWhitespace(json, pos);
            if (pos >= json.size()) {
                fail("unterminated object", pos);
            }
            if (json[pos] == ',') {
                pos++;
                continue;
            }
            if (json[pos] == '}') {
                pos++;
                break;
            }
            fail("expected ',' or '}'", pos);
        }
    }

    skipWhitespace(json, pos);
    if (pos != json.size()) {
        fail("trailing characters", pos);
    }
    return result;
}

std::map<std::string, std::string> JsonParser::parse(const std::string& json) {
    std::map<std::string, std::string> result = parseRaw(json);
    for (auto& pair : result) {
        if (isStringValue(pair.second)) {
            pair.second = decodeString(pair.second);
        }
    }
    return result;
}

bool JsonParser::isStringValue(const std::string& raw) {
    return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

bool JsonParser::isObjectValue(const std::string& raw) {
    return raw.size() >= 2 && raw.front() == '{' && raw.back() == '}';
}

std::string JsonParser::decodeString(const std::string& raw) {
    if (!isStringValue(raw)) {
        return raw;
    }
    return unescapeJson(raw.substr(1, raw.size() - 2));
}

std::string JsonParser::quote(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

std::string JsonParser::createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{\"success\":" << (success ? "true" : "false")
        << ",\"message\":\"" << escapeJson(message) << "\"";

    if (!data.empty()) {
        oss << ",\"data\":{";
        bool first = true;
        for (const auto& pair : data) {
            if (!first) oss << ",";
            first = false;
            oss << "\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
        }
        oss << "}";
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::createErrorResponse(const std::string& message) {
    return createResponse(false, message);
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\') {
            appendEscapedChar(str, i, result);
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

} // namespace parley
