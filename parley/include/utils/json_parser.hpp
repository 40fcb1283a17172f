#ifndef PARLEY_JSON_PARSER_HPP
#define PARLEY_JSON_PARSER_HPP

#include <string>
#include <map>

namespace parley {

class JsonParser {
public:
    // Top-level members of a JSON object. String members are unescaped;
    // numbers, literals, nested objects and arrays are kept as raw JSON text.
    // Throws std::invalid_argument if the input is not a well-formed object.
    static std::map<std::string, std::string> parse(const std::string& json);

    // Same as parse() but every member keeps its raw JSON text, quotes included.
    static std::map<std::string, std::string> parseRaw(const std::string& json);

    static bool isStringValue(const std::string& raw);
    static bool isObjectValue(const std::string& raw);
    static std::string decodeString(const std::string& raw);

    static std::string quote(const std::string& str);
    static std::string createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data = {});
    static std::string createErrorResponse(const std::string& message);
    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
};

} // namespace parley

#endif // PARLEY_JSON_PARSER_HPP
