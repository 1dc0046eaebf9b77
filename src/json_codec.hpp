#ifndef JSON_CODEC_HPP
#define JSON_CODEC_HPP

#include <string>

#include <json/json.h>

namespace json {

/// Parse an API response body. Throws TransportError naming the context on
/// malformed input.
Json::Value parse(const std::string& text, const std::string& context);

/// Compact rendering. jsoncpp emits object members in sorted order, so equal
/// trees always render identically.
std::string write(const Json::Value& value);

/// Member lookup that throws TransportError when the member is missing or has
/// the wrong type
const Json::Value& member(const Json::Value& object, const char* name, Json::ValueType type,
                          const std::string& context);

} // namespace json

#endif // JSON_CODEC_HPP
