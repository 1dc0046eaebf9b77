#include "json_codec.hpp"
#include "sync_errors.hpp"

#include <memory>

namespace json {

Json::Value parse(const std::string& text, const std::string& context) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw TransportError(context + ": malformed JSON response (" + errors + ")");
    }
    return root;
}

std::string write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

const Json::Value& member(const Json::Value& object, const char* name, Json::ValueType type,
                          const std::string& context) {
    if (!object.isObject() || !object.isMember(name)) {
        throw TransportError(context + ": response has no '" + name + "' member");
    }
    const Json::Value& value = object[name];
    if (!value.isConvertibleTo(type) || (type == Json::objectValue && !value.isObject()) ||
        (type == Json::arrayValue && !value.isArray())) {
        throw TransportError(context + ": response member '" + name + "' has an unexpected type");
    }
    return value;
}

} // namespace json
