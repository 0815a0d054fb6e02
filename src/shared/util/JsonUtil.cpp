#include "taskcore/shared/util/JsonUtil.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <memory>

namespace taskcore::shared::util {

namespace {

[[noreturn]] void invalidPayload(const std::string& message) {
    throw exception::DomainException("INVALID_PAYLOAD", message);
}

bool present(const Json::Value& json, const char* key) {
    return json.isObject() && json.isMember(key) && !json[key].isNull();
}

} // namespace

std::string requireString(const Json::Value& json, const char* key) {
    if (!present(json, key) || !json[key].isString()) {
        invalidPayload(std::string("Missing string field: ") + key);
    }
    return json[key].asString();
}

int requireInt(const Json::Value& json, const char* key) {
    if (!present(json, key) || !json[key].isInt()) {
        invalidPayload(std::string("Missing integer field: ") + key);
    }
    return json[key].asInt();
}

std::optional<std::string> optionalString(const Json::Value& json, const char* key) {
    if (!present(json, key)) {
        return std::nullopt;
    }
    return json[key].asString();
}

std::optional<double> optionalDouble(const Json::Value& json, const char* key) {
    if (!present(json, key)) {
        return std::nullopt;
    }
    if (!json[key].isNumeric()) {
        invalidPayload(std::string("Field is not numeric: ") + key);
    }
    return json[key].asDouble();
}

std::optional<int> optionalInt(const Json::Value& json, const char* key) {
    if (!present(json, key)) {
        return std::nullopt;
    }
    if (!json[key].isInt()) {
        invalidPayload(std::string("Field is not an integer: ") + key);
    }
    return json[key].asInt();
}

std::optional<TimePoint> optionalTime(const Json::Value& json, const char* key) {
    if (!present(json, key)) {
        return std::nullopt;
    }
    auto parsed = parseIso8601(json[key].asString());
    if (!parsed) {
        invalidPayload(std::string("Malformed timestamp in field: ") + key);
    }
    return parsed;
}

TimePoint requireTime(const Json::Value& json, const char* key) {
    auto value = optionalTime(json, key);
    if (!value) {
        invalidPayload(std::string("Missing timestamp field: ") + key);
    }
    return *value;
}

std::string toCompactString(const Json::Value& json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, json);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        invalidPayload("Malformed JSON: " + errors);
    }
    return root;
}

} // namespace taskcore::shared::util
