#include "record_codec.h"
#include "common/errors.h"

#include <cmath>
#include <memory>
#include <glog/logging.h>
#include <json/json.h>

namespace Recpool {

namespace {

// JSON number text for a finite double; integral values keep a ".0" so that
// the field still reads as floating point.
std::string JsonNumber(double value) {
    std::string text = FormatValue(value);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

// Quoted, escaped JSON string. Control characters are escaped, everything
// else (including non-ASCII UTF-8) is written as is.
std::string JsonString(const std::string& text) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, Json::Value(text));
}

const Json::Value& RequireField(const Json::Value& root, const char* key) {
    if (!root.isMember(key)) {
        throw SerializationError(std::string("missing field `") + key + "`");
    }
    return root[key];
}

uint64_t ReadId(const Json::Value& root) {
    const Json::Value& field = RequireField(root, "id");
    if (field.type() == Json::uintValue ||
        (field.type() == Json::intValue && field.asInt64() >= 0)) {
        return field.asUInt64();
    }
    throw SerializationError("invalid type for field `id`: expected an unsigned integer");
}

double ReadValue(const Json::Value& root) {
    const Json::Value& field = RequireField(root, "value");
    if (!field.isNumeric()) {
        throw SerializationError("invalid type for field `value`: expected a number");
    }
    double value = field.asDouble();
    if (!std::isfinite(value)) {
        throw SerializationError("field `value` is not a finite number");
    }
    return value;
}

std::string ReadTimestamp(const Json::Value& root) {
    const Json::Value& field = RequireField(root, "timestamp");
    if (!field.isString()) {
        throw SerializationError("invalid type for field `timestamp`: expected a string");
    }
    return field.asString();
}

} // namespace

std::string ToJson(const Record& record) {
    if (!std::isfinite(record.value)) {
        throw InvalidValue("non-finite value " + FormatValue(record.value));
    }

    std::string json;
    json.reserve(48 + record.timestamp.size());
    json += "{\"id\":";
    json += std::to_string(record.id);
    json += ",\"value\":";
    json += JsonNumber(record.value);
    json += ",\"timestamp\":";
    json += JsonString(record.timestamp);
    json += "}";
    return json;
}

Record FromJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        VLOG(1) << "FromJson: parse failed: " << errors;
        throw SerializationError(errors.empty() ? "invalid JSON" : errors);
    }

    if (!root.isObject()) {
        throw SerializationError("expected a JSON object");
    }

    Record record;
    record.id = ReadId(root);
    record.value = ReadValue(root);
    record.timestamp = ReadTimestamp(root);
    return record;
}

} // namespace Recpool
