#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <sstream>

namespace PEX {

std::optional<Json::Value> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder;
    readerBuilder["collectComments"] = false;
    std::string parseErrors;
    std::istringstream jsonStream(jsonString);

    if (!Json::parseFromStream(readerBuilder, jsonStream, &root, &parseErrors)) {
        if (errorOut) {
            *errorOut = parseErrors;
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", parseErrors);
        return std::nullopt;
    }

    return root;
}

std::string JsonUtils::toPrettyString(const Json::Value &value) {
    Json::StreamWriterBuilder writerBuilder = createPrettyWriterBuilder();
    return Json::writeString(writerBuilder, value);
}

std::string JsonUtils::getString(const Json::Value &object, const std::string &key, const std::string &defaultValue) {
    if (!object.isObject() || !object.isMember(key)) {
        return defaultValue;
    }

    const Json::Value &value = object[key];
    if (!value.isString()) {
        return defaultValue;
    }

    return value.asString();
}

int JsonUtils::getInt(const Json::Value &object, const std::string &key, int defaultValue) {
    if (!object.isObject() || !object.isMember(key)) {
        return defaultValue;
    }

    const Json::Value &value = object[key];
    if (!value.isInt()) {
        return defaultValue;
    }

    return value.asInt();
}

std::string JsonUtils::getFirstString(const Json::Value &object, const std::vector<std::string> &keys,
                                      const std::string &defaultValue) {
    for (const auto &key : keys) {
        if (object.isObject() && object.isMember(key) && object[key].isString()) {
            return object[key].asString();
        }
    }
    return defaultValue;
}

bool JsonUtils::hasKey(const Json::Value &object, const std::string &key) {
    return object.isObject() && object.isMember(key) && !object[key].isNull();
}

Json::StreamWriterBuilder JsonUtils::createPrettyWriterBuilder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return builder;
}

}  // namespace PEX
