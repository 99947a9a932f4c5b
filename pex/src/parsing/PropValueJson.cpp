#include "parsing/PropValueJson.h"
#include <cmath>
#include <cstdint>

namespace PEX {

PropValue PropValueJson::fromJson(const Json::Value &value) {
    switch (value.type()) {
    case Json::nullValue:
        return PropValue();
    case Json::booleanValue:
        return PropValue(value.asBool());
    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:
        return PropValue(value.asDouble());
    case Json::stringValue:
        return PropValue(value.asString());
    case Json::arrayValue: {
        PropList items;
        items.reserve(value.size());
        for (const auto &item : value) {
            items.push_back(fromJson(item));
        }
        return PropValue(std::move(items));
    }
    case Json::objectValue: {
        PropMap entries;
        for (const auto &key : value.getMemberNames()) {
            entries.emplace(key, fromJson(value[key]));
        }
        return PropValue(std::move(entries));
    }
    }
    return PropValue();
}

Json::Value PropValueJson::toJson(const PropValue &value) {
    if (value.isBool()) {
        return Json::Value(value.asBool());
    }
    if (value.isNumber()) {
        double number = value.asNumber();
        if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < 9e15) {
            return Json::Value(static_cast<Json::Int64>(number));
        }
        return Json::Value(number);
    }
    if (value.isString()) {
        return Json::Value(value.asString());
    }
    if (value.isList()) {
        Json::Value array(Json::arrayValue);
        for (const auto &item : value.list()) {
            array.append(toJson(item));
        }
        return array;
    }
    if (value.isMap()) {
        return toJson(value.map());
    }
    return Json::Value(Json::nullValue);
}

Json::Value PropValueJson::toJson(const PropMap &map) {
    Json::Value object(Json::objectValue);
    for (const auto &[key, entry] : map) {
        object[key] = toJson(entry);
    }
    return object;
}

}  // namespace PEX
