#pragma once

#include "model/PropValue.h"
#include <json/json.h>

namespace PEX {

/**
 * @brief Conversion between jsoncpp values and PropValue
 */
class PropValueJson {
public:
    static PropValue fromJson(const Json::Value &value);
    static Json::Value toJson(const PropValue &value);
    static Json::Value toJson(const PropMap &map);
};

}  // namespace PEX
