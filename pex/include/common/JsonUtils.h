#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Shared jsoncpp helpers for page documents, configuration and generated data files
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into Json::Value with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed Json::Value or nullopt on failure
     */
    static std::optional<Json::Value> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Serialize Json::Value with two-space indentation
     */
    static std::string toPrettyString(const Json::Value &value);

    /**
     * @brief Safely get string value from JSON object
     * @param object JSON object
     * @param key Key to lookup
     * @param defaultValue Default value if key doesn't exist or is not a string
     * @return String value or default
     */
    static std::string getString(const Json::Value &object, const std::string &key,
                                 const std::string &defaultValue = "");

    static int getInt(const Json::Value &object, const std::string &key, int defaultValue = 0);

    /**
     * @brief Return the first key of @p keys that holds a string
     * @return String value of the first present key, or @p defaultValue
     */
    static std::string getFirstString(const Json::Value &object, const std::vector<std::string> &keys,
                                      const std::string &defaultValue = "");

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const Json::Value &object, const std::string &key);

private:
    static Json::StreamWriterBuilder createPrettyWriterBuilder();
};

}  // namespace PEX
