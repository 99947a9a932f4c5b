#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace PEX {

class PropValue;

using PropList = std::vector<PropValue>;
using PropMap = std::map<std::string, PropValue>;

/**
 * @brief Loosely typed component property value
 *
 * Mirrors the JSON shapes the page builder stores: null, boolean, number, string,
 * list and map. Lists and maps are shared and immutable once built. Accessors never
 * throw; a value of the wrong shape reads as the empty default.
 */
class PropValue {
public:
    using Storage = std::variant<std::monostate,           // null
                                 bool,                     // boolean
                                 double,                   // number
                                 std::string,              // string
                                 std::shared_ptr<PropList>,  // list
                                 std::shared_ptr<PropMap>    // map
                                 >;

    PropValue() = default;
    PropValue(bool value) : storage_(value) {}
    PropValue(int value) : storage_(static_cast<double>(value)) {}
    PropValue(double value) : storage_(value) {}
    PropValue(const char *value) : storage_(std::string(value)) {}
    PropValue(std::string value) : storage_(std::move(value)) {}
    PropValue(PropList value);
    PropValue(PropMap value);

    bool isNull() const {
        return std::holds_alternative<std::monostate>(storage_);
    }
    bool isBool() const {
        return std::holds_alternative<bool>(storage_);
    }
    bool isNumber() const {
        return std::holds_alternative<double>(storage_);
    }
    bool isString() const {
        return std::holds_alternative<std::string>(storage_);
    }
    bool isList() const {
        return std::holds_alternative<std::shared_ptr<PropList>>(storage_);
    }
    bool isMap() const {
        return std::holds_alternative<std::shared_ptr<PropMap>>(storage_);
    }

    /**
     * @brief Scalar as text: strings as-is, integral numbers without a fraction, booleans as true/false
     * @return Empty string for null, lists and maps
     */
    std::string asString() const;

    /**
     * @brief Truthiness the way the editor evaluates props (non-empty string, non-zero number, true)
     */
    bool asBool() const;

    double asNumber(double defaultValue = 0.0) const;

    /**
     * @brief Elements of a list value, or an empty list
     */
    const PropList &list() const;

    /**
     * @brief Entries of a map value, or an empty map
     */
    const PropMap &map() const;

    /**
     * @brief Look up @p key in a map value
     * @return Pointer to the entry, nullptr when absent or not a map
     */
    const PropValue *find(const std::string &key) const;

    /**
     * @brief Follow a dotted path (a.b.c) through nested maps, with numeric segments indexing lists
     * @return Pointer to the value, nullptr when any segment is missing
     */
    const PropValue *findPath(const std::string &dottedPath) const;

    bool operator==(const PropValue &other) const;
    bool operator!=(const PropValue &other) const {
        return !(*this == other);
    }

private:
    Storage storage_;
};

/**
 * @brief Props lookup helpers used by the emitters and resolvers
 */
namespace Props {

/**
 * @brief Value of @p key as text, or @p defaultValue when the key is missing, null or empty
 */
std::string getString(const PropMap &props, const std::string &key, const std::string &defaultValue = "");

/**
 * @brief First non-empty string among @p keys
 */
std::string getFirstString(const PropMap &props, const std::vector<std::string> &keys,
                           const std::string &defaultValue = "");

bool getBool(const PropMap &props, const std::string &key, bool defaultValue = false);

bool has(const PropMap &props, const std::string &key);

const PropValue *find(const PropMap &props, const std::string &key);

}  // namespace Props

}  // namespace PEX
