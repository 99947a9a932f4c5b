#include "model/PropValue.h"
#include "common/StringHelper.h"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>

namespace PEX {

namespace {

const PropList &emptyList() {
    static const PropList empty;
    return empty;
}

const PropMap &emptyMap() {
    static const PropMap empty;
    return empty;
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<int64_t>(value));
    }
    return fmt::format("{}", value);
}

}  // namespace

PropValue::PropValue(PropList value) : storage_(std::make_shared<PropList>(std::move(value))) {}

PropValue::PropValue(PropMap value) : storage_(std::make_shared<PropMap>(std::move(value))) {}

std::string PropValue::asString() const {
    if (const auto *text = std::get_if<std::string>(&storage_)) {
        return *text;
    }
    if (const auto *number = std::get_if<double>(&storage_)) {
        return formatNumber(*number);
    }
    if (const auto *flag = std::get_if<bool>(&storage_)) {
        return *flag ? "true" : "false";
    }
    return "";
}

bool PropValue::asBool() const {
    if (const auto *flag = std::get_if<bool>(&storage_)) {
        return *flag;
    }
    if (const auto *number = std::get_if<double>(&storage_)) {
        return *number != 0.0 && !std::isnan(*number);
    }
    if (const auto *text = std::get_if<std::string>(&storage_)) {
        return !text->empty();
    }
    return isList() || isMap();
}

double PropValue::asNumber(double defaultValue) const {
    if (const auto *number = std::get_if<double>(&storage_)) {
        return *number;
    }
    if (const auto *text = std::get_if<std::string>(&storage_)) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(*text, &consumed);
            if (consumed == text->size()) {
                return parsed;
            }
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
    return defaultValue;
}

const PropList &PropValue::list() const {
    if (const auto *items = std::get_if<std::shared_ptr<PropList>>(&storage_)) {
        return *items ? **items : emptyList();
    }
    return emptyList();
}

const PropMap &PropValue::map() const {
    if (const auto *entries = std::get_if<std::shared_ptr<PropMap>>(&storage_)) {
        return *entries ? **entries : emptyMap();
    }
    return emptyMap();
}

const PropValue *PropValue::find(const std::string &key) const {
    const PropMap &entries = map();
    auto it = entries.find(key);
    return it == entries.end() ? nullptr : &it->second;
}

const PropValue *PropValue::findPath(const std::string &dottedPath) const {
    const PropValue *current = this;
    for (const auto &segment : StringHelper::split(dottedPath, '.')) {
        if (!current || segment.empty()) {
            return nullptr;
        }
        if (current->isList()) {
            const PropList &items = current->list();
            char *end = nullptr;
            unsigned long index = std::strtoul(segment.c_str(), &end, 10);
            if (end == segment.c_str() || *end != '\0' || index >= items.size()) {
                return nullptr;
            }
            current = &items[index];
        } else {
            current = current->find(segment);
        }
    }
    return current;
}

bool PropValue::operator==(const PropValue &other) const {
    if (storage_.index() != other.storage_.index()) {
        return false;
    }
    if (isList()) {
        return list() == other.list();
    }
    if (isMap()) {
        return map() == other.map();
    }
    return storage_ == other.storage_;
}

namespace Props {

const PropValue *find(const PropMap &props, const std::string &key) {
    auto it = props.find(key);
    return it == props.end() ? nullptr : &it->second;
}

bool has(const PropMap &props, const std::string &key) {
    const PropValue *value = find(props, key);
    return value && !value->isNull();
}

std::string getString(const PropMap &props, const std::string &key, const std::string &defaultValue) {
    const PropValue *value = find(props, key);
    if (!value) {
        return defaultValue;
    }
    std::string text = value->asString();
    return text.empty() ? defaultValue : text;
}

std::string getFirstString(const PropMap &props, const std::vector<std::string> &keys,
                           const std::string &defaultValue) {
    for (const auto &key : keys) {
        std::string text = getString(props, key);
        if (!text.empty()) {
            return text;
        }
    }
    return defaultValue;
}

bool getBool(const PropMap &props, const std::string &key, bool defaultValue) {
    const PropValue *value = find(props, key);
    if (!value || value->isNull()) {
        return defaultValue;
    }
    return value->asBool();
}

}  // namespace Props

}  // namespace PEX
