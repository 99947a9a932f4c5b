#include "style/StyleMap.h"
#include "common/StringHelper.h"
#include <algorithm>

namespace PEX {

StyleMap::StyleMap(std::initializer_list<Entry> entries) {
    for (const auto &[property, value] : entries) {
        set(property, value);
    }
}

void StyleMap::set(const std::string &property, const std::string &value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&property](const Entry &entry) { return entry.first == property; });
    if (it != entries_.end()) {
        it->second = value;
    } else {
        entries_.emplace_back(property, value);
    }
}

void StyleMap::setIfPresent(const std::string &property, const std::string &value) {
    if (!value.empty()) {
        set(property, value);
    }
}

bool StyleMap::erase(const std::string &property) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&property](const Entry &entry) { return entry.first == property; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool StyleMap::has(const std::string &property) const {
    return get(property).has_value();
}

std::optional<std::string> StyleMap::get(const std::string &property) const {
    for (const auto &[name, value] : entries_) {
        if (name == property) {
            return value;
        }
    }
    return std::nullopt;
}

std::string StyleMap::getOr(const std::string &property, const std::string &defaultValue) const {
    auto value = get(property);
    return value && !value->empty() ? *value : defaultValue;
}

void StyleMap::merge(const StyleMap &other) {
    for (const auto &[property, value] : other.entries_) {
        set(property, value);
    }
}

void StyleMap::merge(const StyleDeclarations &declarations, const std::set<std::string> &excluded) {
    for (const auto &[property, value] : declarations) {
        if (excluded.count(property) == 0) {
            set(property, value);
        }
    }
}

std::string StyleMap::toInlineCss() const {
    std::string css;
    for (const auto &[property, value] : entries_) {
        if (value.empty()) {
            continue;
        }
        if (!css.empty()) {
            css += "; ";
        }
        css += StringHelper::toKebabCase(property) + ": " + value;
    }
    return css;
}

std::string StyleMap::toStyleAttribute() const {
    std::string css = toInlineCss();
    if (css.empty()) {
        return "";
    }
    return " style=\"" + StringHelper::replaceAll(css, "\"", "&quot;") + "\"";
}

}  // namespace PEX
