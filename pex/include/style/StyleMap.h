#pragma once

#include "model/ComponentInstance.h"
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace PEX {

/**
 * @brief Insertion-ordered CSS declaration list
 *
 * set() on an existing property replaces its value in place, so the position of a
 * property is fixed by the layer that introduced it first and its value by the
 * layer that wrote it last.
 */
class StyleMap {
public:
    using Entry = std::pair<std::string, std::string>;

    StyleMap() = default;
    StyleMap(std::initializer_list<Entry> entries);

    void set(const std::string &property, const std::string &value);

    /**
     * @brief set() only when @p value is non-empty
     */
    void setIfPresent(const std::string &property, const std::string &value);

    bool erase(const std::string &property);
    bool has(const std::string &property) const;
    std::optional<std::string> get(const std::string &property) const;
    std::string getOr(const std::string &property, const std::string &defaultValue) const;

    /**
     * @brief Overlay every entry of @p other
     */
    void merge(const StyleMap &other);

    /**
     * @brief Overlay authored declarations, skipping @p excluded properties
     */
    void merge(const StyleDeclarations &declarations, const std::set<std::string> &excluded = {});

    const std::vector<Entry> &entries() const {
        return entries_;
    }

    bool empty() const {
        return entries_.empty();
    }

    size_t size() const {
        return entries_.size();
    }

    /**
     * @brief Serialize as "kebab-name: value; ..." for a style attribute, empty values skipped
     */
    std::string toInlineCss() const;

    /**
     * @brief " style=\"...\"" or an empty string when nothing would be emitted
     */
    std::string toStyleAttribute() const;

private:
    std::vector<Entry> entries_;
};

}  // namespace PEX
