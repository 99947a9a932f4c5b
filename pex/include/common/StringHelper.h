#pragma once

#include <string>
#include <vector>

namespace PEX {

/**
 * @brief String utilities used across style resolution, markup emission and scaffold naming
 */
class StringHelper {
public:
    static std::string trim(const std::string &text);
    static std::string toLower(const std::string &text);
    static bool startsWith(const std::string &text, const std::string &prefix);
    static bool contains(const std::string &text, const std::string &needle);
    static std::vector<std::string> split(const std::string &text, char delimiter);
    static std::string replaceAll(std::string text, const std::string &from, const std::string &to);

    /**
     * @brief Remove all whitespace, used to compare CSS values regardless of spacing
     */
    static std::string stripWhitespace(const std::string &text);

    /**
     * @brief Escape & < > " ' for HTML text and attribute values
     */
    static std::string escapeHtml(const std::string &text);

    /**
     * @brief Escape backslash and single quote for a single-quoted script or expression literal
     */
    static std::string escapeSingleQuoted(const std::string &text);

    /**
     * @brief Escape a value for a Java string literal
     */
    static std::string escapeJavaString(const std::string &text);

    /**
     * @brief camelCase CSS property name to kebab-case (backgroundColor -> background-color)
     */
    static std::string toKebabCase(const std::string &camelCase);

    /**
     * @brief Split on '-' and '_' and capitalize each part (user-profiles -> UserProfiles)
     */
    static std::string toPascalCase(const std::string &text);

    /**
     * @brief Lower-case and drop every non-alphanumeric character (About Us -> aboutus)
     */
    static std::string toIdentifier(const std::string &text);

    /**
     * @brief Lower-case and replace every non-alphanumeric character with '-' (About Us -> about-us)
     */
    static std::string toHyphenated(const std::string &text);

    /**
     * @brief Lower-case, collapse whitespace runs to '-' and drop characters unsafe in file names
     */
    static std::string toSlug(const std::string &text);

    static std::string base64Encode(const std::string &bytes);
};

}  // namespace PEX
