#pragma once

#include "model/PageDefinition.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Reads page builder JSON into the export model
 *
 * Accepts a site document ({siteName, pages: [{pageName, routePath, slug, definition}]})
 * or a single page definition, which becomes a one-page site served at "/".
 * Malformed pieces inside an otherwise readable document are skipped and reported
 * as warnings; only an unreadable document fails.
 */
class PageDefinitionParser {
public:
    PageDefinitionParser() = default;

    /**
     * @brief Parse a JSON file
     * @param filename Path of the document
     * @return Parsed site, nullopt on failure
     */
    std::optional<SiteDocument> parseFile(const std::string &filename);

    /**
     * @brief Parse a JSON string
     * @param content Document text
     * @return Parsed site, nullopt on failure
     */
    std::optional<SiteDocument> parseContent(const std::string &content);

    /**
     * @brief Parse a single page definition object
     */
    PageDefinition parsePageDefinition(const Json::Value &node);

    /**
     * @brief Parse one component and its subtree
     * @return nullopt when the component lacks an instanceId or componentId
     */
    std::optional<ComponentInstance> parseComponent(const Json::Value &node);

    bool hasErrors() const {
        return !errorMessages_.empty();
    }

    const std::vector<std::string> &getErrorMessages() const {
        return errorMessages_;
    }

    const std::vector<std::string> &getWarningMessages() const {
        return warningMessages_;
    }

private:
    std::optional<SiteDocument> parseDocument(const Json::Value &root);
    std::optional<PageEntry> parsePageEntry(const Json::Value &node, size_t index);
    StyleDeclarations parseStyles(const Json::Value &node, const std::string &instanceId);
    std::vector<EventBinding> parseEvents(const Json::Value &node);
    std::optional<DataSourceConfig> parseDataSource(const Json::Value &node, const std::string &instanceId);

    void addError(const std::string &message);
    void addWarning(const std::string &message);

    std::vector<std::string> errorMessages_;
    std::vector<std::string> warningMessages_;
};

}  // namespace PEX
