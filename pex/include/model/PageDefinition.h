#pragma once

#include "model/ComponentInstance.h"
#include <map>
#include <string>
#include <vector>

namespace PEX {

struct GlobalStyles {
    std::string customCss;
    std::map<std::string, std::string> cssVariables;
};

/**
 * @brief One authored page: ordered root components plus page-level data
 */
struct PageDefinition {
    std::string pageName;
    std::vector<ComponentInstance> components;
    GlobalStyles globalStyles;
    std::map<std::string, PropValue> dataContext;

    /**
     * @brief Named data available to the page at render time
     *
     * dataContext entries (the nested "dataSources" map is flattened, a source object
     * with staticData contributes that data) followed by repeater_<instanceId> for
     * every component with a static data source.
     */
    PropMap collectDataSources() const;
};

/**
 * @brief A page as part of a multi-page export
 */
struct PageEntry {
    std::string pageName;
    std::string routePath = "/";
    std::string slug;
    PageDefinition definition;

    /**
     * @brief Root route, or one of the conventional home aliases
     */
    bool isHome() const;

    /**
     * @brief Explicit slug, else the last route segment, else the slugified page name
     */
    std::string effectiveSlug() const;
};

struct SiteDocument {
    std::string siteName;
    std::vector<PageEntry> pages;
};

}  // namespace PEX
