#pragma once

#include "model/ApiEndpointConfig.h"
#include "model/ExportOptions.h"
#include "model/PageDefinition.h"
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief How one page is served by the generated PageController
 */
struct PageRoute {
    std::string pageName;
    std::string routePath;     // request mapping, always starting with '/'
    std::string templateName;  // templates/<name>.html and pages/<name>.json
    std::string methodName;    // unique Java method name
    bool isHome = false;       // mapped to both "/" and "/home"
};

/**
 * @brief Sample payload shape served for an API endpoint until real data is wired in
 */
enum class SampleKind { Products, Team, Posts, Testimonials, Services, Generic };

/**
 * @brief Naming and planning decisions of the generated server project
 *
 * Everything here is a pure function of the pages and options; the Java text
 * itself is written by JavaSourceWriter.
 */
class BackendScaffold {
public:
    /**
     * @brief Controller and method names for an API endpoint
     *
     * "/api/sample/products" -> SampleController.getProducts; fewer than two path
     * segments -> DataController.getData. Names are Java identifiers: characters
     * other than letters and digits split words, a file extension on the last
     * segment and {variable} segments are ignored. The route drops any query or
     * fragment.
     */
    static ApiEndpointConfig deriveEndpoint(const std::string &endpoint, const std::string &dataPath);

    /**
     * @brief Distinct API data source endpoints of every page, first-seen order, with unique method names
     *
     * Endpoints are distinct by route path, so "/api/products?page=2" adds nothing after "/api/products".
     */
    static std::vector<ApiEndpointConfig> collectEndpoints(const std::vector<PageEntry> &pages);

    static SampleKind sampleKindFor(const std::string &methodName);
    static const char *sampleKindName(SampleKind kind);

    /**
     * @brief Routes, template and method names for @p pages, de-duplicated in page order
     */
    static std::vector<PageRoute> planRoutes(const std::vector<PageEntry> &pages);

    /**
     * @brief src/main/java/<group path>/<artifact identifier>
     */
    static std::string javaSourceRoot(const ServerProjectOptions &options);

    static std::string applicationProperties(const ServerProjectOptions &options);

    /**
     * @brief pages/<template>.json read by PageDataService at request time
     */
    static std::string pageDataJson(const PageEntry &page, const PageRoute &route);

    static std::string readme(const ServerProjectOptions &options, const std::vector<PageRoute> &routes,
                              const std::vector<ApiEndpointConfig> &endpoints);

    static std::string dockerfile(const ServerProjectOptions &options);
};

}  // namespace PEX
