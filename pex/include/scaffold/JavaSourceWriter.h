#pragma once

#include "model/ApiEndpointConfig.h"
#include "model/ExportOptions.h"
#include "scaffold/BackendScaffold.h"
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Java sources of the generated Spring Boot project
 *
 * Every generated class lives under ServerProjectOptions::javaPackage(). Logging
 * goes through SLF4J; Lombok's @Slf4j is used only by the classes that exist when
 * API endpoints were found, since only then is Lombok on the build path.
 */
class JavaSourceWriter {
public:
    explicit JavaSourceWriter(const ServerProjectOptions &options);

    std::string application() const;

    /**
     * @brief One GET handler per page; the home page answers "/" and "/home"
     */
    std::string pageController(const std::vector<PageRoute> &routes) const;

    std::string pageDataService() const;
    std::string imageUrlResolver() const;
    std::string imageProxyController() const;

    /**
     * @brief REST handlers returning { <dataPath>: [...], "total": n } sample payloads
     */
    std::string apiDataController(const std::vector<ApiEndpointConfig> &endpoints) const;

    std::string dataService() const;

private:
    static std::string sampleRows(SampleKind kind);

    std::string package_;
};

}  // namespace PEX
