#pragma once

#include "assets/IAssetFetcher.h"
#include "common/Diagnostics.h"
#include "emit/IEmitterRegistry.h"
#include "model/ExportOptions.h"
#include "model/PageDefinition.h"
#include "package/Archive.h"
#include <optional>
#include <string>

namespace PEX {

/**
 * @brief Spring Boot + Thymeleaf project export
 *
 * Produces a buildable Maven project: pom.xml, the Java sources serving each page
 * and the scaffolded API endpoints, configuration, one template and one page data
 * file per page, static assets, README.md and a Dockerfile.
 */
class ServerProjectExporter {
public:
    ServerProjectExporter(const ServerProjectOptions &options, const IAssetFetcher *fetcher,
                          const IEmitterRegistry *registry = nullptr);

    /**
     * @brief Thymeleaf template of one page, image URLs as authored
     */
    std::string renderTemplate(const PageDefinition &page, Diagnostics &diagnostics) const;

    /**
     * @brief The complete project
     * @return std::nullopt when any page violates the tree invariants or a generated file failed
     */
    std::optional<Archive> exportProject(const SiteDocument &site, Diagnostics &diagnostics) const;

private:
    ServerProjectOptions options_;
    const IAssetFetcher *fetcher_;
    const IEmitterRegistry *registry_;
};

}  // namespace PEX
