#pragma once

#include "assets/IAssetFetcher.h"
#include "common/Diagnostics.h"
#include "emit/IEmitterRegistry.h"
#include "model/ExportOptions.h"
#include "model/PageDefinition.h"
#include "package/Archive.h"
#include <optional>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Static HTML/CSS/JS export
 *
 * Pages are rendered without the network; images are downloaded once for the
 * whole site and relinked afterwards. {{path}} tokens are resolved from the page's
 * data sources where possible, anything else is reported and kept as written.
 */
class StaticSiteExporter {
public:
    /**
     * @param options Site options
     * @param fetcher Image downloader, nullptr to keep every image URL as authored
     * @param registry Optional plugin emitters
     */
    StaticSiteExporter(const ExportOptions &options, const IAssetFetcher *fetcher,
                       const IEmitterRegistry *registry = nullptr);

    /**
     * @brief One complete HTML document, image URLs as authored
     */
    std::string renderPage(const PageDefinition &page, Diagnostics &diagnostics) const;

    /**
     * @brief Self-contained document: base CSS and JS inlined, images embedded as data URLs
     * @return std::nullopt when the page violates the tree invariants
     */
    std::optional<std::string> exportSinglePage(const PageDefinition &page, Diagnostics &diagnostics) const;

    /**
     * @brief Every page plus shared assets, images and a README
     * @return std::nullopt when any page violates the tree invariants
     */
    std::optional<Archive> exportSite(const SiteDocument &site, Diagnostics &diagnostics) const;

    /**
     * @brief Archive file name of each page, in page order
     *
     * The first home page is index.html, every other page <slug>.html; clashing
     * names get a numeric suffix.
     */
    static std::vector<std::string> pageFileNames(const std::vector<PageEntry> &pages);

private:
    std::string renderPage(const PageDefinition &page, const ExportOptions &options, Diagnostics &diagnostics) const;
    static std::string readme(const SiteDocument &site, const std::vector<std::string> &fileNames,
                              const ExportOptions &options, size_t imageCount);

    ExportOptions options_;
    const IAssetFetcher *fetcher_;
    const IEmitterRegistry *registry_;
};

}  // namespace PEX
