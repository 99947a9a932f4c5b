#include "export/StaticSiteExporter.h"
#include "assets/AssetCollector.h"
#include "common/Logger.h"
#include "emit/BaseAssets.h"
#include "emit/ComponentEmitter.h"
#include "emit/PageDocument.h"
#include "emit/TargetDialect.h"
#include "expression/ExpressionTranslator.h"
#include "model/ComponentTree.h"
#include <set>
#include <sstream>

namespace PEX {

namespace {

// <main> sits one level below <body>
constexpr int CONTENT_INDENT_LEVEL = 2;

}  // namespace

StaticSiteExporter::StaticSiteExporter(const ExportOptions &options, const IAssetFetcher *fetcher,
                                       const IEmitterRegistry *registry)
    : options_(options), fetcher_(fetcher), registry_(registry) {}

std::string StaticSiteExporter::renderPage(const PageDefinition &page, Diagnostics &diagnostics) const {
    return renderPage(page, options_, diagnostics);
}

std::string StaticSiteExporter::renderPage(const PageDefinition &page, const ExportOptions &options,
                                           Diagnostics &diagnostics) const {
    const TargetDialect dialect = TargetDialect::staticSite();
    const StaticScope scope = StaticScope::forPage(page);
    ComponentEmitter emitter(dialect, scope, diagnostics, registry_);

    const std::string content = emitter.emitRoots(page.components, CONTENT_INDENT_LEVEL);
    LOG_DEBUG("StaticSiteExporter: Rendered page '{}' ({} roots)", page.pageName, page.components.size());
    return PageDocument::renderStatic(page, content, options, scope, diagnostics);
}

std::optional<std::string> StaticSiteExporter::exportSinglePage(const PageDefinition &page,
                                                                Diagnostics &diagnostics) const {
    if (!ComponentTree::validatePages({&page}, diagnostics)) {
        LOG_ERROR("StaticSiteExporter: Export of '{}' aborted", page.pageName);
        return std::nullopt;
    }

    ExportOptions inlined = options_;
    inlined.includeCss = false;
    inlined.includeJs = false;
    inlined.singlePage = true;

    AssetCollector collector(fetcher_, diagnostics);
    const auto assets = collector.collect({&page});

    const std::string document =
        AssetCollector::rewriteUrls(renderPage(page, inlined, diagnostics), AssetCollector::dataUrlMapping(assets));
    LOG_INFO("StaticSiteExporter: Exported single page '{}' ({} bytes)", page.pageName, document.size());
    return document;
}

std::vector<std::string> StaticSiteExporter::pageFileNames(const std::vector<PageEntry> &pages) {
    const std::string extension = TargetDialect::staticSite().documentExtension();

    std::vector<std::string> names;
    std::set<std::string> used;
    bool homeAssigned = false;

    for (const auto &page : pages) {
        std::string stem;
        if (page.isHome() && !homeAssigned) {
            stem = "index";
            homeAssigned = true;
        } else {
            stem = page.effectiveSlug();
            if (stem.empty()) {
                stem = "page";
            }
        }

        std::string name = stem + extension;
        for (int suffix = 2; used.count(name) > 0; ++suffix) {
            name = stem + "-" + std::to_string(suffix) + extension;
        }
        used.insert(name);
        names.push_back(name);
    }
    return names;
}

std::string StaticSiteExporter::readme(const SiteDocument &site, const std::vector<std::string> &fileNames,
                                       const ExportOptions &options, size_t imageCount) {
    std::ostringstream out;
    out << "# " << (site.siteName.empty() ? "My Site" : site.siteName) << "\n"
        << "\n"
        << "Static site exported by pexport.\n"
        << "\n"
        << "## Files\n"
        << "\n";
    for (size_t i = 0; i < fileNames.size() && i < site.pages.size(); ++i) {
        out << "- " << fileNames[i] << " - " << site.pages[i].pageName << "\n";
    }
    if (options.includeCss) {
        out << "- css/styles.css - shared styles\n";
    }
    if (options.includeJs) {
        out << "- js/main.js - navigation and interaction script\n";
    }

    if (imageCount > 0) {
        out << "\n"
            << "## Images\n"
            << "\n"
            << imageCount << " image(s) included in the images/ folder.\n";
    }

    out << "\n"
        << "## Deployment\n"
        << "\n"
        << "Upload all files to any web server or static hosting service, keeping the folder layout.\n"
        << "index.html is the entry page.\n"
        << "\n"
        << "1. **Netlify Drop**: drag and drop this folder to netlify.com/drop\n"
        << "2. **GitHub Pages**: push to a repository and enable Pages\n"
        << "3. **Any web server**: copy the files to the document root\n";
    return out.str();
}

std::optional<Archive> StaticSiteExporter::exportSite(const SiteDocument &site, Diagnostics &diagnostics) const {
    std::vector<const PageDefinition *> definitions;
    definitions.reserve(site.pages.size());
    for (const auto &page : site.pages) {
        definitions.push_back(&page.definition);
    }

    if (!ComponentTree::validatePages(definitions, diagnostics)) {
        LOG_ERROR("StaticSiteExporter: Export of site '{}' aborted", site.siteName);
        return std::nullopt;
    }

    LOG_INFO("StaticSiteExporter: Exporting site '{}' with {} pages", site.siteName, site.pages.size());

    AssetCollector collector(fetcher_, diagnostics);
    const auto assets = collector.collect(definitions);
    const auto mapping = AssetCollector::localMapping(assets, "images/");

    const auto fileNames = pageFileNames(site.pages);
    Archive archive;
    bool complete = true;

    for (size_t i = 0; i < site.pages.size(); ++i) {
        const std::string document = AssetCollector::rewriteUrls(renderPage(site.pages[i].definition, diagnostics),
                                                                 mapping);
        complete &= archive.add(fileNames[i], document);
    }

    if (options_.includeCss) {
        complete &= archive.add("css/styles.css", BaseAssets::stylesheet(ExportTarget::StaticSite));
    }
    if (options_.includeJs) {
        complete &= archive.add("js/main.js", BaseAssets::script(ExportTarget::StaticSite));
    }

    size_t imageCount = 0;
    for (const auto &asset : assets) {
        if (asset.fetched) {
            complete &= archive.add("images/" + asset.fileName, asset.data);
            ++imageCount;
        }
    }

    complete &= archive.add("README.md", readme(site, fileNames, options_, imageCount));

    if (!complete) {
        LOG_ERROR("StaticSiteExporter: Archive for '{}' is incomplete", site.siteName);
        return std::nullopt;
    }

    LOG_INFO("StaticSiteExporter: Site '{}' exported, {} files, {} images", site.siteName, archive.size(),
             imageCount);
    return archive;
}

}  // namespace PEX
