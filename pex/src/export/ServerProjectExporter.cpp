#include "export/ServerProjectExporter.h"
#include "assets/AssetCollector.h"
#include "common/Logger.h"
#include "emit/BaseAssets.h"
#include "emit/ComponentEmitter.h"
#include "emit/PageDocument.h"
#include "emit/TargetDialect.h"
#include "expression/ExpressionTranslator.h"
#include "model/ComponentTree.h"
#include "scaffold/BackendScaffold.h"
#include "scaffold/BuildDescriptorWriter.h"
#include "scaffold/JavaSourceWriter.h"

namespace PEX {

namespace {

constexpr int CONTENT_INDENT_LEVEL = 2;

const std::string RESOURCES_DIR = "src/main/resources/";
const std::string PLACEHOLDER_IMAGE = "placeholder.svg";

}  // namespace

ServerProjectExporter::ServerProjectExporter(const ServerProjectOptions &options, const IAssetFetcher *fetcher,
                                             const IEmitterRegistry *registry)
    : options_(options), fetcher_(fetcher), registry_(registry) {}

std::string ServerProjectExporter::renderTemplate(const PageDefinition &page, Diagnostics &diagnostics) const {
    const TargetDialect dialect = TargetDialect::serverProject();
    // Tokens are bound by Thymeleaf at request time, nothing is resolved here
    const StaticScope scope{};
    ComponentEmitter emitter(dialect, scope, diagnostics, registry_);

    const std::string content = emitter.emitRoots(page.components, CONTENT_INDENT_LEVEL);
    LOG_DEBUG("ServerProjectExporter: Rendered template for '{}' ({} roots)", page.pageName, page.components.size());
    return PageDocument::renderServer(page, content);
}

std::optional<Archive> ServerProjectExporter::exportProject(const SiteDocument &site, Diagnostics &diagnostics) const {
    std::vector<const PageDefinition *> definitions;
    definitions.reserve(site.pages.size());
    for (const auto &page : site.pages) {
        definitions.push_back(&page.definition);
    }

    if (!ComponentTree::validatePages(definitions, diagnostics)) {
        LOG_ERROR("ServerProjectExporter: Export of project '{}' aborted", options_.projectName);
        return std::nullopt;
    }

    LOG_INFO("ServerProjectExporter: Exporting {} pages as {}:{}", site.pages.size(), options_.groupId,
             options_.artifactId);

    AssetCollector collector(fetcher_, diagnostics);
    collector.reserveFileName(PLACEHOLDER_IMAGE);
    const auto assets = collector.collect(definitions);
    const auto mapping = AssetCollector::localMapping(assets, "/images/");

    const auto endpoints = BackendScaffold::collectEndpoints(site.pages);
    const auto routes = BackendScaffold::planRoutes(site.pages);
    const bool hasEndpoints = !endpoints.empty();

    auto pom = BuildDescriptorWriter(options_).write(hasEndpoints);
    if (!pom) {
        LOG_ERROR("ServerProjectExporter: pom.xml could not be generated");
        return std::nullopt;
    }

    Archive archive;
    bool complete = archive.add("pom.xml", *pom);

    const JavaSourceWriter java(options_);
    const std::string javaRoot = BackendScaffold::javaSourceRoot(options_) + "/";
    complete &= archive.add(javaRoot + "Application.java", java.application());
    complete &= archive.add(javaRoot + "controller/PageController.java", java.pageController(routes));
    complete &= archive.add(javaRoot + "service/PageDataService.java", java.pageDataService());
    complete &= archive.add(javaRoot + "service/ImageUrlResolver.java", java.imageUrlResolver());
    complete &= archive.add(javaRoot + "controller/ImageProxyController.java", java.imageProxyController());
    if (hasEndpoints) {
        complete &= archive.add(javaRoot + "controller/ApiDataController.java", java.apiDataController(endpoints));
        complete &= archive.add(javaRoot + "service/DataService.java", java.dataService());
    }

    complete &= archive.add(RESOURCES_DIR + "application.properties",
                            BackendScaffold::applicationProperties(options_));

    for (size_t i = 0; i < site.pages.size() && i < routes.size(); ++i) {
        const std::string markup =
            AssetCollector::rewriteUrls(renderTemplate(site.pages[i].definition, diagnostics), mapping);
        complete &= archive.add(RESOURCES_DIR + "templates/" + routes[i].templateName + ".html", markup);
        complete &= archive.add(RESOURCES_DIR + "pages/" + routes[i].templateName + ".json",
                                BackendScaffold::pageDataJson(site.pages[i], routes[i]));
    }

    complete &= archive.add(RESOURCES_DIR + "static/css/styles.css", BaseAssets::stylesheet(ExportTarget::ServerProject));
    complete &= archive.add(RESOURCES_DIR + "static/js/main.js", BaseAssets::script(ExportTarget::ServerProject));
    complete &= archive.add(RESOURCES_DIR + "static/images/" + PLACEHOLDER_IMAGE, BaseAssets::placeholderSvg());
    for (const auto &asset : assets) {
        if (asset.fetched) {
            complete &= archive.add(RESOURCES_DIR + "static/images/" + asset.fileName, asset.data);
        }
    }

    complete &= archive.add("README.md", BackendScaffold::readme(options_, routes, endpoints));
    complete &= archive.add("Dockerfile", BackendScaffold::dockerfile(options_));

    if (!complete) {
        LOG_ERROR("ServerProjectExporter: Archive for '{}' is incomplete", options_.projectName);
        return std::nullopt;
    }

    LOG_INFO("ServerProjectExporter: Project '{}' exported, {} files, {} API endpoints", options_.projectName,
             archive.size(), endpoints.size());
    return archive;
}

}  // namespace PEX
