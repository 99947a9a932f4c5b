#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "assets/HttpAssetFetcher.h"
#include "common/Diagnostics.h"
#include "common/FileHelper.h"
#include "common/Logger.h"
#include "config/ExportConfig.h"
#include "export/ServerProjectExporter.h"
#include "export/StaticSiteExporter.h"
#include "parsing/PageDefinitionParser.h"

namespace fs = std::filesystem;

namespace {

void printUsage(const char *programName) {
    LOG_INFO("pexport - page builder export");
    LOG_INFO("Compiles page builder JSON into a static site or a Spring Boot project\n");
    LOG_INFO("Usage: {} [options] <pages.json>", programName);
    LOG_INFO("\nOptions:");
    LOG_INFO("  --target static|server  Export target (default: static)");
    LOG_INFO("  -o, --output <path>     Zip file, directory or single page file to write");
    LOG_INFO("  --directory             Write files into a directory instead of a zip");
    LOG_INFO("  --single-page           Static target: one self-contained HTML file");
    LOG_INFO("  --inline-css            Static target: inline the base stylesheet");
    LOG_INFO("  --inline-js             Static target: inline the base script");
    LOG_INFO("  --asset-base-url <url>  Base URL for root-relative image paths");
    LOG_INFO("  --asset-timeout <ms>    Image download timeout");
    LOG_INFO("  --no-fetch              Do not download images, keep their URLs");
    LOG_INFO("  --config <file>         JSON configuration, overridden by flags");
    LOG_INFO("  --log-dir <dir>         Also write pex.log to this directory");
    LOG_INFO("  -h, --help              Show this help message");
    LOG_INFO("  -v, --verbose           Enable verbose logging");
    LOG_INFO("  --version               Show version information\n");
    LOG_INFO("Examples:");
    LOG_INFO("  {} site.json", programName);
    LOG_INFO("  {} --target server -o shop.zip shop.json", programName);
    LOG_INFO("  {} --single-page --output=landing.html landing.json", programName);
}

void printVersion() {
    LOG_INFO("pexport version 1.0.0");
    LOG_INFO("Static site and Spring Boot/Thymeleaf project export");
}

// Settings given on the command line, applied after the config file
struct CommandLine {
    std::string inputFile;
    std::string configFile;
    std::string output;
    std::string target;
    std::string assetBaseUrl;
    std::string logDirectory;
    int assetTimeoutMs = -1;
    bool verbose = false;
    bool singlePage = false;
    bool inlineCss = false;
    bool inlineJs = false;
    bool noFetch = false;
    bool writeDirectory = false;
};

bool requireValue(int argc, char *argv[], int &i, const std::string &option, std::string &value) {
    if (i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    LOG_ERROR("Error: {} requires a value", option);
    return false;
}

bool applyCommandLine(const CommandLine &cli, PEX::ExportConfig &config) {
    if (!cli.target.empty() && !PEX::ExportConfig::parseTarget(cli.target, config.target)) {
        LOG_ERROR("Error: Unknown target '{}', expected static or server", cli.target);
        return false;
    }
    if (!cli.output.empty()) {
        config.output = cli.output;
    }
    if (cli.writeDirectory) {
        config.writeDirectory = true;
    }
    if (cli.singlePage) {
        config.options.singlePage = true;
    }
    if (cli.inlineCss) {
        config.options.includeCss = false;
    }
    if (cli.inlineJs) {
        config.options.includeJs = false;
    }
    if (!cli.assetBaseUrl.empty()) {
        config.assets.baseUrl = cli.assetBaseUrl;
        config.project.imageRepositoryBaseUrl = cli.assetBaseUrl;
    }
    if (cli.assetTimeoutMs >= 0) {
        config.assets.timeoutMs = cli.assetTimeoutMs;
        config.project.imageRepositoryTimeoutMs = cli.assetTimeoutMs;
    }
    if (cli.noFetch) {
        config.assets.enabled = false;
    }
    if (!cli.logDirectory.empty()) {
        config.logDirectory = cli.logDirectory;
        config.logToFile = true;
    }
    return true;
}

void printSummary(const PEX::Diagnostics &diagnostics) {
    using PEX::DiagnosticSeverity;
    LOG_INFO("Diagnostics: {} error(s), {} warning(s), {} info", diagnostics.count(DiagnosticSeverity::Error),
             diagnostics.count(DiagnosticSeverity::Warning), diagnostics.count(DiagnosticSeverity::Info));
    for (const auto &message : diagnostics.getErrorMessages()) {
        LOG_ERROR("  error: {}", message);
    }
    for (const auto &message : diagnostics.getWarningMessages()) {
        LOG_WARN("  warning: {}", message);
    }
}

int runExport(const PEX::ExportConfig &config, const PEX::SiteDocument &site, PEX::Diagnostics &diagnostics) {
    std::unique_ptr<PEX::HttpAssetFetcher> fetcher;
    if (config.assets.enabled) {
        fetcher = std::make_unique<PEX::HttpAssetFetcher>(config.assets);
    }

    if (config.target == PEX::ExportTarget::StaticSite && config.options.singlePage) {
        if (site.pages.size() > 1) {
            LOG_WARN("Single page export uses the first of {} pages", site.pages.size());
        }
        PEX::StaticSiteExporter exporter(config.options, fetcher.get());
        auto document = exporter.exportSinglePage(site.pages.front().definition, diagnostics);
        if (!document) {
            return 1;
        }
        const std::string output = config.output.empty() ? "index.html" : config.output;
        if (!PEX::FileHelper::writeFileContent(output, *document)) {
            return 1;
        }
        LOG_INFO("Generated: {}", output);
        return 0;
    }

    std::optional<PEX::Archive> archive;
    if (config.target == PEX::ExportTarget::ServerProject) {
        PEX::ServerProjectExporter exporter(config.project, fetcher.get());
        archive = exporter.exportProject(site, diagnostics);
    } else {
        PEX::StaticSiteExporter exporter(config.options, fetcher.get());
        archive = exporter.exportSite(site, diagnostics);
    }

    if (!archive) {
        LOG_ERROR("Error: Export failed");
        return 1;
    }

    const std::string output = config.effectiveOutput();
    const bool written = config.writeDirectory ? archive->writeToDirectory(output) : archive->writeZip(output);
    if (!written) {
        LOG_ERROR("Error: Cannot write {}", output);
        return 1;
    }

    LOG_INFO("Generated: {} ({} files)", output, archive->size());
    if (config.target == PEX::ExportTarget::ServerProject) {
        LOG_INFO("\nNext steps:");
        LOG_INFO("  1. Unpack the project and run: mvn spring-boot:run");
        LOG_INFO("  2. Open http://localhost:8080/");
    }
    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    CommandLine cli;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--version") {
            printVersion();
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (!requireValue(argc, argv, i, arg, cli.output)) {
                return 1;
            }
        } else if (arg.starts_with("--output=")) {
            cli.output = arg.substr(9);
        } else if (arg == "--target") {
            if (!requireValue(argc, argv, i, arg, cli.target)) {
                return 1;
            }
        } else if (arg.starts_with("--target=")) {
            cli.target = arg.substr(9);
        } else if (arg == "--config") {
            if (!requireValue(argc, argv, i, arg, cli.configFile)) {
                return 1;
            }
        } else if (arg == "--asset-base-url") {
            if (!requireValue(argc, argv, i, arg, cli.assetBaseUrl)) {
                return 1;
            }
        } else if (arg == "--asset-timeout") {
            std::string value;
            if (!requireValue(argc, argv, i, arg, value)) {
                return 1;
            }
            char *end = nullptr;
            const long timeout = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || timeout < 0) {
                LOG_ERROR("Error: --asset-timeout expects milliseconds, got '{}'", value);
                return 1;
            }
            cli.assetTimeoutMs = static_cast<int>(timeout);
        } else if (arg == "--log-dir") {
            if (!requireValue(argc, argv, i, arg, cli.logDirectory)) {
                return 1;
            }
        } else if (arg == "--single-page") {
            cli.singlePage = true;
        } else if (arg == "--inline-css") {
            cli.inlineCss = true;
        } else if (arg == "--inline-js") {
            cli.inlineJs = true;
        } else if (arg == "--no-fetch") {
            cli.noFetch = true;
        } else if (arg == "--directory") {
            cli.writeDirectory = true;
        } else if (arg.starts_with("-")) {
            LOG_ERROR("Error: Unknown option {}", arg);
            printUsage(argv[0]);
            return 1;
        } else {
            if (cli.inputFile.empty()) {
                cli.inputFile = arg;
            } else {
                LOG_ERROR("Error: Multiple input files specified");
                return 1;
            }
        }
    }

    if (cli.verbose) {
        PEX::Logger::setLevel(spdlog::level::debug);
    }

    // Validate arguments
    if (cli.inputFile.empty()) {
        LOG_ERROR("Error: No input file specified");
        printUsage(argv[0]);
        return 1;
    }

    if (!fs::exists(cli.inputFile)) {
        LOG_ERROR("Error: Input file '{}' does not exist", cli.inputFile);
        return 1;
    }

    PEX::ExportConfig config;
    if (!cli.configFile.empty()) {
        PEX::ExportConfigLoader loader;
        if (!loader.loadFromFile(cli.configFile, config)) {
            return 1;
        }
    }
    if (!applyCommandLine(cli, config)) {
        return 1;
    }

    if (!cli.verbose && !config.logLevel.empty()) {
        PEX::Logger::setLevel(PEX::Logger::parseLevel(config.logLevel).value_or(spdlog::level::info));
    }

    if (config.logToFile && !config.logDirectory.empty()) {
        PEX::Logger::initialize(config.logDirectory, true);
    }

    try {
        LOG_INFO("Starting {} export...", PEX::ExportConfig::targetName(config.target));
        LOG_INFO("Input file: {}", cli.inputFile);

        PEX::PageDefinitionParser parser;
        auto site = parser.parseFile(cli.inputFile);
        if (!site) {
            for (const auto &message : parser.getErrorMessages()) {
                LOG_ERROR("  {}", message);
            }
            LOG_ERROR("Error: Cannot read pages from {}", cli.inputFile);
            return 1;
        }
        if (site->pages.empty()) {
            LOG_ERROR("Error: {} contains no pages", cli.inputFile);
            return 1;
        }

        PEX::Diagnostics diagnostics;
        for (const auto &message : parser.getWarningMessages()) {
            diagnostics.warning(PEX::DiagnosticCategory::MalformedInput, "", message);
        }

        const int status = runExport(config, *site, diagnostics);
        printSummary(diagnostics);
        return status;

    } catch (const std::exception &e) {
        LOG_ERROR("Error: {}", e.what());
        return 1;
    }
}
