#include "scaffold/BackendScaffold.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include "parsing/PropValueJson.h"
#include <cctype>
#include <initializer_list>
#include <set>
#include <sstream>

namespace PEX {

namespace {

void collectComponentEndpoints(const ComponentInstance &component, std::vector<ApiEndpointConfig> &endpoints,
                               std::set<std::string> &seenRoutes, std::set<std::string> &usedMethods) {
    if (component.dataSource && component.dataSource->type == DataSourceType::Api) {
        const std::string endpoint = StringHelper::trim(component.dataSource->endpoint);
        ApiEndpointConfig config = BackendScaffold::deriveEndpoint(endpoint, component.dataSource->dataPath);
        // Endpoints differing only in query or fragment share one handler
        if (!endpoint.empty() && seenRoutes.insert(config.routePath).second) {
            const std::string baseName = config.methodName;
            for (int suffix = 2; usedMethods.count(config.methodName) > 0; ++suffix) {
                config.methodName = baseName + std::to_string(suffix);
            }
            usedMethods.insert(config.methodName);

            LOG_DEBUG("BackendScaffold: Endpoint {} served by {}.{}", endpoint, config.controllerName,
                      config.methodName);
            endpoints.push_back(std::move(config));
        }
    }

    for (const auto &child : component.children) {
        collectComponentEndpoints(child, endpoints, seenRoutes, usedMethods);
    }
}

// Java keywords and the PageController helper method
const std::set<std::string> RESERVED_METHOD_NAMES = {
    "abstract", "assert",    "boolean", "break",      "byte",      "case",       "catch",        "char",
    "class",    "const",     "continue", "default",   "do",        "double",     "else",         "enum",
    "extends",  "final",     "finally", "float",      "for",       "goto",       "if",           "implements",
    "import",   "instanceof", "int",    "interface",  "long",      "native",     "new",          "package",
    "private",  "protected", "public",  "return",     "short",     "static",     "strictfp",     "super",
    "switch",   "synchronized", "this", "throw",      "throws",    "transient",  "try",          "void",
    "volatile", "while",     "true",    "false",      "null",      "var",        "record",       "yield",
    "render",
};

// {id} style path variables carry no name
bool isPathVariable(const std::string &segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

// Letters and digits of a path segment as one PascalCase word; any other character separates parts
std::string identifierWord(const std::string &segment) {
    std::string parts;
    parts.reserve(segment.size());
    for (char c : segment) {
        parts += std::isalnum(static_cast<unsigned char>(c)) ? c : '-';
    }
    return StringHelper::toPascalCase(parts);
}

std::string uniqueName(const std::string &base, std::set<std::string> &used, const std::string &separator) {
    std::string name = base;
    for (int suffix = 2; used.count(name) > 0; ++suffix) {
        name = base + separator + std::to_string(suffix);
    }
    used.insert(name);
    return name;
}

}  // namespace

ApiEndpointConfig BackendScaffold::deriveEndpoint(const std::string &endpoint, const std::string &dataPath) {
    ApiEndpointConfig config;
    config.endpoint = endpoint;
    config.dataPath = dataPath;
    config.controllerName = "DataController";
    config.methodName = "getData";

    // The mapping matches the path only; query and fragment never reach the controller
    const std::string route = StringHelper::trim(endpoint.substr(0, endpoint.find_first_of("?#")));
    config.routePath = route.empty() ? "/" : route;

    std::string path = route;
    if (StringHelper::startsWith(path, "/")) {
        path.erase(0, 1);
    }

    std::vector<std::string> parts;
    for (const auto &part : StringHelper::split(path, '/')) {
        if (!isPathVariable(part)) {
            parts.push_back(part);
        }
    }
    if (parts.size() < 2) {
        return config;
    }

    std::string controllerBase = identifierWord(parts[1]);
    if (controllerBase.empty()) {
        controllerBase = "Data";
    } else if (std::isdigit(static_cast<unsigned char>(controllerBase[0]))) {
        controllerBase = "Data" + controllerBase;
    }
    config.controllerName = controllerBase + "Controller";

    std::string last = parts.back();
    const auto extension = last.rfind('.');
    if (extension != std::string::npos && extension > 0) {
        last.erase(extension);
    }
    const std::string methodBase = identifierWord(last);
    if (!methodBase.empty()) {
        config.methodName = "get" + methodBase;
    }
    return config;
}

std::vector<ApiEndpointConfig> BackendScaffold::collectEndpoints(const std::vector<PageEntry> &pages) {
    std::vector<ApiEndpointConfig> endpoints;
    std::set<std::string> seenRoutes;
    std::set<std::string> usedMethods;

    for (const auto &page : pages) {
        for (const auto &component : page.definition.components) {
            collectComponentEndpoints(component, endpoints, seenRoutes, usedMethods);
        }
    }
    return endpoints;
}

SampleKind BackendScaffold::sampleKindFor(const std::string &methodName) {
    const std::string name = StringHelper::toLower(methodName);
    auto mentions = [&name](std::initializer_list<const char *> keywords) {
        for (const char *keyword : keywords) {
            if (StringHelper::contains(name, keyword)) {
                return true;
            }
        }
        return false;
    };

    if (mentions({"product"})) {
        return SampleKind::Products;
    } else if (mentions({"team", "member"})) {
        return SampleKind::Team;
    } else if (mentions({"post", "blog", "article"})) {
        return SampleKind::Posts;
    } else if (mentions({"testimonial", "review"})) {
        return SampleKind::Testimonials;
    } else if (mentions({"service"})) {
        return SampleKind::Services;
    }
    return SampleKind::Generic;
}

const char *BackendScaffold::sampleKindName(SampleKind kind) {
    switch (kind) {
    case SampleKind::Products:
        return "products";
    case SampleKind::Team:
        return "team";
    case SampleKind::Posts:
        return "posts";
    case SampleKind::Testimonials:
        return "testimonials";
    case SampleKind::Services:
        return "services";
    case SampleKind::Generic:
        return "generic";
    }
    return "generic";
}

std::vector<PageRoute> BackendScaffold::planRoutes(const std::vector<PageEntry> &pages) {
    std::vector<PageRoute> routes;
    std::set<std::string> usedTemplates;
    std::set<std::string> usedMethods;
    std::set<std::string> usedPaths;
    bool homeAssigned = false;

    for (const auto &page : pages) {
        PageRoute route;
        route.pageName = page.pageName;
        route.isHome = page.isHome() && !homeAssigned;
        homeAssigned = homeAssigned || route.isHome;

        std::string templateBase = StringHelper::toHyphenated(page.pageName);
        if (templateBase.empty()) {
            templateBase = route.isHome ? "index" : page.effectiveSlug();
        }
        route.templateName = uniqueName(templateBase, usedTemplates, "-");

        std::string methodBase = StringHelper::toIdentifier(page.pageName);
        if (methodBase.empty()) {
            methodBase = route.isHome ? "home" : "page";
        } else if (std::isdigit(static_cast<unsigned char>(methodBase.front()))) {
            methodBase = "page" + methodBase;
        } else if (RESERVED_METHOD_NAMES.count(methodBase) > 0) {
            methodBase += "Page";
        }
        route.methodName = uniqueName(methodBase, usedMethods, "");

        if (route.isHome) {
            route.routePath = "/";
        } else {
            std::string path = page.isHome() ? "/" + page.effectiveSlug() : page.routePath;
            if (!StringHelper::startsWith(path, "/")) {
                path = "/" + path;
            }
            route.routePath = path;
        }
        if (usedPaths.count(route.routePath) > 0 || (!route.isHome && route.routePath == "/home")) {
            LOG_WARN("BackendScaffold: Route {} of page '{}' is already mapped, using /{}", route.routePath,
                     page.pageName, route.templateName);
            route.routePath = "/" + route.templateName;
        }
        usedPaths.insert(route.routePath);
        if (route.isHome) {
            usedPaths.insert("/home");
        }

        routes.push_back(std::move(route));
    }
    return routes;
}

std::string BackendScaffold::javaSourceRoot(const ServerProjectOptions &options) {
    return "src/main/java/" + StringHelper::replaceAll(options.groupId, ".", "/") + "/" +
           StringHelper::toIdentifier(options.artifactId);
}

std::string BackendScaffold::applicationProperties(const ServerProjectOptions &options) {
    std::ostringstream out;
    out << "# " << options.projectName << " configuration\n"
        << "\n"
        << "server.port=8080\n"
        << "\n"
        << "# ------------------------------------------------------------\n"
        << "# Templates\n"
        << "# ------------------------------------------------------------\n"
        << "spring.thymeleaf.cache=false\n"
        << "spring.thymeleaf.prefix=classpath:/templates/\n"
        << "spring.thymeleaf.suffix=.html\n"
        << "\n"
        << "# ------------------------------------------------------------\n"
        << "# Image repository\n"
        << "# Images bound to data ({{item.image}}) are not packaged; they are\n"
        << "# proxied from this server at request time.\n"
        << "# ------------------------------------------------------------\n"
        << "app.image.repository.base-url=" << options.imageRepositoryBaseUrl << "\n"
        << "app.image.repository.timeout=" << options.imageRepositoryTimeoutMs << "\n"
        << "# Image shown when a bound image URL is empty\n"
        << "#app.image.placeholder=/images/placeholder.svg\n"
        << "\n"
        << "# ------------------------------------------------------------\n"
        << "# Database (uncomment and configure to use JPA)\n"
        << "# ------------------------------------------------------------\n"
        << "#spring.datasource.url=jdbc:mysql://localhost:3306/" << StringHelper::toIdentifier(options.artifactId)
        << "\n"
        << "#spring.datasource.username=root\n"
        << "#spring.datasource.password=secret\n"
        << "#spring.jpa.hibernate.ddl-auto=validate\n"
        << "\n"
        << "# ------------------------------------------------------------\n"
        << "# Logging\n"
        << "# ------------------------------------------------------------\n"
        << "logging.level." << options.groupId << "=DEBUG\n";
    return out.str();
}

std::string BackendScaffold::pageDataJson(const PageEntry &page, const PageRoute &route) {
    Json::Value root(Json::objectValue);
    root["pageName"] = page.pageName;
    root["title"] = page.definition.pageName.empty() ? page.pageName : page.definition.pageName;
    root["description"] = "";
    root["path"] = route.routePath;
    root["dataSources"] = PropValueJson::toJson(page.definition.collectDataSources());
    return JsonUtils::toPrettyString(root) + "\n";
}

std::string BackendScaffold::readme(const ServerProjectOptions &options, const std::vector<PageRoute> &routes,
                                    const std::vector<ApiEndpointConfig> &endpoints) {
    const std::string packagePath =
        StringHelper::replaceAll(options.groupId, ".", "/") + "/" + StringHelper::toIdentifier(options.artifactId);

    std::ostringstream out;
    out << "# " << options.projectName << "\n\n"
        << "Spring Boot project with server-rendered Thymeleaf pages, generated by pexport.\n\n"
        << "## Pages\n\n";
    for (const auto &route : routes) {
        out << "- " << route.pageName << " (" << route.routePath << ")"
            << " -> templates/" << route.templateName << ".html\n";
    }

    if (!endpoints.empty()) {
        out << "\n## API Endpoints\n\n";
        for (const auto &endpoint : endpoints) {
            out << "- " << endpoint.endpoint << " (data path: " << endpoint.effectiveDataPath() << ", "
                << sampleKindName(sampleKindFor(endpoint.methodName)) << " sample data)\n";
        }
        out << "\nThese endpoints are served by `ApiDataController` with sample data shaped like the\n"
            << "components expect. Replace `getSampleData` with calls into `DataService` or your own\n"
            << "repositories to serve real data.\n";
    }

    out << "\n## Getting Started\n\n"
        << "Requirements: Java " << options.runtimeVersion << "+ and Maven 3.6+.\n\n"
        << "```bash\n"
        << "mvn spring-boot:run\n"
        << "```\n\n"
        << "Then open http://localhost:8080.\n\n"
        << "To build a runnable jar:\n\n"
        << "```bash\n"
        << "mvn clean package\n"
        << "java -jar target/" << options.artifactId << "-" << options.version << ".jar\n"
        << "```\n\n"
        << "A `Dockerfile` is included for the packaged jar.\n\n"
        << "## Project Structure\n\n"
        << "```\n"
        << "src/main/java/" << packagePath << "/\n"
        << "    Application.java\n"
        << "    controller/PageController.java        page routes\n"
        << "    controller/ImageProxyController.java  proxies bound images\n";
    if (!endpoints.empty()) {
        out << "    controller/ApiDataController.java     API data endpoints\n";
    }
    out << "    service/PageDataService.java          page metadata and data sources\n"
        << "    service/ImageUrlResolver.java         image URL resolution in templates\n";
    if (!endpoints.empty()) {
        out << "    service/DataService.java              external API access\n";
    }
    out << "src/main/resources/\n"
        << "    application.properties\n"
        << "    pages/       page data (JSON)\n"
        << "    templates/   Thymeleaf templates\n"
        << "    static/      css, js and packaged images\n"
        << "```\n\n"
        << "## Images\n\n"
        << "Images with a fixed URL were downloaded into `static/images/` and are served by Spring Boot.\n"
        << "Images bound to data (for example `{{item.image}}`) are resolved at request time by\n"
        << "`ImageUrlResolver`; root-relative ones (`/uploads/...`) are proxied by `ImageProxyController`\n"
        << "from `app.image.repository.base-url`. Set that property to your content server in production.\n";
    return out.str();
}

std::string BackendScaffold::dockerfile(const ServerProjectOptions &options) {
    std::ostringstream out;
    out << "FROM eclipse-temurin:" << options.runtimeVersion << "-jre\n"
        << "WORKDIR /app\n"
        << "COPY target/" << options.artifactId << "-" << options.version << ".jar app.jar\n"
        << "EXPOSE 8080\n"
        << "ENTRYPOINT [\"java\", \"-jar\", \"app.jar\"]\n";
    return out.str();
}

}  // namespace PEX
