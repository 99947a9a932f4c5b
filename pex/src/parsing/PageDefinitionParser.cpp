#include "parsing/PageDefinitionParser.h"
#include "common/FileHelper.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include "parsing/PropValueJson.h"

namespace PEX {

namespace {

// Strings as-is, numbers without a trailing ".0", booleans as true/false
std::optional<std::string> scalarText(const Json::Value &value) {
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNumeric() || value.isBool()) {
        return PropValueJson::fromJson(value).asString();
    }
    return std::nullopt;
}

}  // namespace

std::optional<SiteDocument> PageDefinitionParser::parseFile(const std::string &filename) {
    std::string content;
    if (!FileHelper::loadFileContent(filename, content)) {
        addError("Cannot read page document: " + filename);
        return std::nullopt;
    }

    LOG_DEBUG("PageDefinitionParser: Loaded {} bytes from {}", content.size(), filename);
    return parseContent(content);
}

std::optional<SiteDocument> PageDefinitionParser::parseContent(const std::string &content) {
    errorMessages_.clear();
    warningMessages_.clear();

    std::string parseError;
    auto root = JsonUtils::parseJson(content, &parseError);
    if (!root) {
        addError("Invalid page document JSON: " + parseError);
        return std::nullopt;
    }

    return parseDocument(*root);
}

std::optional<SiteDocument> PageDefinitionParser::parseDocument(const Json::Value &root) {
    if (!root.isObject()) {
        addError("Page document root must be a JSON object");
        return std::nullopt;
    }

    SiteDocument site;

    if (root.isMember("pages")) {
        const Json::Value &pages = root["pages"];
        if (!pages.isArray()) {
            addError("'pages' must be an array");
            return std::nullopt;
        }

        site.siteName = JsonUtils::getFirstString(root, {"siteName", "projectName", "name"}, "My Site");
        for (Json::ArrayIndex i = 0; i < pages.size(); ++i) {
            auto entry = parsePageEntry(pages[i], i);
            if (entry) {
                site.pages.push_back(std::move(*entry));
            }
        }
    } else {
        PageEntry entry;
        entry.definition = parsePageDefinition(root);
        entry.pageName = entry.definition.pageName;
        entry.routePath = JsonUtils::getFirstString(root, {"routePath", "path"}, "/");
        entry.slug = JsonUtils::getString(root, "slug");
        site.siteName = entry.pageName;
        site.pages.push_back(std::move(entry));
    }

    if (site.pages.empty()) {
        addError("Page document contains no pages");
        return std::nullopt;
    }

    LOG_INFO("PageDefinitionParser: Parsed {} page(s) for site '{}'", site.pages.size(), site.siteName);
    return site;
}

std::optional<PageEntry> PageDefinitionParser::parsePageEntry(const Json::Value &node, size_t index) {
    if (!node.isObject()) {
        addWarning("pages[" + std::to_string(index) + "] is not an object, skipped");
        return std::nullopt;
    }

    PageEntry entry;
    const Json::Value &definition = node.isMember("definition") ? node["definition"] : node;
    if (!definition.isObject()) {
        addWarning("pages[" + std::to_string(index) + "].definition is not an object, skipped");
        return std::nullopt;
    }

    entry.definition = parsePageDefinition(definition);
    entry.pageName = JsonUtils::getFirstString(node, {"pageName", "name"}, entry.definition.pageName);
    if (entry.pageName.empty()) {
        entry.pageName = "Page " + std::to_string(index + 1);
    }
    if (!definition.isMember("pageName") && !definition.isMember("name") && !definition.isMember("title")) {
        entry.definition.pageName = entry.pageName;
    }
    entry.routePath = JsonUtils::getFirstString(node, {"routePath", "path"}, index == 0 ? "/" : "");
    entry.slug = JsonUtils::getString(node, "slug");
    if (entry.routePath.empty()) {
        entry.routePath = "/" + entry.effectiveSlug();
    }

    return entry;
}

PageDefinition PageDefinitionParser::parsePageDefinition(const Json::Value &node) {
    PageDefinition page;
    page.pageName = JsonUtils::getFirstString(node, {"pageName", "name", "title"}, "Untitled");

    if (node.isMember("components")) {
        const Json::Value &components = node["components"];
        if (components.isArray()) {
            for (const auto &component : components) {
                auto parsed = parseComponent(component);
                if (parsed) {
                    page.components.push_back(std::move(*parsed));
                }
            }
        } else {
            addWarning("Page '" + page.pageName + "': 'components' is not an array, ignored");
        }
    }

    const Json::Value &globalStyles = node["globalStyles"];
    if (globalStyles.isObject()) {
        page.globalStyles.customCss = JsonUtils::getFirstString(globalStyles, {"customCSS", "customCss"});
        const Json::Value &variables = globalStyles["cssVariables"];
        if (variables.isObject()) {
            for (const auto &name : variables.getMemberNames()) {
                if (auto text = scalarText(variables[name])) {
                    page.globalStyles.cssVariables[name] = *text;
                }
            }
        }
    }

    const Json::Value &dataContext = node["dataContext"];
    if (dataContext.isObject()) {
        for (const auto &name : dataContext.getMemberNames()) {
            page.dataContext[name] = PropValueJson::fromJson(dataContext[name]);
        }
    }

    return page;
}

std::optional<ComponentInstance> PageDefinitionParser::parseComponent(const Json::Value &node) {
    if (!node.isObject()) {
        addWarning("Component entry is not an object, skipped");
        return std::nullopt;
    }

    ComponentInstance component;
    component.instanceId = JsonUtils::getFirstString(node, {"instanceId", "id"});
    component.componentId = JsonUtils::getFirstString(node, {"componentId", "type"});
    if (component.instanceId.empty() || component.componentId.empty()) {
        addWarning("Component without instanceId or componentId skipped");
        return std::nullopt;
    }

    component.pluginId = JsonUtils::getString(node, "pluginId", "builtin");
    component.category =
        ComponentInstance::categoryFromString(JsonUtils::getFirstString(node, {"category", "componentCategory"}));

    const Json::Value &props = node["props"];
    if (props.isObject()) {
        for (const auto &key : props.getMemberNames()) {
            component.props[key] = PropValueJson::fromJson(props[key]);
        }
    } else if (!props.isNull()) {
        addWarning(component.instanceId + ": 'props' is not an object, ignored");
    }

    component.styles = parseStyles(node["styles"], component.instanceId);

    if (node["parentId"].isString() && !node["parentId"].asString().empty()) {
        component.parentId = node["parentId"].asString();
    }

    // Older documents keep events inside props
    if (node["events"].isArray()) {
        component.events = parseEvents(node["events"]);
    } else if (props.isObject() && props["events"].isArray()) {
        component.events = parseEvents(props["events"]);
    }

    component.dataSource = parseDataSource(node["dataSource"], component.instanceId);

    const Json::Value &bindings = node["templateBindings"];
    if (bindings.isObject()) {
        for (const auto &name : bindings.getMemberNames()) {
            if (bindings[name].isString()) {
                component.templateBindings[name] = bindings[name].asString();
            }
        }
    }

    const Json::Value &size = node["size"];
    if (size.isObject()) {
        ComponentSize hint;
        hint.width = scalarText(size["width"]).value_or("");
        hint.height = scalarText(size["height"]).value_or("");
        component.size = hint;
    }

    const Json::Value &position = node["position"];
    if (position.isObject()) {
        GridPosition hint;
        hint.row = JsonUtils::getInt(position, "row", 0);
        hint.column = JsonUtils::getInt(position, "column", 0);
        hint.rowSpan = JsonUtils::getInt(position, "rowSpan", 1);
        hint.columnSpan = JsonUtils::getInt(position, "columnSpan", 1);
        component.position = hint;
    }

    const Json::Value &children = node["children"];
    if (children.isArray()) {
        for (const auto &child : children) {
            auto parsed = parseComponent(child);
            if (parsed) {
                component.children.push_back(std::move(*parsed));
            }
        }
    }

    return component;
}

StyleDeclarations PageDefinitionParser::parseStyles(const Json::Value &node, const std::string &instanceId) {
    StyleDeclarations styles;
    if (node.isNull()) {
        return styles;
    }
    if (!node.isObject()) {
        addWarning(instanceId + ": 'styles' is not an object, ignored");
        return styles;
    }

    for (const auto &name : node.getMemberNames()) {
        const Json::Value &value = node[name];
        if (auto text = scalarText(value)) {
            styles[name] = *text;
        } else if (!value.isNull()) {
            addWarning(instanceId + ": style '" + name + "' is not a scalar, skipped");
        }
    }
    return styles;
}

std::vector<EventBinding> PageDefinitionParser::parseEvents(const Json::Value &node) {
    std::vector<EventBinding> events;
    for (const auto &entry : node) {
        if (!entry.isObject()) {
            continue;
        }
        EventBinding binding;
        binding.eventType = JsonUtils::getFirstString(entry, {"eventType", "type", "event"});
        const Json::Value &action = entry["action"];
        if (action.isObject()) {
            binding.action.type = JsonUtils::getString(action, "type");
            const Json::Value &config = action["config"];
            if (config.isObject()) {
                binding.action.config = PropValueJson::fromJson(config).map();
            }
        }
        events.push_back(std::move(binding));
    }
    return events;
}

std::optional<DataSourceConfig> PageDefinitionParser::parseDataSource(const Json::Value &node,
                                                                       const std::string &instanceId) {
    if (!node.isObject()) {
        return std::nullopt;
    }

    DataSourceConfig config;
    const std::string type = StringHelper::toLower(JsonUtils::getString(node, "type", "static"));
    if (type == "api") {
        config.type = DataSourceType::Api;
    } else if (type == "context") {
        config.type = DataSourceType::Context;
    } else if (type == "static") {
        config.type = DataSourceType::Static;
    } else {
        addWarning(instanceId + ": unknown data source type '" + type + "', treated as static");
    }

    config.endpoint = JsonUtils::getFirstString(node, {"endpoint", "apiEndpoint"});
    config.method = JsonUtils::getString(node, "method", "GET");
    config.dataPath = JsonUtils::getString(node, "dataPath");
    config.staticData = PropValueJson::fromJson(node["staticData"]);

    const Json::Value &mapping = node["fieldMapping"];
    if (mapping.isObject()) {
        for (const auto &name : mapping.getMemberNames()) {
            if (mapping[name].isString()) {
                config.fieldMapping[name] = mapping[name].asString();
            }
        }
    }

    if (config.type == DataSourceType::Api && config.endpoint.empty()) {
        addWarning(instanceId + ": api data source without endpoint");
    }
    return config;
}

void PageDefinitionParser::addError(const std::string &message) {
    LOG_ERROR("PageDefinitionParser: {}", message);
    errorMessages_.push_back(message);
}

void PageDefinitionParser::addWarning(const std::string &message) {
    LOG_WARN("PageDefinitionParser: {}", message);
    warningMessages_.push_back(message);
}

}  // namespace PEX
