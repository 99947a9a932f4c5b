#include "model/PageDefinition.h"
#include "common/StringHelper.h"

namespace PEX {

namespace {

PropValue unwrapSource(const PropValue &value) {
    if (const PropValue *staticData = value.find("staticData")) {
        return *staticData;
    }
    return value;
}

void collectComponentData(const ComponentInstance &component, PropMap &sources) {
    if (component.dataSource && component.dataSource->type == DataSourceType::Static &&
        !component.dataSource->staticData.isNull()) {
        sources["repeater_" + component.instanceId] = component.dataSource->staticData;
    }
    for (const auto &child : component.children) {
        collectComponentData(child, sources);
    }
}

}  // namespace

PropMap PageDefinition::collectDataSources() const {
    PropMap sources;
    for (const auto &[name, value] : dataContext) {
        if (name == "dataSources" && value.isMap()) {
            for (const auto &[inner, innerValue] : value.map()) {
                sources[inner] = unwrapSource(innerValue);
            }
        } else {
            sources[name] = unwrapSource(value);
        }
    }
    for (const auto &component : components) {
        collectComponentData(component, sources);
    }
    return sources;
}

bool PageEntry::isHome() const {
    const std::string route = StringHelper::trim(routePath);
    return route.empty() || route == "/" || route == "/home" || route == "home";
}

std::string PageEntry::effectiveSlug() const {
    if (!slug.empty()) {
        return StringHelper::toSlug(slug);
    }

    std::string route = StringHelper::trim(routePath);
    while (!route.empty() && route.front() == '/') {
        route.erase(route.begin());
    }
    while (!route.empty() && route.back() == '/') {
        route.pop_back();
    }
    if (!route.empty()) {
        return StringHelper::replaceAll(route, "/", "-");
    }

    std::string fromName = StringHelper::toSlug(pageName);
    return fromName.empty() ? "page" : fromName;
}

}  // namespace PEX
