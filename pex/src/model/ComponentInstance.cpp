#include "model/ComponentInstance.h"
#include "common/StringHelper.h"

namespace PEX {

std::string ComponentInstance::navigationRoute() const {
    for (const auto &binding : events) {
        const std::string eventType = StringHelper::toLower(binding.eventType);
        if (binding.action.type != "navigate" || (eventType != "onclick" && eventType != "click")) {
            continue;
        }
        std::string route = Props::getFirstString(binding.action.config, {"url", "route", "path"});
        if (!route.empty()) {
            return route;
        }
    }
    return "";
}

ComponentCategory ComponentInstance::categoryFromString(const std::string &name) {
    const std::string lowered = StringHelper::toLower(StringHelper::trim(name));
    if (lowered == "layout") {
        return ComponentCategory::Layout;
    } else if (lowered == "ui") {
        return ComponentCategory::Ui;
    } else if (lowered == "data") {
        return ComponentCategory::Data;
    } else if (lowered == "form") {
        return ComponentCategory::Form;
    } else if (lowered == "navbar") {
        return ComponentCategory::Navbar;
    }
    return ComponentCategory::General;
}

const char *ComponentInstance::categoryName(ComponentCategory category) {
    switch (category) {
    case ComponentCategory::Layout:
        return "layout";
    case ComponentCategory::Ui:
        return "ui";
    case ComponentCategory::Data:
        return "data";
    case ComponentCategory::Form:
        return "form";
    case ComponentCategory::Navbar:
        return "navbar";
    case ComponentCategory::General:
        return "general";
    }
    return "general";
}

}  // namespace PEX
