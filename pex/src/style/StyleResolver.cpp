#include "style/StyleResolver.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include <map>
#include <set>

namespace PEX {

namespace {

const std::map<std::string, std::string> &gridTemplates() {
    static const std::map<std::string, std::string> templates = {
        {"grid-2col", "repeat(2, 1fr)"},
        {"grid-3col", "repeat(3, 1fr)"},
        {"grid-4col", "repeat(4, 1fr)"},
        {"grid-auto", "repeat(auto-fit, minmax(200px, 1fr))"},
        {"grid-20-80", "20% 80%"},
        {"grid-25-75", "25% 75%"},
        {"grid-33-67", "33.33% 66.67%"},
        {"grid-40-60", "40% 60%"},
        {"grid-60-40", "60% 40%"},
        {"grid-67-33", "66.67% 33.33%"},
        {"grid-75-25", "75% 25%"},
        {"grid-80-20", "80% 20%"},
    };
    return templates;
}

bool matchesAny(const std::string &value, const std::set<std::string> &candidates) {
    return candidates.count(StringHelper::toLower(StringHelper::trim(value))) > 0;
}

}  // namespace

std::string StyleResolver::layoutOf(const ComponentInstance &component) {
    return Props::getFirstString(component.props, {"layoutType", "layoutMode"}, "flex-column");
}

StyleMap StyleResolver::layoutPreset(const std::string &layout) {
    if (layout == "flex-row") {
        return {{"display", "flex"}, {"flexDirection", "row"}};
    }
    if (layout == "flex-wrap") {
        return {{"display", "flex"}, {"flexDirection", "row"}, {"flexWrap", "wrap"}};
    }

    auto grid = gridTemplates().find(layout);
    if (grid != gridTemplates().end()) {
        return {{"display", "grid"}, {"gridTemplateColumns", grid->second}};
    }

    if (layout != "flex-column") {
        LOG_DEBUG("StyleResolver: Unknown layout '{}', using flex-column", layout);
    }
    return {{"display", "flex"}, {"flexDirection", "column"}};
}

bool StyleResolver::isRowLayout(const std::string &layout) {
    return layout == "flex-row" || layout == "flex-wrap";
}

StyleMap StyleResolver::resolveContainer(const ComponentInstance &component, int depth) {
    const PropMap &props = component.props;

    StyleMap styles = layoutPreset(layoutOf(component));

    styles.setIfPresent("padding", Props::getString(props, "padding"));
    styles.setIfPresent("gap", Props::getString(props, "gap"));
    styles.setIfPresent("alignItems", Props::getString(props, "alignItems"));
    styles.setIfPresent("justifyContent", Props::getString(props, "justifyContent"));
    styles.setIfPresent("flexWrap", Props::getString(props, "flexWrap"));

    const std::string maxWidth = Props::getString(props, "maxWidth");
    if (!maxWidth.empty() && maxWidth != "none") {
        styles.set("maxWidth", maxWidth);
    }
    if (Props::getBool(props, "centerContent")) {
        styles.set("marginLeft", "auto");
        styles.set("marginRight", "auto");
    }

    if (component.componentId == "ScrollableContainer") {
        styles.set("overflow", "auto");
        styles.setIfPresent("maxHeight", Props::getString(props, "maxHeight"));
    }

    // Width is editor resize state, not layout intent
    StyleMap authored;
    authored.merge(component.styles, {"width", "maxWidth"});
    if (depth > 0) {
        applyNestedTransparency(authored);
    }
    styles.merge(authored);

    return styles;
}

StyleMap StyleResolver::layoutChildWrapper(const std::string &parentLayout) {
    if (isRowLayout(parentLayout)) {
        return {{"flex", "1"}};
    }
    return {{"width", "100%"}};
}

bool StyleResolver::hasIntentionalBackground(const StyleMap &styles) {
    for (const char *property : {"background", "backgroundImage"}) {
        const std::string value = StringHelper::toLower(styles.getOr(property, ""));
        if (StringHelper::contains(value, "gradient") || StringHelper::contains(value, "url(")) {
            return true;
        }
    }
    return false;
}

bool StyleResolver::isDefaultBackgroundColor(const std::string &value) {
    const std::string compact = StringHelper::toLower(StringHelper::stripWhitespace(value));
    static const std::set<std::string> defaults = {
        "",        "#fff",        "#ffffff",          "white",        "rgb(255,255,255)", "transparent",
        "initial", "inherit",     "rgba(255,255,255,0)", "rgba(0,0,0,0)",
    };
    return defaults.count(compact) > 0;
}

void StyleResolver::applyNestedTransparency(StyleMap &styles) {
    if (hasIntentionalBackground(styles)) {
        return;
    }

    if (isDefaultBackgroundColor(styles.getOr("backgroundColor", ""))) {
        styles.erase("backgroundColor");
        styles.erase("background");
    }

    if (auto radius = styles.get("borderRadius")) {
        if (matchesAny(*radius, {"", "0", "0px", "4px", "8px", "12px", "16px"})) {
            styles.erase("borderRadius");
        }
    }

    if (auto shadow = styles.get("boxShadow")) {
        const std::string compact = StringHelper::toLower(StringHelper::stripWhitespace(*shadow));
        if (compact.empty() || compact == "none" || StringHelper::contains(compact, "rgba(0,0,0,0.1)") ||
            StringHelper::contains(compact, "rgba(0,0,0,0.05)")) {
            styles.erase("boxShadow");
        }
    }

    if (auto border = styles.get("border")) {
        if (matchesAny(*border, {"", "none", "0", "0px", "0 none", "1px solid transparent"})) {
            styles.erase("border");
        }
    }
}

StyleMap StyleResolver::buttonVariant(const std::string &variant) {
    if (variant == "secondary") {
        return {{"backgroundColor", "#6c757d"}, {"color", "white"}};
    } else if (variant == "success") {
        return {{"backgroundColor", "#28a745"}, {"color", "white"}};
    } else if (variant == "danger") {
        return {{"backgroundColor", "#dc3545"}, {"color", "white"}};
    } else if (variant == "warning") {
        return {{"backgroundColor", "#ffc107"}, {"color", "#212529"}};
    } else if (variant == "outline") {
        return {{"backgroundColor", "transparent"}, {"color", "#007bff"}, {"border", "2px solid #007bff"}};
    } else if (variant == "outline-light") {
        return {{"backgroundColor", "transparent"}, {"color", "#ffffff"}, {"border", "2px solid #ffffff"}};
    } else if (variant == "link") {
        return {{"backgroundColor", "transparent"}, {"color", "#007bff"}, {"textDecoration", "underline"}};
    }
    return {{"backgroundColor", "#007bff"}, {"color", "white"}};
}

StyleMap StyleResolver::buttonSize(const std::string &size) {
    if (size == "small") {
        return {{"padding", "6px 12px"}, {"fontSize", "13px"}};
    } else if (size == "large") {
        return {{"padding", "12px 24px"}, {"fontSize", "16px"}};
    }
    return {{"padding", "8px 16px"}, {"fontSize", "14px"}};
}

StyleMap StyleResolver::resolveButton(const ComponentInstance &component) {
    const PropMap &props = component.props;
    const bool fullWidth = Props::getBool(props, "fullWidth");
    const bool disabled = Props::getBool(props, "disabled");

    StyleMap styles = {
        {"display", fullWidth ? "block" : "inline-block"},
        {"width", fullWidth ? "100%" : "auto"},
        {"fontWeight", "500"},
        {"textAlign", "center"},
        {"whiteSpace", "nowrap"},
        {"verticalAlign", "middle"},
        {"userSelect", "none"},
        {"borderRadius", "6px"},
        {"transition", "all 0.2s"},
        {"cursor", disabled ? "not-allowed" : "pointer"},
        {"opacity", disabled ? "0.65" : "1"},
        {"border", "none"},
    };
    styles.merge(buttonVariant(Props::getString(props, "variant", "primary")));
    styles.merge(buttonSize(Props::getString(props, "size", "medium")));
    styles.merge(component.styles);
    return styles;
}

ImageStyles StyleResolver::resolveImage(const ComponentInstance &component, bool hasParent) {
    const PropMap &props = component.props;

    const std::string propsWidth = cssLength(Props::find(props, "width"));
    const std::string propsHeight = cssLength(Props::find(props, "height"));
    const std::string storedWidth = component.size ? component.size->width : "";
    const std::string storedHeight = component.size ? component.size->height : "";

    const bool hasExplicitWidth = !propsWidth.empty() || !storedWidth.empty();
    const bool hasExplicitHeight =
        (!propsHeight.empty() && propsHeight != "auto") || (!storedHeight.empty() && storedHeight != "auto");

    std::string width = !propsWidth.empty() ? propsWidth : storedWidth;
    if (width.empty()) {
        width = hasParent ? "100%" : "auto";
    }
    std::string height = !propsHeight.empty() ? propsHeight : storedHeight;
    if (height.empty()) {
        height = "auto";
    }

    ImageStyles result;
    result.container.set("width", width);
    result.container.set("height", height);
    if (!hasExplicitWidth) {
        result.container.set("maxWidth", "100%");
    }
    result.container.set("position", "relative");
    result.container.set("overflow", "hidden");
    result.container.set("boxSizing", "border-box");
    if (hasExplicitWidth) {
        // Keep the authored size inside flex rows
        result.container.set("flexShrink", "0");
        result.container.set("flexGrow", "0");
    }
    result.container.merge(component.styles);

    const std::string aspectRatio = Props::getString(props, "aspectRatio", "auto");
    result.wrapper.set("width", "100%");
    result.wrapper.set("height", hasExplicitHeight ? "100%" : "auto");
    if (!hasExplicitHeight && aspectRatio != "auto") {
        result.wrapper.set("aspectRatio", aspectRatio);
    }
    result.wrapper.set("backgroundColor", Props::getString(props, "placeholderColor", "#e0e0e0"));
    result.wrapper.set("borderRadius", Props::getString(props, "borderRadius", "0px"));
    result.wrapper.set("overflow", "hidden");
    result.wrapper.set("position", "relative");
    result.wrapper.set("display", "flex");
    result.wrapper.set("alignItems", "center");
    result.wrapper.set("justifyContent", "center");

    result.image.set("width", "100%");
    result.image.set("height", "100%");
    result.image.set("objectFit", Props::getString(props, "objectFit", "cover"));
    result.image.set("objectPosition", Props::getString(props, "objectPosition", "center"));

    return result;
}

NavbarStyles StyleResolver::resolveNavbar(const ComponentInstance &component) {
    const PropMap &props = component.props;
    const StyleDeclarations &authored = component.styles;

    auto authoredOr = [&authored](const std::string &property, const std::string &defaultValue) {
        auto it = authored.find(property);
        return it != authored.end() && !it->second.empty() ? it->second : defaultValue;
    };

    const std::string textColor = authoredOr("textColor", authoredOr("color", "#333333"));
    const std::string accentColor = authoredOr("accentColor", "#007bff");
    const std::string layout = Props::getString(props, "layout", "default");

    std::string justifyContent = "space-between";
    if (layout == "centered") {
        justifyContent = "center";
    } else if (layout == "minimal") {
        justifyContent = "flex-start";
    }

    NavbarStyles result;
    result.container = {
        {"display", "flex"},
        {"alignItems", "center"},
        {"justifyContent", justifyContent},
        {"width", "100%"},
        {"minHeight", "40px"},
        {"backgroundColor", authoredOr("backgroundColor", "#ffffff")},
        {"color", textColor},
        {"padding", authoredOr("padding", "0 20px")},
        {"boxShadow", authoredOr("boxShadow", "0 2px 4px rgba(0,0,0,0.1)")},
        {"borderBottom", authoredOr("borderBottom", "1px solid #e0e0e0")},
        {"fontFamily", authoredOr("fontFamily", "inherit")},
        {"fontSize", authoredOr("fontSize", "16px")},
        {"boxSizing", "border-box"},
        {"transition", "all 0.3s ease"},
    };
    if (Props::getBool(props, "sticky") || component.componentId == "NavbarSticky") {
        result.container.set("position", "sticky");
        result.container.set("top", "0");
        result.container.set("zIndex", "1000");
    }
    result.container.setIfPresent("backdropFilter", authoredOr("backdropFilter", ""));

    result.brand = {
        {"display", "flex"},    {"alignItems", "center"}, {"gap", "10px"},        {"textDecoration", "none"},
        {"color", textColor},   {"fontWeight", "600"},    {"fontSize", "1.25em"},
    };

    result.list = {
        {"display", "flex"}, {"flexDirection", "row"}, {"alignItems", "center"}, {"gap", "8px"},
        {"listStyle", "none"}, {"margin", "0"},       {"padding", "0"},
    };

    auto linkStyle = [&](bool active) {
        return StyleMap{
            {"display", "flex"},
            {"alignItems", "center"},
            {"padding", "8px 12px"},
            {"textDecoration", "none"},
            {"color", active ? accentColor : textColor},
            {"fontWeight", active ? "600" : "400"},
            {"borderBottom", "2px solid " + (active ? accentColor : std::string("transparent"))},
            {"transition", "all 0.2s ease"},
            {"whiteSpace", "nowrap"},
        };
    };
    result.activeLink = linkStyle(true);
    result.inactiveLink = linkStyle(false);

    result.toggle = {
        {"display", "none"},         {"flexDirection", "column"}, {"justifyContent", "space-around"},
        {"width", "24px"},           {"height", "20px"},          {"background", "transparent"},
        {"border", "none"},          {"cursor", "pointer"},       {"padding", "0"},
    };
    result.toggleLine = {
        {"width", "24px"},
        {"height", "3px"},
        {"backgroundColor", textColor},
        {"borderRadius", "2px"},
        {"transition", "all 0.3s ease"},
    };

    return result;
}

StyleMap StyleResolver::resolveAuthored(const ComponentInstance &component) {
    StyleMap styles;
    styles.merge(component.styles);
    return styles;
}

std::string StyleResolver::cssLength(const PropValue *value) {
    if (!value) {
        return "";
    }
    if (value->isNumber()) {
        return value->asNumber() == 0.0 ? "" : value->asString() + "px";
    }
    return value->isString() ? value->asString() : "";
}

}  // namespace PEX
