#include "emit/ComponentEmitter.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include "emit/BaseAssets.h"
#include "parsing/PropValueJson.h"
#include "style/StyleResolver.h"
#include <map>
#include <set>
#include <sstream>

namespace PEX {

namespace {

const std::set<std::string> NAVBAR_KINDS = {"Navbar",     "NavbarDefault", "NavbarCentered", "NavbarMinimal",
                                            "NavbarDark", "NavbarGlass",   "NavbarSticky"};

const std::map<std::string, std::string> LABEL_TAGS = {
    {"h1", "h1"}, {"h2", "h2"}, {"h3", "h3"},         {"h4", "h4"},       {"h5", "h5"},
    {"h6", "h6"}, {"paragraph", "p"}, {"span", "span"}, {"label", "label"},
};

std::string kindClass(const ComponentInstance &component) {
    return StringHelper::escapeHtml(StringHelper::toLower(component.componentId));
}

std::string attribute(const std::string &name, const std::string &value) {
    return " " + name + "=\"" + StringHelper::escapeHtml(value) + "\"";
}

std::string expressionAttribute(const std::string &name, const std::string &expression) {
    return " " + name + "=\"" + TargetDialect::escapeExpressionAttribute(expression) + "\"";
}

}  // namespace

ComponentEmitter::ComponentEmitter(const TargetDialect &dialect, const StaticScope &scope, Diagnostics &diagnostics,
                                   const IEmitterRegistry *registry)
    : dialect_(dialect), scope_(scope), diagnostics_(diagnostics), registry_(registry) {}

bool ComponentEmitter::isNavbarKind(const std::string &kind) {
    return NAVBAR_KINDS.count(kind) > 0;
}

bool ComponentEmitter::isBuiltinKind(const std::string &kind) {
    return kind == "Label" || kind == "Button" || kind == "Image" || kind == "Textbox" || kind == "Container" ||
           kind == "ScrollableContainer" || isNavbarKind(kind);
}

std::string ComponentEmitter::elementId(const ComponentInstance &component) {
    return "component-" + component.instanceId;
}

std::string ComponentEmitter::emitRoots(const std::vector<ComponentInstance> &roots, int indentLevel) const {
    std::string result;
    for (size_t i = 0; i < roots.size(); ++i) {
        if (i > 0) {
            result += "\n\n";
        }
        result += emit(roots[i], 0, indentLevel);
    }
    return result;
}

std::string ComponentEmitter::emit(const ComponentInstance &component, int depth, int indentLevel) const {
    if (auto pluginMarkup = emitPlugin(component, depth, indentLevel)) {
        return *pluginMarkup;
    }
    return emitBuiltin(component, depth, indentLevel);
}

std::optional<std::string> ComponentEmitter::emitPlugin(const ComponentInstance &component, int depth,
                                                        int indentLevel) const {
    if (!registry_ || !registry_->has(component.componentId, component.pluginId)) {
        return std::nullopt;
    }

    const std::string childrenMarkup = emitChildren(component, depth, indentLevel, false);
    auto inner = registry_->render(component.componentId, component.pluginId, component, childrenMarkup,
                                   dialect_.target());
    if (!inner) {
        LOG_DEBUG("ComponentEmitter: Plugin emitter for {} rendered nothing, using built-in", component.componentId);
        return std::nullopt;
    }

    return dialect_.indent(indentLevel) + "<div" + attribute("id", elementId(component)) +
           attribute("class", "component " + StringHelper::toLower(component.componentId)) + ">" + *inner + "</div>";
}

std::string ComponentEmitter::emitBuiltin(const ComponentInstance &component, int depth, int indentLevel) const {
    const std::string &kind = component.componentId;

    if (kind == "Label") {
        return emitLabel(component, indentLevel);
    } else if (kind == "Button") {
        return emitButton(component, indentLevel);
    } else if (kind == "Image") {
        return emitImage(component, depth, indentLevel);
    } else if (kind == "Textbox") {
        return emitTextbox(component, indentLevel);
    } else if (kind == "Container" || kind == "ScrollableContainer") {
        return emitContainer(component, depth, indentLevel);
    } else if (isNavbarKind(kind)) {
        return emitNavbar(component, indentLevel);
    }

    diagnostics_.info(DiagnosticCategory::UnknownComponent, component.instanceId,
                      fmt::format("No emitter for component kind '{}' (plugin '{}'), using generic markup", kind,
                                  component.pluginId));
    return emitGeneric(component, depth, indentLevel);
}

std::string ComponentEmitter::emitChildren(const ComponentInstance &parent, int depth, int indentLevel,
                                           bool wrapLayoutChildren) const {
    const StyleMap wrapper = StyleResolver::layoutChildWrapper(StyleResolver::layoutOf(parent));

    std::ostringstream out;
    bool first = true;
    for (const auto &child : parent.children) {
        if (!first) {
            out << "\n";
        }
        first = false;

        if (wrapLayoutChildren && child.isLayout()) {
            const std::string pad = dialect_.indent(indentLevel + 1);
            out << pad << "<div" << wrapper.toStyleAttribute() << ">\n";
            out << emit(child, depth + 1, indentLevel + 2) << "\n";
            out << pad << "</div>";
        } else {
            out << emit(child, depth + 1, indentLevel + 1);
        }
    }
    return out.str();
}

std::optional<std::string> ComponentEmitter::resolveFully(const std::string &text) const {
    for (const auto &segment : ExpressionTranslator::tokenize(text)) {
        if (segment.kind != ExpressionSegment::Kind::Path) {
            continue;
        }
        const PropValue *value = scope_.lookup(segment.text);
        if (!value || value->isList() || value->isMap()) {
            return std::nullopt;
        }
    }
    Diagnostics unused;
    return ExpressionTranslator::resolveStatic(text, scope_, "", unused);
}

ComponentEmitter::BoundText ComponentEmitter::bindLiteral(const ComponentInstance &component, const std::string &text,
                                                          bool raw) const {
    const bool templated = ExpressionTranslator::hasTokens(text);

    BoundText result;
    if (dialect_.isServer()) {
        result.body = raw ? text : StringHelper::escapeHtml(text);
        if (templated) {
            result.attribute =
                expressionAttribute(raw ? "th:utext" : "th:text", ExpressionTranslator::toServerExpression(text));
        }
        return result;
    }

    const std::string resolved =
        templated ? ExpressionTranslator::resolveStatic(text, scope_, component.instanceId, diagnostics_) : text;
    result.body = raw ? resolved : StringHelper::escapeHtml(resolved);
    return result;
}

ComponentEmitter::BoundText ComponentEmitter::bindText(const ComponentInstance &component, const std::string &text,
                                                       const std::string &bindingKey, bool raw) const {
    auto bindingIt = component.templateBindings.find(bindingKey);
    const std::string binding =
        bindingIt != component.templateBindings.end() ? StringHelper::trim(bindingIt->second) : "";

    if (binding.empty() || ExpressionTranslator::hasTokens(text)) {
        return bindLiteral(component, text, raw);
    }

    auto escapeBody = [raw](const std::string &body) { return raw ? body : StringHelper::escapeHtml(body); };

    BoundText result;
    result.body = escapeBody(text);
    if (dialect_.isServer()) {
        const std::string expression = ExpressionTranslator::hasTokens(binding)
                                           ? ExpressionTranslator::toServerExpression(binding)
                                           : "${" + ExpressionTranslator::toBracketPath(binding) + "}";
        result.attribute = expressionAttribute(raw ? "th:utext" : "th:text", expression);
        return result;
    }

    const std::string bindingText = ExpressionTranslator::hasTokens(binding) ? binding : "{{" + binding + "}}";
    if (auto resolved = resolveFully(bindingText)) {
        result.body = escapeBody(*resolved);
    } else {
        diagnostics_.warning(DiagnosticCategory::ExportConstraint, component.instanceId,
                             fmt::format("Binding '{}' has no value in a static document, keeping literal text",
                                         binding));
    }
    return result;
}

std::string ComponentEmitter::textAttribute(const ComponentInstance &component, const std::string &name,
                                            const std::string &value) const {
    if (!ExpressionTranslator::hasTokens(value)) {
        return attribute(name, value);
    }
    if (dialect_.isServer()) {
        return expressionAttribute("th:" + name, ExpressionTranslator::toServerExpression(value));
    }
    return attribute(name, ExpressionTranslator::resolveStatic(value, scope_, component.instanceId, diagnostics_));
}

std::string ComponentEmitter::linkRoute(const ComponentInstance &component, const std::string &route) const {
    if (dialect_.isServer() || !ExpressionTranslator::hasTokens(route)) {
        return route;
    }
    if (auto resolved = resolveFully(route)) {
        return *resolved;
    }
    diagnostics_.warning(DiagnosticCategory::ExportConstraint, component.instanceId,
                         fmt::format("Link '{}' is only known at runtime, rendering it as '#'", route));
    return "#";
}

std::string ComponentEmitter::emitLabel(const ComponentInstance &component, int indentLevel) const {
    const std::string variant = Props::getString(component.props, "variant", "span");
    auto tagIt = LABEL_TAGS.find(variant);
    const std::string tag = tagIt != LABEL_TAGS.end() ? tagIt->second : "span";

    const BoundText text = bindText(component, Props::getString(component.props, "text"), "text", false);
    const StyleMap styles = StyleResolver::resolveAuthored(component);

    return dialect_.indent(indentLevel) + "<" + tag + attribute("id", elementId(component)) +
           attribute("class", "component label") + styles.toStyleAttribute() + text.attribute + ">" + text.body +
           "</" + tag + ">";
}

std::string ComponentEmitter::emitButton(const ComponentInstance &component, int indentLevel) const {
    const PropMap &props = component.props;
    const std::string variant = Props::getString(props, "variant", "primary");
    const std::string size = Props::getString(props, "size", "medium");
    const bool disabled = Props::getBool(props, "disabled");
    const std::string route = linkRoute(component, component.navigationRoute());

    const BoundText text = bindText(component, Props::getString(props, "text", "Click Me"), "text", false);
    const std::string common = attribute("id", elementId(component)) +
                               attribute("class", "component button btn-" + variant + " btn-" + size) +
                               StyleResolver::resolveButton(component).toStyleAttribute();
    const std::string pad = dialect_.indent(indentLevel);

    if (!route.empty() && !disabled && dialect_.isServer()) {
        return pad + "<a" + common + " role=\"button\" " + dialect_.hrefAttribute(route) + text.attribute + ">" +
               text.body + "</a>";
    }

    std::string markup = pad + "<button" + common;
    if (disabled) {
        markup += " disabled";
    } else if (!route.empty()) {
        markup += " " + dialect_.navigateHandler(route);
    }
    return markup + text.attribute + ">" + text.body + "</button>";
}

std::string ComponentEmitter::plainSourceAttribute(const std::string &url) const {
    if (dialect_.isServer() && StringHelper::startsWith(url, "/")) {
        return expressionAttribute("th:src", "@{" + url + "}");
    }
    return attribute("src", url);
}

std::string ComponentEmitter::sourceAttribute(const ComponentInstance &component, const std::string &src,
                                              const std::string &binding) const {
    std::string dynamicText;
    if (ExpressionTranslator::hasTokens(src)) {
        dynamicText = src;
    } else if (!binding.empty()) {
        dynamicText = ExpressionTranslator::hasTokens(binding) ? binding : "{{" + binding + "}}";
    }

    if (dynamicText.empty()) {
        return src.empty() ? attribute("src", BaseAssets::brokenImageDataUrl()) : plainSourceAttribute(src);
    }

    if (dialect_.isServer()) {
        return expressionAttribute(
            "th:src", "${@imageUrlResolver.resolve(" + ExpressionTranslator::toServerOperand(dynamicText) + ")}");
    }

    if (auto resolved = resolveFully(dynamicText)) {
        if (!resolved->empty()) {
            return plainSourceAttribute(*resolved);
        }
    }
    diagnostics_.warning(DiagnosticCategory::ExportConstraint, component.instanceId,
                         fmt::format("Image source '{}' is only known at runtime, using a placeholder", dynamicText));
    return attribute("src", BaseAssets::brokenImageDataUrl());
}

std::string ComponentEmitter::imageSourceAttribute(const ComponentInstance &component) const {
    const std::string src = StringHelper::trim(Props::getFirstString(component.props, {"src", "url"}));
    auto bindingIt = component.templateBindings.find("src");
    const std::string binding =
        bindingIt != component.templateBindings.end() ? StringHelper::trim(bindingIt->second) : "";
    return sourceAttribute(component, src, binding);
}

std::string ComponentEmitter::imageAltAttribute(const ComponentInstance &component) const {
    return textAttribute(component, "alt", Props::getString(component.props, "alt"));
}

std::string ComponentEmitter::emitImage(const ComponentInstance &component, int depth, int indentLevel) const {
    const ImageStyles styles = StyleResolver::resolveImage(component, depth > 0);
    const std::string onError = "this.onerror=null; this.src='" + BaseAssets::brokenImageDataUrl() + "';";

    std::ostringstream out;
    out << dialect_.indent(indentLevel) << "<div" << attribute("id", elementId(component))
        << attribute("class", "component image-container") << styles.container.toStyleAttribute() << ">\n";
    out << dialect_.indent(indentLevel + 1) << "<div class=\"image-wrapper\"" << styles.wrapper.toStyleAttribute()
        << ">\n";
    out << dialect_.indent(indentLevel + 2) << "<img" << imageSourceAttribute(component)
        << imageAltAttribute(component) << styles.image.toStyleAttribute() << " loading=\"lazy\""
        << attribute("onerror", onError) << " />\n";
    out << dialect_.indent(indentLevel + 1) << "</div>\n";
    out << dialect_.indent(indentLevel) << "</div>";
    return out.str();
}

std::string ComponentEmitter::emitTextbox(const ComponentInstance &component, int indentLevel) const {
    const BoundText content =
        bindText(component, Props::getFirstString(component.props, {"content", "text"}), "content", true);
    const StyleMap styles = StyleResolver::resolveAuthored(component);

    return dialect_.indent(indentLevel) + "<div" + attribute("id", elementId(component)) +
           attribute("class", "component textbox") + styles.toStyleAttribute() + content.attribute + ">" +
           content.body + "</div>";
}

std::string ComponentEmitter::emitContainer(const ComponentInstance &component, int depth, int indentLevel) const {
    std::string classes = "component container";
    if (component.componentId == "ScrollableContainer") {
        classes += " scrollable-container";
    }

    const std::string open = dialect_.indent(indentLevel) + "<div" + attribute("id", elementId(component)) +
                             attribute("class", classes) +
                             StyleResolver::resolveContainer(component, depth).toStyleAttribute() + ">";
    if (component.children.empty()) {
        return open + "</div>";
    }
    return open + "\n" + emitChildren(component, depth, indentLevel, true) + "\n" + dialect_.indent(indentLevel) +
           "</div>";
}

PropList ComponentEmitter::navigationItems(const ComponentInstance &component) const {
    const PropValue *items = Props::find(component.props, "navItems");
    if (!items || items->isNull()) {
        items = Props::find(component.props, "items");
    }
    if (!items) {
        return {};
    }
    if (items->isList()) {
        return items->list();
    }
    if (!items->isString() || StringHelper::trim(items->asString()).empty()) {
        return {};
    }

    std::string error;
    auto parsed = JsonUtils::parseJson(items->asString(), &error);
    if (!parsed || !parsed->isArray()) {
        diagnostics_.warning(DiagnosticCategory::MalformedInput, component.instanceId,
                             fmt::format("Navigation items are not a JSON array, rendering none: {}",
                                         error.empty() ? "not an array" : error));
        return {};
    }
    return PropValueJson::fromJson(*parsed).list();
}

std::string ComponentEmitter::emitNavbar(const ComponentInstance &component, int indentLevel) const {
    const PropMap &props = component.props;
    const NavbarStyles styles = StyleResolver::resolveNavbar(component);

    const std::string brandText = Props::getFirstString(props, {"brandText", "brandName", "brand"}, "Brand");
    const std::string brandLink = Props::getString(props, "brandLink", "/");
    const std::string brandImage = Props::getFirstString(props, {"brandImageUrl", "brandImage", "logoUrl"});
    const std::string layout = Props::getString(props, "layout", "default");

    const std::string pad0 = dialect_.indent(indentLevel);
    const std::string pad1 = dialect_.indent(indentLevel + 1);
    const std::string pad2 = dialect_.indent(indentLevel + 2);

    std::ostringstream out;
    out << pad0 << "<nav" << attribute("id", elementId(component)) << attribute("class", "component navbar")
        << styles.container.toStyleAttribute() << ">\n";

    const BoundText brand = bindLiteral(component, brandText, false);
    out << pad1 << "<a " << dialect_.hrefAttribute(linkRoute(component, brandLink)) << " class=\"navbar-brand\""
        << styles.brand.toStyleAttribute() << ">";
    if (!brandImage.empty()) {
        // The static alt reuses the resolved brand text so tokens are reported once
        const std::string alt =
            dialect_.isServer() ? textAttribute(component, "alt", brandText) : " alt=\"" + brand.body + "\"";
        out << "<img" << sourceAttribute(component, StringHelper::trim(brandImage), "") << alt
            << " style=\"height: 32px; width: auto;\" />";
    }
    out << "<span" << brand.attribute << ">" << brand.body << "</span></a>\n";

    if (layout == "split") {
        out << pad1 << "<div style=\"flex: 1\"></div>\n";
    }

    out << pad1 << "<ul class=\"navbar-nav\"" << styles.list.toStyleAttribute() << ">\n";
    for (const auto &item : navigationItems(component)) {
        const PropMap &fields = item.map();
        const std::string label = Props::getFirstString(fields, {"label", "text"});
        const std::string href = Props::getFirstString(fields, {"href", "path", "url"}, "#");
        const StyleMap &linkStyle = Props::getBool(fields, "active") ? styles.activeLink : styles.inactiveLink;
        const BoundText text = bindLiteral(component, label, false);

        out << pad2 << "<li style=\"margin: 0;\"><a " << dialect_.hrefAttribute(linkRoute(component, href))
            << linkStyle.toStyleAttribute() << text.attribute << ">" << text.body << "</a></li>\n";
    }
    out << pad1 << "</ul>\n";

    out << pad1 << "<button class=\"navbar-toggle\"" << styles.toggle.toStyleAttribute()
        << " aria-label=\"Toggle navigation menu\">\n";
    for (int line = 0; line < 3; ++line) {
        out << pad2 << "<span" << styles.toggleLine.toStyleAttribute() << "></span>\n";
    }
    out << pad1 << "</button>\n";
    out << pad0 << "</nav>";
    return out.str();
}

std::string ComponentEmitter::emitGeneric(const ComponentInstance &component, int depth, int indentLevel) const {
    const std::string open = dialect_.indent(indentLevel) + "<div" + attribute("id", elementId(component)) +
                             " class=\"component " + kindClass(component) + "\"" +
                             StyleResolver::resolveAuthored(component).toStyleAttribute();

    if (!component.children.empty()) {
        return open + ">\n" + emitChildren(component, depth, indentLevel, false) + "\n" +
               dialect_.indent(indentLevel) + "</div>";
    }

    const BoundText text =
        bindText(component, Props::getFirstString(component.props, {"text", "content"}), "text", false);
    return open + text.attribute + ">" + text.body + "</div>";
}

}  // namespace PEX
