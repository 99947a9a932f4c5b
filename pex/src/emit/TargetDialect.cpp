#include "emit/TargetDialect.h"
#include "common/StringHelper.h"
#include "expression/ExpressionTranslator.h"

namespace PEX {

TargetDialect::TargetDialect(ExportTarget target, std::string indentUnit)
    : target_(target), indentUnit_(std::move(indentUnit)) {}

TargetDialect TargetDialect::staticSite() {
    return TargetDialect(ExportTarget::StaticSite, "  ");
}

TargetDialect TargetDialect::serverProject() {
    return TargetDialect(ExportTarget::ServerProject, "    ");
}

std::string TargetDialect::indent(int level) const {
    std::string result;
    for (int i = 0; i < level; ++i) {
        result += indentUnit_;
    }
    return result;
}

bool TargetDialect::isPassThroughLink(const std::string &route) {
    return StringHelper::startsWith(route, "#") || StringHelper::startsWith(route, "http://") ||
           StringHelper::startsWith(route, "https://") || StringHelper::startsWith(route, "mailto:") ||
           StringHelper::startsWith(route, "tel:");
}

std::string TargetDialect::mapRoute(const std::string &route) const {
    const std::string trimmed = StringHelper::trim(route);
    if (trimmed.empty()) {
        return "#";
    }
    if (isPassThroughLink(trimmed)) {
        return trimmed;
    }

    // Query and fragment are carried over unchanged
    const auto suffixStart = trimmed.find_first_of("?#");
    const std::string suffix = suffixStart == std::string::npos ? "" : trimmed.substr(suffixStart);
    std::string path = trimmed.substr(0, suffixStart);
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    if (isServer()) {
        if (path.empty() || path == "home") {
            return "/" + suffix;
        }
        return (StringHelper::startsWith(path, "/") ? path : "/" + path) + suffix;
    }

    if (path.empty() || path == "/" || path == "/home" || path == "home") {
        return "index" + documentExtension_ + suffix;
    }

    while (StringHelper::startsWith(path, "/")) {
        path.erase(0, 1);
    }
    // Static sites are flat: /blog/post is written as blog-post.html
    path = StringHelper::replaceAll(path, "/", "-");
    if (path.size() >= documentExtension_.size() &&
        path.compare(path.size() - documentExtension_.size(), documentExtension_.size(), documentExtension_) == 0) {
        return path + suffix;
    }
    return path + documentExtension_ + suffix;
}

std::string TargetDialect::hrefAttribute(const std::string &route) const {
    const std::string mapped = mapRoute(route);
    if (!isServer() || isPassThroughLink(mapped)) {
        return "href=\"" + StringHelper::escapeHtml(mapped) + "\"";
    }
    if (ExpressionTranslator::hasTokens(mapped)) {
        // Literal substitution lets the link base carry ${...} parts
        return "th:href=\"@{|" + escapeExpressionAttribute(ExpressionTranslator::toServerInline(mapped)) + "|}\"";
    }
    return "th:href=\"@{" + StringHelper::escapeHtml(mapped) + "}\"";
}

std::string TargetDialect::navigateHandler(const std::string &route) const {
    const std::string target = escapeExpressionAttribute(StringHelper::escapeSingleQuoted(mapRoute(route)));
    return "onclick=\"window.location.href='" + target + "'\"";
}

std::string TargetDialect::escapeExpressionAttribute(const std::string &expression) {
    std::string result;
    result.reserve(expression.size());
    for (char c : expression) {
        switch (c) {
        case '&':
            result += "&amp;";
            break;
        case '"':
            result += "&quot;";
            break;
        case '<':
            result += "&lt;";
            break;
        default:
            result += c;
        }
    }
    return result;
}

}  // namespace PEX
