#pragma once

#include "model/ExportOptions.h"
#include <string>

namespace PEX {

/**
 * @brief Per-target rules shared by every emitter
 *
 * The emitters are written once; everything that differs between the static site
 * and the server-rendered project is looked up here.
 */
class TargetDialect {
public:
    static TargetDialect staticSite();
    static TargetDialect serverProject();

    ExportTarget target() const {
        return target_;
    }

    bool isServer() const {
        return target_ == ExportTarget::ServerProject;
    }

    std::string indent(int level) const;

    const std::string &documentExtension() const {
        return documentExtension_;
    }

    /**
     * @brief Link target as the document will reference it
     *
     * Static: "/" and "/home" become index.html, "/about" becomes about.html and
     * nested routes are flattened ("/blog/post" becomes blog-post.html).
     * Server: routes are kept, the framework resolves them. A query or fragment is
     * kept after the mapped path ("/about#team" becomes about.html#team). External
     * links and anchors are never changed. Applying the mapping to its own output is
     * a no-op.
     */
    std::string mapRoute(const std::string &route) const;

    /**
     * @brief Complete link attribute, e.g. href="about.html" or th:href="@{/about}"
     *
     * A server route holding {{path}} tokens becomes th:href="@{|/product/${item['id']}|}".
     */
    std::string hrefAttribute(const std::string &route) const;

    /**
     * @brief Inline click handler for a navigating button, static target only
     */
    std::string navigateHandler(const std::string &route) const;

    /**
     * @brief External URLs (http, https, mailto, tel) and in-page anchors
     */
    static bool isPassThroughLink(const std::string &route);

    /**
     * @brief Escape a server expression for a double-quoted attribute value
     */
    static std::string escapeExpressionAttribute(const std::string &expression);

private:
    TargetDialect(ExportTarget target, std::string indentUnit);

    ExportTarget target_;
    std::string indentUnit_;
    std::string documentExtension_ = ".html";
};

}  // namespace PEX
