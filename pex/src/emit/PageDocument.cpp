#include "emit/PageDocument.h"
#include "common/StringHelper.h"
#include "emit/BaseAssets.h"
#include "expression/ExpressionTranslator.h"
#include <sstream>

namespace PEX {

namespace {

// Reported as the source of diagnostics about page-level CSS
const std::string GLOBAL_STYLES_ID = "globalStyles";

}  // namespace

std::string PageDocument::customStyles(const GlobalStyles &styles) {
    std::ostringstream out;
    if (!styles.cssVariables.empty()) {
        out << ":root {\n";
        for (const auto &[name, value] : styles.cssVariables) {
            out << "  " << (StringHelper::startsWith(name, "--") ? name : "--" + name) << ": " << value << ";\n";
        }
        out << "}\n";
    }
    if (!StringHelper::trim(styles.customCss).empty()) {
        out << styles.customCss;
        if (styles.customCss.back() != '\n') {
            out << "\n";
        }
    }
    return out.str();
}

std::string PageDocument::renderStatic(const PageDefinition &page, const std::string &content,
                                       const ExportOptions &options, const StaticScope &scope,
                                       Diagnostics &diagnostics) {
    std::ostringstream out;
    out << "<!DOCTYPE html>\n"
        << "<html lang=\"en\">\n"
        << "<head>\n"
        << "  <meta charset=\"UTF-8\">\n"
        << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
        << "  <title>" << StringHelper::escapeHtml(page.pageName) << "</title>\n";

    if (options.includeCss) {
        out << "  <link rel=\"stylesheet\" href=\"css/styles.css\">\n";
    } else {
        out << "  <style>\n" << BaseAssets::stylesheet(ExportTarget::StaticSite) << "  </style>\n";
    }

    const std::string custom = ExpressionTranslator::resolveStatic(customStyles(page.globalStyles), scope,
                                                                   GLOBAL_STYLES_ID, diagnostics);
    if (!custom.empty()) {
        out << "  <style>\n" << custom << "  </style>\n";
    }

    out << "</head>\n"
        << "<body>\n"
        << "  <main class=\"page-content\">\n";
    if (!content.empty()) {
        out << content << "\n";
    }
    out << "  </main>\n";

    if (options.includeJs) {
        out << "  <script src=\"js/main.js\" defer></script>\n";
    } else {
        out << "  <script>\n" << BaseAssets::script(ExportTarget::StaticSite) << "  </script>\n";
    }

    out << "</body>\n"
        << "</html>\n";
    return out.str();
}

std::string PageDocument::renderServer(const PageDefinition &page, const std::string &content) {
    std::ostringstream out;
    out << "<!DOCTYPE html>\n"
        << "<html xmlns:th=\"http://www.thymeleaf.org\" lang=\"en\">\n"
        << "<head>\n"
        << "    <meta charset=\"UTF-8\">\n"
        << "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
        << "    <title th:text=\"${page.title}\">" << StringHelper::escapeHtml(page.pageName) << "</title>\n"
        << "    <meta th:if=\"${page.description}\" name=\"description\" th:content=\"${page.description}\">\n"
        << "    <link rel=\"stylesheet\" th:href=\"@{/css/styles.css}\">\n";

    const std::string custom = ExpressionTranslator::toServerInlinedOutput(customStyles(page.globalStyles));
    if (!custom.empty()) {
        out << "    <style th:inline=\"css\">\n" << custom << "    </style>\n";
    }

    out << "</head>\n"
        << "<body>\n"
        << "    <main class=\"page-content\">\n";
    if (!content.empty()) {
        out << content << "\n";
    }
    out << "    </main>\n"
        << "    <script th:src=\"@{/js/main.js}\" defer></script>\n"
        << "</body>\n"
        << "</html>\n";
    return out.str();
}

}  // namespace PEX
