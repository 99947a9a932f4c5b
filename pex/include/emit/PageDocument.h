#pragma once

#include "common/Diagnostics.h"
#include "expression/ExpressionTranslator.h"
#include "model/ExportOptions.h"
#include "model/PageDefinition.h"
#include <string>

namespace PEX {

/**
 * @brief Complete documents around already emitted page content
 */
class PageDocument {
public:
    /**
     * @brief Stand-alone HTML page
     * @param page Page whose name and global styles are used
     * @param content Emitted root components, indented for <main>
     * @param options includeCss / includeJs choose links over inlined base assets
     * @param scope Values for {{path}} tokens in the custom CSS
     * @param diagnostics Receives a warning for every token the scope cannot resolve
     */
    static std::string renderStatic(const PageDefinition &page, const std::string &content,
                                    const ExportOptions &options, const StaticScope &scope, Diagnostics &diagnostics);

    /**
     * @brief Thymeleaf template rendered by the generated PageController
     *
     * Tokens in the custom CSS are inlined as [(${...})] under th:inline="css".
     */
    static std::string renderServer(const PageDefinition &page, const std::string &content);

    /**
     * @brief :root block for the CSS variables followed by the custom CSS, empty when there is neither
     */
    static std::string customStyles(const GlobalStyles &styles);
};

}  // namespace PEX
