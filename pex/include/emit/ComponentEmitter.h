#pragma once

#include "common/Diagnostics.h"
#include "emit/IEmitterRegistry.h"
#include "emit/TargetDialect.h"
#include "expression/ExpressionTranslator.h"
#include "model/ComponentInstance.h"
#include <optional>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Turns component trees into markup for one export target
 *
 * Walks the tree depth-first, pre-order. Plugin emitters from the registry are
 * tried first, then the built-in kinds, then a generic element that wraps children
 * or echoes text. Literal text and attribute values are escaped; rich text is not.
 *
 * The emitter keeps references to the dialect, scope and diagnostics it was built
 * with; it is meant to live for the rendering of one page.
 */
class ComponentEmitter {
public:
    /**
     * @param dialect Target rules
     * @param scope Generation-time data used to resolve {{path}} tokens for static documents
     * @param diagnostics Receives warnings about the page
     * @param registry Optional plugin emitters, not owned
     */
    ComponentEmitter(const TargetDialect &dialect, const StaticScope &scope, Diagnostics &diagnostics,
                     const IEmitterRegistry *registry = nullptr);

    /**
     * @brief Markup of one component and its subtree
     * @param component Component to emit
     * @param depth Nesting depth, 0 for page roots
     * @param indentLevel Indentation of the first line, in dialect units
     */
    std::string emit(const ComponentInstance &component, int depth, int indentLevel) const;

    /**
     * @brief Page roots in order, separated by a blank line
     */
    std::string emitRoots(const std::vector<ComponentInstance> &roots, int indentLevel) const;

    static bool isBuiltinKind(const std::string &kind);
    static bool isNavbarKind(const std::string &kind);

    /**
     * @brief Element id used for a component in the markup (component-<instanceId>)
     */
    static std::string elementId(const ComponentInstance &component);

private:
    // Text body plus the server attribute that replaces it at render time
    struct BoundText {
        std::string attribute;
        std::string body;
    };

    std::optional<std::string> emitPlugin(const ComponentInstance &component, int depth, int indentLevel) const;
    std::string emitBuiltin(const ComponentInstance &component, int depth, int indentLevel) const;

    std::string emitLabel(const ComponentInstance &component, int indentLevel) const;
    std::string emitButton(const ComponentInstance &component, int indentLevel) const;
    std::string emitImage(const ComponentInstance &component, int depth, int indentLevel) const;
    std::string emitTextbox(const ComponentInstance &component, int indentLevel) const;
    std::string emitContainer(const ComponentInstance &component, int depth, int indentLevel) const;
    std::string emitNavbar(const ComponentInstance &component, int indentLevel) const;
    std::string emitGeneric(const ComponentInstance &component, int depth, int indentLevel) const;

    /**
     * @brief Children one level deeper, joined by newlines; layout children of a container get a sizing wrapper
     */
    std::string emitChildren(const ComponentInstance &parent, int depth, int indentLevel, bool wrapLayoutChildren) const;

    /**
     * @brief Apply the expression rule to literal text: th:text on the server, resolved at generation time otherwise
     */
    BoundText bindLiteral(const ComponentInstance &component, const std::string &text, bool raw) const;

    /**
     * @brief Apply the expression rule to a text prop and its template binding
     * @param raw Leave the body unescaped (rich text)
     */
    BoundText bindText(const ComponentInstance &component, const std::string &text, const std::string &bindingKey,
                       bool raw) const;

    /**
     * @brief Resolve every token of @p text at generation time, or std::nullopt when any is missing
     */
    std::optional<std::string> resolveFully(const std::string &text) const;

    /**
     * @brief Attribute whose value may hold tokens: th:<name> on the server, resolved for static documents
     */
    std::string textAttribute(const ComponentInstance &component, const std::string &name,
                              const std::string &value) const;

    /**
     * @brief Route with its tokens resolved for static documents
     *
     * A route that cannot be fully resolved is reported and becomes "#". Server
     * routes are returned unchanged; the dialect binds their tokens.
     */
    std::string linkRoute(const ComponentInstance &component, const std::string &route) const;

    std::string sourceAttribute(const ComponentInstance &component, const std::string &src,
                                const std::string &binding) const;
    std::string imageSourceAttribute(const ComponentInstance &component) const;
    std::string imageAltAttribute(const ComponentInstance &component) const;
    std::string plainSourceAttribute(const std::string &url) const;

    PropList navigationItems(const ComponentInstance &component) const;

    const TargetDialect &dialect_;
    const StaticScope &scope_;
    Diagnostics &diagnostics_;
    const IEmitterRegistry *registry_;
};

}  // namespace PEX
