#pragma once

#include "common/Diagnostics.h"
#include "model/PageDefinition.h"
#include "model/PropValue.h"
#include <map>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief One piece of a templated string: literal text or a {{path}} token
 */
struct ExpressionSegment {
    enum class Kind { Literal, Path };

    Kind kind = Kind::Literal;
    std::string text;  // literal text, or the trimmed dotted path

    bool operator==(const ExpressionSegment &other) const = default;
};

/**
 * @brief Values available to {{path}} tokens when generating static documents
 *
 * The first path segment names a data source (page dataContext entry or
 * repeater_<instanceId> static data); the rest walks into it.
 */
class StaticScope {
public:
    /**
     * @brief Scope holding every data source of @p page
     */
    static StaticScope forPage(const PageDefinition &page);

    void define(const std::string &name, PropValue value);

    /**
     * @brief Resolve a dotted path
     * @return Pointer to the value, nullptr when not defined
     */
    const PropValue *lookup(const std::string &path) const;

    bool empty() const {
        return sources_.empty();
    }

private:
    std::map<std::string, PropValue> sources_;
};

/**
 * @brief Translates {{path}} templated strings for both export targets
 */
class ExpressionTranslator {
public:
    /**
     * @brief Split text into literal and path segments; an unclosed "{{" stays literal
     */
    static std::vector<ExpressionSegment> tokenize(const std::string &text);

    static bool hasTokens(const std::string &text);

    /**
     * @brief item.name.first -> item['name']['first']
     */
    static std::string toBracketPath(const std::string &dottedPath);

    /**
     * @brief Server-side text expression
     *
     * "" -> '', "Hi" -> 'Hi', "{{a.b}}" -> ${a['b']},
     * "Hi {{a.b}}!" -> 'Hi ' + ${a['b']} + '!'
     */
    static std::string toServerExpression(const std::string &text);

    /**
     * @brief Replace every token in place with ${...}, leaving the literal text untouched
     */
    static std::string toServerInline(const std::string &text);

    /**
     * @brief Templated text as an operand of another server expression
     *
     * "{{item.photo}}" -> item['photo'],
     * "https://cdn/{{item.photo}}" -> 'https://cdn/' + item['photo']
     */
    static std::string toServerOperand(const std::string &text);

    /**
     * @brief Replace every token with an unescaped Thymeleaf inlined output, [(${...})]
     *
     * Used for text under th:inline, where a bare ${...} is not evaluated.
     */
    static std::string toServerInlinedOutput(const std::string &text);

    /**
     * @brief Resolve tokens at generation time for static documents
     *
     * Tokens whose path is not in @p scope, or resolves to a list or map, produce no
     * output and an export-constraint warning. Literal text is always kept.
     *
     * @param text Templated text
     * @param scope Generation-time data
     * @param instanceId Component reported in diagnostics
     * @param diagnostics Receives unresolved-token warnings
     * @return The resolved text (unescaped)
     */
    static std::string resolveStatic(const std::string &text, const StaticScope &scope, const std::string &instanceId,
                                     Diagnostics &diagnostics);
};

}  // namespace PEX
