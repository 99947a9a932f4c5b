#include "expression/ExpressionTranslator.h"
#include "common/Logger.h"
#include "common/StringHelper.h"

namespace PEX {

StaticScope StaticScope::forPage(const PageDefinition &page) {
    StaticScope scope;
    for (auto &[name, value] : page.collectDataSources()) {
        scope.define(name, value);
    }
    return scope;
}

void StaticScope::define(const std::string &name, PropValue value) {
    sources_[name] = std::move(value);
}

const PropValue *StaticScope::lookup(const std::string &path) const {
    const size_t dot = path.find('.');
    const std::string head = path.substr(0, dot);

    auto it = sources_.find(head);
    if (it == sources_.end()) {
        return nullptr;
    }
    if (dot == std::string::npos) {
        return &it->second;
    }
    return it->second.findPath(path.substr(dot + 1));
}

std::vector<ExpressionSegment> ExpressionTranslator::tokenize(const std::string &text) {
    std::vector<ExpressionSegment> segments;
    std::string literal;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos) {
            literal += text.substr(pos);
            break;
        }
        size_t close = text.find("}}", open + 2);
        if (close == std::string::npos) {
            literal += text.substr(pos);
            break;
        }

        std::string path = StringHelper::trim(text.substr(open + 2, close - open - 2));
        if (path.empty() || path.find('{') != std::string::npos) {
            // "{{}}" or a nested brace is not a token
            literal += text.substr(pos, close + 2 - pos);
            pos = close + 2;
            continue;
        }

        literal += text.substr(pos, open - pos);
        if (!literal.empty()) {
            segments.push_back({ExpressionSegment::Kind::Literal, literal});
            literal.clear();
        }
        segments.push_back({ExpressionSegment::Kind::Path, path});
        pos = close + 2;
    }

    if (!literal.empty()) {
        segments.push_back({ExpressionSegment::Kind::Literal, literal});
    }
    return segments;
}

bool ExpressionTranslator::hasTokens(const std::string &text) {
    for (const auto &segment : tokenize(text)) {
        if (segment.kind == ExpressionSegment::Kind::Path) {
            return true;
        }
    }
    return false;
}

std::string ExpressionTranslator::toBracketPath(const std::string &dottedPath) {
    std::vector<std::string> parts = StringHelper::split(dottedPath, '.');
    if (parts.size() <= 1) {
        return dottedPath;
    }

    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += "['" + StringHelper::escapeSingleQuoted(parts[i]) + "']";
    }
    return result;
}

std::string ExpressionTranslator::toServerExpression(const std::string &text) {
    if (text.empty()) {
        return "''";
    }

    std::vector<ExpressionSegment> segments = tokenize(text);
    if (segments.size() == 1 && segments[0].kind == ExpressionSegment::Kind::Path) {
        return "${" + toBracketPath(segments[0].text) + "}";
    }

    std::string expression;
    for (const auto &segment : segments) {
        if (!expression.empty()) {
            expression += " + ";
        }
        if (segment.kind == ExpressionSegment::Kind::Literal) {
            expression += "'" + StringHelper::escapeSingleQuoted(segment.text) + "'";
        } else {
            expression += "${" + toBracketPath(segment.text) + "}";
        }
    }
    return expression;
}

std::string ExpressionTranslator::toServerInline(const std::string &text) {
    std::string result;
    for (const auto &segment : tokenize(text)) {
        if (segment.kind == ExpressionSegment::Kind::Literal) {
            result += segment.text;
        } else {
            result += "${" + toBracketPath(segment.text) + "}";
        }
    }
    return result;
}

std::string ExpressionTranslator::toServerOperand(const std::string &text) {
    std::vector<ExpressionSegment> segments = tokenize(text);
    if (segments.empty()) {
        return "''";
    }

    std::string operand;
    for (const auto &segment : segments) {
        if (!operand.empty()) {
            operand += " + ";
        }
        if (segment.kind == ExpressionSegment::Kind::Literal) {
            operand += "'" + StringHelper::escapeSingleQuoted(segment.text) + "'";
        } else {
            operand += toBracketPath(segment.text);
        }
    }
    return operand;
}

std::string ExpressionTranslator::toServerInlinedOutput(const std::string &text) {
    std::string result;
    for (const auto &segment : tokenize(text)) {
        if (segment.kind == ExpressionSegment::Kind::Literal) {
            result += segment.text;
        } else {
            result += "[(${" + toBracketPath(segment.text) + "})]";
        }
    }
    return result;
}

std::string ExpressionTranslator::resolveStatic(const std::string &text, const StaticScope &scope,
                                                const std::string &instanceId, Diagnostics &diagnostics) {
    std::string result;
    for (const auto &segment : tokenize(text)) {
        if (segment.kind == ExpressionSegment::Kind::Literal) {
            result += segment.text;
            continue;
        }

        const PropValue *value = scope.lookup(segment.text);
        if (value && !value->isList() && !value->isMap() && !value->isNull()) {
            result += value->asString();
            continue;
        }

        diagnostics.warning(DiagnosticCategory::ExportConstraint, instanceId,
                            "'{{" + segment.text + "}}' has no static value; static pages cannot bind data at runtime");
    }
    return result;
}

}  // namespace PEX
