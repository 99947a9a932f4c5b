#include "expression/ExpressionTranslator.h"
#include <gtest/gtest.h>

using namespace PEX;

class ExpressionTranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        PropMap user = {{"name", "Ada"}, {"age", 36}};
        scope.define("user", PropValue(user));
        scope.define("items", PropValue(PropList{PropValue("a"), PropValue("b")}));
    }

    StaticScope scope;
    Diagnostics diagnostics;
};

TEST_F(ExpressionTranslatorTest, TokenizeSplitsLiteralsAndPaths) {
    auto segments = ExpressionTranslator::tokenize("Hi {{ user.name }}, you are {{user.age}}");
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0], (ExpressionSegment{ExpressionSegment::Kind::Literal, "Hi "}));
    EXPECT_EQ(segments[1], (ExpressionSegment{ExpressionSegment::Kind::Path, "user.name"}));
    EXPECT_EQ(segments[2], (ExpressionSegment{ExpressionSegment::Kind::Literal, ", you are "}));
    EXPECT_EQ(segments[3], (ExpressionSegment{ExpressionSegment::Kind::Path, "user.age"}));
}

TEST_F(ExpressionTranslatorTest, UnclosedAndEmptyTokensStayLiteral) {
    EXPECT_FALSE(ExpressionTranslator::hasTokens("price {{ total"));
    EXPECT_FALSE(ExpressionTranslator::hasTokens("{{}}"));
    EXPECT_FALSE(ExpressionTranslator::hasTokens("plain text"));
    EXPECT_TRUE(ExpressionTranslator::hasTokens("{{a}}"));
}

TEST_F(ExpressionTranslatorTest, BracketPath) {
    EXPECT_EQ(ExpressionTranslator::toBracketPath("item"), "item");
    EXPECT_EQ(ExpressionTranslator::toBracketPath("item.name"), "item['name']");
    EXPECT_EQ(ExpressionTranslator::toBracketPath("item.name.first"), "item['name']['first']");
}

TEST_F(ExpressionTranslatorTest, SingleTokenIsBareExpression) {
    EXPECT_EQ(ExpressionTranslator::toServerExpression("{{a.b}}"), "${a['b']}");
    EXPECT_EQ(ExpressionTranslator::toServerExpression("{{ user.name }}"), "${user['name']}");
}

TEST_F(ExpressionTranslatorTest, NoTokensIsQuotedLiteral) {
    EXPECT_EQ(ExpressionTranslator::toServerExpression("Hello"), "'Hello'");
    EXPECT_EQ(ExpressionTranslator::toServerExpression("It's here"), "'It\\'s here'");
    EXPECT_EQ(ExpressionTranslator::toServerExpression(""), "''");
}

TEST_F(ExpressionTranslatorTest, MixedTextIsConcatenated) {
    EXPECT_EQ(ExpressionTranslator::toServerExpression("Hello {{user.name}}"), "'Hello ' + ${user['name']}");
    EXPECT_EQ(ExpressionTranslator::toServerExpression("Hi {{a.b}}!"), "'Hi ' + ${a['b']} + '!'");
}

TEST_F(ExpressionTranslatorTest, ServerInlineKeepsLiterals) {
    EXPECT_EQ(ExpressionTranslator::toServerInline("/products/{{item.id}}"), "/products/${item['id']}");
}

TEST_F(ExpressionTranslatorTest, ServerOperandKeepsLiteralParts) {
    EXPECT_EQ(ExpressionTranslator::toServerOperand("{{item.photo}}"), "item['photo']");
    EXPECT_EQ(ExpressionTranslator::toServerOperand("https://cdn.example.com/{{item.photo}}"),
              "'https://cdn.example.com/' + item['photo']");
    EXPECT_EQ(ExpressionTranslator::toServerOperand("{{a.dir}}/{{a.file}}?v=1"), "a['dir'] + '/' + a['file'] + '?v=1'");
    EXPECT_EQ(ExpressionTranslator::toServerOperand(""), "''");
}

TEST_F(ExpressionTranslatorTest, ServerInlinedOutputForTemplateText) {
    EXPECT_EQ(ExpressionTranslator::toServerInlinedOutput(".hero{background:{{theme.color}}}"),
              ".hero{background:[(${theme['color']})]}");
    EXPECT_EQ(ExpressionTranslator::toServerInlinedOutput("body { margin: 0; }"), "body { margin: 0; }");
}

TEST_F(ExpressionTranslatorTest, StaticResolutionFromScope) {
    EXPECT_EQ(ExpressionTranslator::resolveStatic("{{user.name}} is {{user.age}}", scope, "c1", diagnostics),
              "Ada is 36");
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ExpressionTranslatorTest, StaticResolutionWarnsAndKeepsLiterals) {
    EXPECT_EQ(ExpressionTranslator::resolveStatic("Hello {{visitor.name}}", scope, "c1", diagnostics), "Hello ");
    ASSERT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
    EXPECT_EQ(diagnostics.getAll()[0].severity, DiagnosticSeverity::Warning);
    EXPECT_EQ(diagnostics.getAll()[0].instanceId, "c1");
}

TEST_F(ExpressionTranslatorTest, StaticResolutionRejectsCollections) {
    EXPECT_EQ(ExpressionTranslator::resolveStatic("{{items}}", scope, "c2", diagnostics), "");
    EXPECT_EQ(diagnostics.count(DiagnosticSeverity::Warning), 1u);

    const PropValue *second = scope.lookup("items.1");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->asString(), "b");
}

TEST_F(ExpressionTranslatorTest, PageScopeIncludesDataSourcesAndRepeaters) {
    PageDefinition page;
    PropMap sources = {{"site", PropValue(PropMap{{"staticData", PropValue(PropMap{{"title", "Shop"}})}})}};
    page.dataContext["dataSources"] = PropValue(sources);
    page.dataContext["owner"] = PropValue(PropMap{{"name", "Lin"}});

    ComponentInstance list;
    list.instanceId = "list1";
    list.componentId = "Repeater";
    DataSourceConfig source;
    source.type = DataSourceType::Static;
    source.staticData = PropValue(PropList{PropValue(PropMap{{"label", "first"}})});
    list.dataSource = source;
    page.components.push_back(list);

    StaticScope pageScope = StaticScope::forPage(page);
    Diagnostics pageDiagnostics;
    EXPECT_EQ(ExpressionTranslator::resolveStatic("{{site.title}} by {{owner.name}}", pageScope, "x", pageDiagnostics),
              "Shop by Lin");
    ASSERT_NE(pageScope.lookup("repeater_list1.0.label"), nullptr);
    EXPECT_EQ(pageScope.lookup("repeater_list1.0.label")->asString(), "first");
}
