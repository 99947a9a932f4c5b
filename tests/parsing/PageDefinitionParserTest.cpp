#include "parsing/PageDefinitionParser.h"
#include <gtest/gtest.h>

using namespace PEX;

class PageDefinitionParserTest : public ::testing::Test {
protected:
    PageDefinitionParser parser;
};

// Multi-page site document with the editor's full component shape
TEST_F(PageDefinitionParserTest, ParseSiteDocument) {
    const std::string content = R"({
    "siteName": "Acme",
    "pages": [
        {
            "pageName": "Home",
            "routePath": "/",
            "definition": {
                "pageName": "Home",
                "components": [
                    {
                        "instanceId": "root",
                        "componentId": "Container",
                        "category": "layout",
                        "props": {"layoutType": "grid-2col"},
                        "styles": {"padding": 16, "color": "red"},
                        "children": [
                            {
                                "instanceId": "title",
                                "componentId": "Label",
                                "parentId": "root",
                                "props": {"text": "Hello {{user.name}}", "level": 2},
                                "templateBindings": {"text": "user.name"}
                            },
                            {
                                "instanceId": "go",
                                "componentId": "Button",
                                "parentId": "root",
                                "props": {"text": "Contact"},
                                "events": [{"eventType": "onClick", "action": {"type": "navigate", "config": {"route": "/contact"}}}]
                            }
                        ]
                    }
                ],
                "globalStyles": {"customCSS": "body { margin: 0; }", "cssVariables": {"--accent": "#f00"}},
                "dataContext": {"user": {"name": "Ann"}}
            }
        },
        {
            "pageName": "Contact",
            "routePath": "/contact",
            "definition": {"components": []}
        }
    ]
})";

    auto site = parser.parseContent(content);
    ASSERT_TRUE(site.has_value());
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_TRUE(parser.getWarningMessages().empty());

    EXPECT_EQ(site->siteName, "Acme");
    ASSERT_EQ(site->pages.size(), 2u);

    const PageEntry &home = site->pages[0];
    EXPECT_EQ(home.pageName, "Home");
    EXPECT_EQ(home.routePath, "/");
    EXPECT_TRUE(home.isHome());
    ASSERT_EQ(home.definition.components.size(), 1u);

    const ComponentInstance &root = home.definition.components[0];
    EXPECT_EQ(root.componentId, "Container");
    EXPECT_EQ(root.pluginId, "builtin");
    EXPECT_TRUE(root.isLayout());
    EXPECT_EQ(root.styles.at("padding"), "16");
    ASSERT_EQ(root.children.size(), 2u);

    const ComponentInstance &title = root.children[0];
    EXPECT_EQ(title.parentId.value_or(""), "root");
    EXPECT_EQ(Props::getString(title.props, "text"), "Hello {{user.name}}");
    EXPECT_EQ(Props::getString(title.props, "level"), "2");
    EXPECT_EQ(title.templateBindings.at("text"), "user.name");

    EXPECT_EQ(root.children[1].navigationRoute(), "/contact");

    EXPECT_EQ(home.definition.globalStyles.customCss, "body { margin: 0; }");
    EXPECT_EQ(home.definition.globalStyles.cssVariables.at("--accent"), "#f00");
    ASSERT_EQ(home.definition.dataContext.count("user"), 1u);
    EXPECT_EQ(home.definition.dataContext.at("user").findPath("name")->asString(), "Ann");

    EXPECT_EQ(site->pages[1].definition.pageName, "Contact");
    EXPECT_EQ(site->pages[1].effectiveSlug(), "contact");
}

TEST_F(PageDefinitionParserTest, SinglePageBecomesHome) {
    auto site = parser.parseContent(R"({"pageName": "Landing", "components": [{"id": "a", "type": "Label"}]})");
    ASSERT_TRUE(site.has_value());
    ASSERT_EQ(site->pages.size(), 1u);
    EXPECT_EQ(site->siteName, "Landing");
    EXPECT_EQ(site->pages[0].routePath, "/");
    EXPECT_EQ(site->pages[0].definition.components[0].instanceId, "a");
    EXPECT_EQ(site->pages[0].definition.components[0].componentId, "Label");
}

TEST_F(PageDefinitionParserTest, MissingRouteDerivedFromName) {
    auto site = parser.parseContent(R"({"pages": [
        {"pageName": "Home", "definition": {}},
        {"pageName": "About Us", "definition": {}}
    ]})");
    ASSERT_TRUE(site.has_value());
    EXPECT_EQ(site->siteName, "My Site");
    EXPECT_EQ(site->pages[0].routePath, "/");
    EXPECT_EQ(site->pages[1].routePath, "/about-us");
}

TEST_F(PageDefinitionParserTest, ComponentWithoutIdsIsSkipped) {
    auto site = parser.parseContent(R"({"components": [
        {"componentId": "Label"},
        {"instanceId": "ok", "componentId": "Label"}
    ]})");
    ASSERT_TRUE(site.has_value());
    ASSERT_EQ(site->pages[0].definition.components.size(), 1u);
    EXPECT_EQ(site->pages[0].definition.components[0].instanceId, "ok");
    EXPECT_EQ(parser.getWarningMessages().size(), 1u);
}

TEST_F(PageDefinitionParserTest, LegacyEventsInsideProps) {
    auto component = parser.parseComponent([] {
        Json::Value node;
        node["instanceId"] = "b";
        node["componentId"] = "Button";
        Json::Value event;
        event["type"] = "click";
        event["action"]["type"] = "navigate";
        event["action"]["config"]["url"] = "/pricing";
        node["props"]["events"].append(event);
        return node;
    }());
    ASSERT_TRUE(component.has_value());
    EXPECT_EQ(component->navigationRoute(), "/pricing");
}

TEST_F(PageDefinitionParserTest, ApiDataSource) {
    auto site = parser.parseContent(R"({"components": [
        {"instanceId": "list", "componentId": "Repeater",
         "dataSource": {"type": "API", "endpoint": "/api/sample/products", "dataPath": "products"}}
    ]})");
    ASSERT_TRUE(site.has_value());
    const auto &source = site->pages[0].definition.components[0].dataSource;
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source->type, DataSourceType::Api);
    EXPECT_EQ(source->endpoint, "/api/sample/products");
    EXPECT_EQ(source->dataPath, "products");
    EXPECT_EQ(source->method, "GET");
}

TEST_F(PageDefinitionParserTest, StaticDataSourceFeedsRepeaterScope) {
    auto site = parser.parseContent(R"({"components": [
        {"instanceId": "list1", "componentId": "Repeater",
         "dataSource": {"type": "static", "staticData": [{"title": "A"}, {"title": "B"}]}}
    ]})");
    ASSERT_TRUE(site.has_value());
    auto sources = site->pages[0].definition.collectDataSources();
    ASSERT_EQ(sources.count("repeater_list1"), 1u);
    EXPECT_EQ(sources["repeater_list1"].list().size(), 2u);
}

TEST_F(PageDefinitionParserTest, WrongShapesAreWarnings) {
    auto site = parser.parseContent(R"({"components": [
        {"instanceId": "a", "componentId": "Label", "props": "oops", "styles": {"color": ["red"]},
         "dataSource": {"type": "api"}}
    ]})");
    ASSERT_TRUE(site.has_value());
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_EQ(parser.getWarningMessages().size(), 3u);
    EXPECT_TRUE(site->pages[0].definition.components[0].styles.empty());
}

TEST_F(PageDefinitionParserTest, InvalidJsonFails) {
    EXPECT_FALSE(parser.parseContent("{\"pages\": [").has_value());
    EXPECT_TRUE(parser.hasErrors());
}

TEST_F(PageDefinitionParserTest, EmptySiteFails) {
    EXPECT_FALSE(parser.parseContent(R"({"pages": []})").has_value());
    EXPECT_TRUE(parser.hasErrors());

    EXPECT_FALSE(parser.parseContent(R"([1, 2])").has_value());
    EXPECT_TRUE(parser.hasErrors());
}

TEST_F(PageDefinitionParserTest, MissingFileFails) {
    EXPECT_FALSE(parser.parseFile("/nonexistent/pages.json").has_value());
    ASSERT_EQ(parser.getErrorMessages().size(), 1u);
}
