#include "common/PageBuilders.h"
#include "emit/BaseAssets.h"
#include "emit/ComponentEmitter.h"
#include "emit/EmitterRegistry.h"
#include "mocks/MockEmitterRegistry.h"
#include <gtest/gtest.h>

using namespace PEX;
using namespace PEX::Test;
using ::testing::_;
using ::testing::Return;

class ComponentEmitterTest : public ::testing::Test {
protected:
    std::string emitStatic(const ComponentInstance &component, const IEmitterRegistry *registry = nullptr) {
        ComponentEmitter emitter(staticSite, scope, diagnostics, registry);
        return emitter.emit(component, 0, 0);
    }

    std::string emitServer(const ComponentInstance &component, const IEmitterRegistry *registry = nullptr) {
        ComponentEmitter emitter(server, scope, diagnostics, registry);
        return emitter.emit(component, 0, 0);
    }

    TargetDialect staticSite = TargetDialect::staticSite();
    TargetDialect server = TargetDialect::serverProject();
    StaticScope scope;
    Diagnostics diagnostics;
};

TEST_F(ComponentEmitterTest, LabelVariantChoosesTag) {
    EXPECT_TRUE(contains(emitStatic(makeComponent("t", "Label", {{"text", "Title"}, {"variant", "h2"}})),
                         "<h2 id=\"component-t\" class=\"component label\">Title</h2>"));
    EXPECT_TRUE(contains(emitStatic(makeComponent("t", "Label", {{"text", "Body"}, {"variant", "paragraph"}})),
                         "<p id=\"component-t\""));
    EXPECT_TRUE(contains(emitStatic(makeComponent("t", "Label", {{"text", "x"}, {"variant", "banner"}})),
                         "<span id=\"component-t\""));
}

TEST_F(ComponentEmitterTest, LiteralTextIsEscaped) {
    const std::string markup = emitStatic(makeComponent("t", "Label", {{"text", "<b>Fish & Chips</b>"}}));
    EXPECT_TRUE(contains(markup, "&lt;b&gt;Fish &amp; Chips&lt;/b&gt;"));
}

TEST_F(ComponentEmitterTest, StaticTokenWarnsAndKeepsLiteralText) {
    const std::string markup = emitStatic(makeComponent("t", "Label", {{"text", "Hello {{user.name}}"}}));
    EXPECT_TRUE(contains(markup, ">Hello </span>"));
    EXPECT_FALSE(contains(markup, "{{"));
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
}

TEST_F(ComponentEmitterTest, StaticTokenResolvedFromScope) {
    scope.define("user", PropValue(PropMap{{"name", "Ada"}}));
    const std::string markup = emitStatic(makeComponent("t", "Label", {{"text", "Hello {{user.name}}"}}));
    EXPECT_TRUE(contains(markup, ">Hello Ada</span>"));
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ComponentEmitterTest, ServerTokenBecomesTextAttribute) {
    const std::string markup = emitServer(makeComponent("t", "Label", {{"text", "Hello {{user.name}}"}}));
    EXPECT_TRUE(contains(markup, "th:text=\"'Hello ' + ${user['name']}\""));
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ComponentEmitterTest, TemplateBindingOnServer) {
    ComponentInstance label = makeComponent("t", "Label", {{"text", "Placeholder"}});
    label.templateBindings["text"] = "product.title";
    EXPECT_TRUE(contains(emitServer(label), "th:text=\"${product['title']}\">Placeholder</span>"));

    EXPECT_TRUE(contains(emitStatic(label), ">Placeholder</span>"));
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
}

TEST_F(ComponentEmitterTest, StaticNavigateButton) {
    const std::string markup = emitStatic(makeNavigateButton("b", "Contact us", "/contact"));
    EXPECT_TRUE(contains(markup, "<button id=\"component-b\" class=\"component button btn-primary btn-medium\""));
    EXPECT_TRUE(contains(markup, "onclick=\"window.location.href='contact.html'\""));
    EXPECT_TRUE(contains(markup, ">Contact us</button>"));
}

TEST_F(ComponentEmitterTest, ServerNavigateButtonIsLink) {
    const std::string markup = emitServer(makeNavigateButton("b", "Contact us", "/contact"));
    EXPECT_TRUE(contains(markup, "<a id=\"component-b\""));
    EXPECT_TRUE(contains(markup, "role=\"button\" th:href=\"@{/contact}\""));
    EXPECT_TRUE(contains(markup, ">Contact us</a>"));
}

TEST_F(ComponentEmitterTest, StaticNavigateRouteWithUnknownTokenWarns) {
    const std::string markup = emitStatic(makeNavigateButton("b", "Go", "/product/{{item.id}}"));
    EXPECT_FALSE(contains(markup, "{{"));
    EXPECT_TRUE(contains(markup, "onclick=\"window.location.href='#'\""));
    ASSERT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
    EXPECT_EQ(diagnostics.getAll()[0].instanceId, "b");
}

TEST_F(ComponentEmitterTest, StaticNavigateRouteResolvedFromScope) {
    scope.define("item", PropValue(PropMap{{"id", "shoes"}}));
    const std::string markup = emitStatic(makeNavigateButton("b", "Go", "/product/{{item.id}}"));
    EXPECT_TRUE(contains(markup, "onclick=\"window.location.href='product-shoes.html'\""));
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ComponentEmitterTest, ServerNavigateRouteBindsTokens) {
    const std::string markup = emitServer(makeNavigateButton("b", "Go", "/product/{{item.id}}"));
    EXPECT_TRUE(contains(markup, "th:href=\"@{|/product/${item['id']}|}\""));
    EXPECT_FALSE(contains(markup, "{{item.id}}"));
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ComponentEmitterTest, DisabledButtonHasNoHandler) {
    ComponentInstance button = makeNavigateButton("b", "Soon", "/later");
    button.props["disabled"] = true;
    for (const std::string &markup : {emitStatic(button), emitServer(button)}) {
        EXPECT_TRUE(contains(markup, "<button"));
        EXPECT_TRUE(contains(markup, " disabled"));
        EXPECT_FALSE(contains(markup, "onclick"));
    }
}

TEST_F(ComponentEmitterTest, ImageStructure) {
    ComponentInstance image = makeComponent("img", "Image", {{"src", "https://example.com/a.png"}, {"alt", "A"}});
    const std::string markup = emitStatic(image);

    EXPECT_TRUE(contains(markup, "<div id=\"component-img\" class=\"component image-container\""));
    EXPECT_TRUE(contains(markup, "<div class=\"image-wrapper\""));
    EXPECT_TRUE(contains(markup, "<img src=\"https://example.com/a.png\" alt=\"A\""));
    EXPECT_TRUE(contains(markup, "loading=\"lazy\""));
}

TEST_F(ComponentEmitterTest, DynamicImageUsesResolverOnServer) {
    ComponentInstance image = makeComponent("img", "Image", {{"src", "{{item.photo}}"}});
    EXPECT_TRUE(contains(emitServer(image), "th:src=\"${@imageUrlResolver.resolve(item['photo'])}\""));
}

TEST_F(ComponentEmitterTest, DynamicImageOnServerKeepsLiteralParts) {
    ComponentInstance image = makeComponent("img", "Image", {{"src", "https://cdn.example.com/{{item.photo}}"}});
    EXPECT_TRUE(contains(emitServer(image),
                         "th:src=\"${@imageUrlResolver.resolve('https://cdn.example.com/' + item['photo'])}\""));
}

TEST_F(ComponentEmitterTest, DynamicImageInStaticDocumentGetsPlaceholder) {
    ComponentInstance image = makeComponent("img", "Image", {{"src", "{{item.photo}}"}});
    const std::string markup = emitStatic(image);
    EXPECT_TRUE(contains(markup, "<img src=\"" + BaseAssets::brokenImageDataUrl() + "\""));
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
}

TEST_F(ComponentEmitterTest, RootRelativeImageOnServer) {
    ComponentInstance image = makeComponent("img", "Image", {{"src", "/uploads/logo.png"}});
    EXPECT_TRUE(contains(emitServer(image), "<img th:src=\"@{/uploads/logo.png}\""));
}

TEST_F(ComponentEmitterTest, TextboxIsRichText) {
    const std::string markup = emitStatic(makeComponent("tb", "Textbox", {{"content", "<p>Rich <em>text</em></p>"}}));
    EXPECT_TRUE(contains(markup, "class=\"component textbox\"><p>Rich <em>text</em></p></div>"));
}

TEST_F(ComponentEmitterTest, GridContainerWithChildren) {
    ComponentInstance grid = makeContainer(
        "grid", "grid-2col",
        {makeComponent("l1", "Label", {{"text", "One"}}), makeComponent("l2", "Label", {{"text", "Two"}})});

    const std::string markup = emitStatic(grid);
    EXPECT_TRUE(contains(markup, "class=\"component container\""));
    EXPECT_TRUE(contains(markup, "display: grid; grid-template-columns: repeat(2, 1fr)"));
    EXPECT_TRUE(contains(markup, "\n  <span id=\"component-l1\""));
    EXPECT_TRUE(contains(markup, "\n  <span id=\"component-l2\""));
    EXPECT_LT(markup.find("component-l1"), markup.find("component-l2"));
}

TEST_F(ComponentEmitterTest, LayoutChildrenAreWrapped) {
    ComponentInstance row = makeContainer("row", "flex-row", {makeContainer("col", "flex-column")});
    const std::string markup = emitStatic(row);
    EXPECT_TRUE(contains(markup, "\n  <div style=\"flex: 1\">\n    <div id=\"component-col\""));
}

TEST_F(ComponentEmitterTest, ScrollableContainerClass) {
    EXPECT_TRUE(contains(emitStatic(makeComponent("s", "ScrollableContainer")),
                         "class=\"component container scrollable-container\""));
}

TEST_F(ComponentEmitterTest, NavbarItemsFromJsonString) {
    ComponentInstance navbar = makeComponent(
        "nav", "NavbarDefault",
        {{"brandText", "Acme"},
         {"navItems", R"([{"label":"Home","href":"/","active":true},{"label":"About","href":"/about"}])"}});

    const std::string staticMarkup = emitStatic(navbar);
    EXPECT_TRUE(contains(staticMarkup, "<span>Acme</span>"));
    EXPECT_TRUE(contains(staticMarkup, "href=\"index.html\""));
    EXPECT_TRUE(contains(staticMarkup, "href=\"about.html\""));
    EXPECT_EQ(countOccurrences(staticMarkup, "<li "), 2u);

    const std::string serverMarkup = emitServer(navbar);
    EXPECT_TRUE(contains(serverMarkup, "th:href=\"@{/about}\""));
}

TEST_F(ComponentEmitterTest, StaticNavbarTokensAreResolvedOrReported) {
    scope.define("site", PropValue(PropMap{{"name", "Acme"}}));
    ComponentInstance navbar = makeComponent(
        "nav", "Navbar",
        {{"brandText", "{{site.name}}"},
         {"navItems", R"([{"label":"{{menu.first}}","href":"/about"},{"label":"Shop","href":"/c/{{cat.slug}}"}])"}});

    const std::string markup = emitStatic(navbar);
    EXPECT_TRUE(contains(markup, "<span>Acme</span>"));
    EXPECT_TRUE(contains(markup, "href=\"about.html\""));
    EXPECT_TRUE(contains(markup, "href=\"#\""));
    EXPECT_TRUE(contains(markup, ">Shop</a>"));
    EXPECT_FALSE(contains(markup, "{{"));
    // {{menu.first}} in a label, {{cat.slug}} in a link
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 2u);
}

TEST_F(ComponentEmitterTest, StaticNavbarBrandTokenWarnsOnce) {
    ComponentInstance navbar =
        makeComponent("nav", "Navbar", {{"brandText", "{{site.name}}"}, {"brandImageUrl", "/logo.png"}});
    const std::string markup = emitStatic(navbar);
    EXPECT_TRUE(contains(markup, "<img src=\"/logo.png\" alt=\"\""));
    EXPECT_TRUE(contains(markup, "<span></span>"));
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::ExportConstraint), 1u);
}

TEST_F(ComponentEmitterTest, ServerNavbarTokensBecomeThymeleaf) {
    ComponentInstance navbar = makeComponent(
        "nav", "Navbar",
        {{"brandText", "{{site.name}}"},
         {"brandImageUrl", "/logo.png"},
         {"navItems", R"([{"label":"{{menu.first}}","href":"/c/{{cat.slug}}"}])"}});

    const std::string markup = emitServer(navbar);
    EXPECT_TRUE(contains(markup, "<span th:text=\"${site['name']}\">{{site.name}}</span>"));
    EXPECT_TRUE(contains(markup, "th:alt=\"${site['name']}\""));
    EXPECT_TRUE(contains(markup, "th:href=\"@{|/c/${cat['slug']}|}\""));
    EXPECT_TRUE(contains(markup, "th:text=\"${menu['first']}\">{{menu.first}}</a>"));
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST_F(ComponentEmitterTest, NavbarWithBadItemsWarns) {
    ComponentInstance navbar = makeComponent("nav", "Navbar", {{"navItems", "[not json"}});
    const std::string markup = emitStatic(navbar);
    EXPECT_EQ(countOccurrences(markup, "<li "), 0u);
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::MalformedInput), 1u);
}

TEST_F(ComponentEmitterTest, UnknownKindUsesGenericEmitter) {
    ComponentInstance chart = makeComponent("c", "PieChart", {{"text", "Sales"}});
    const std::string markup = emitStatic(chart);
    EXPECT_EQ(markup, "<div id=\"component-c\" class=\"component piechart\">Sales</div>");
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::UnknownComponent), 1u);
    EXPECT_EQ(diagnostics.count(DiagnosticSeverity::Error), 0u);
}

TEST_F(ComponentEmitterTest, PluginEmitterIsTriedFirst) {
    MockEmitterRegistry registry;
    ComponentInstance card = makeComponent("card", "ProductCard");
    card.pluginId = "shop-plugin";

    EXPECT_CALL(registry, has("ProductCard", "shop-plugin")).WillOnce(Return(true));
    EXPECT_CALL(registry, render("ProductCard", "shop-plugin", _, "", ExportTarget::StaticSite))
        .WillOnce(Return(std::optional<std::string>("<article>Card</article>")));

    EXPECT_EQ(emitStatic(card, &registry),
              "<div id=\"component-card\" class=\"component productcard\"><article>Card</article></div>");
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::UnknownComponent), 0u);
}

TEST_F(ComponentEmitterTest, PluginReturningNothingFallsBack) {
    MockEmitterRegistry registry;
    ComponentInstance label = makeComponent("t", "Label", {{"text", "Hi"}});

    EXPECT_CALL(registry, has("Label", "builtin")).WillOnce(Return(true));
    EXPECT_CALL(registry, render(_, _, _, _, _)).WillOnce(Return(std::nullopt));

    EXPECT_TRUE(contains(emitServer(label, &registry), "class=\"component label\">Hi</span>"));
}

TEST_F(ComponentEmitterTest, EmitterRegistryLookup) {
    EmitterRegistry registry;
    registry.registerEmitter("charts", "Gauge",
                             [](const ComponentInstance &component, const std::string &, ExportTarget target) {
                                 return std::optional<std::string>(
                                     target == ExportTarget::ServerProject ? "server" : component.instanceId);
                             });

    ComponentInstance gauge = makeComponent("g1", "Gauge");
    gauge.pluginId = "charts";
    EXPECT_TRUE(registry.has("Gauge", "charts"));
    EXPECT_FALSE(registry.has("Gauge", "other"));
    EXPECT_TRUE(contains(emitStatic(gauge, &registry), ">g1</div>"));
    EXPECT_TRUE(contains(emitServer(gauge, &registry), ">server</div>"));

    EXPECT_TRUE(registry.unregisterEmitter("charts", "Gauge"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ComponentEmitterTest, RootsSeparatedByBlankLine) {
    ComponentEmitter emitter(staticSite, scope, diagnostics);
    const std::string markup = emitter.emitRoots(
        {makeComponent("a", "Label", {{"text", "A"}}), makeComponent("b", "Label", {{"text", "B"}})}, 1);
    EXPECT_EQ(markup, "  <span id=\"component-a\" class=\"component label\">A</span>\n\n"
                      "  <span id=\"component-b\" class=\"component label\">B</span>");
}
