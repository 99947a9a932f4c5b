#include "emit/TargetDialect.h"
#include <gtest/gtest.h>

using namespace PEX;

class TargetDialectTest : public ::testing::Test {
protected:
    TargetDialect staticSite = TargetDialect::staticSite();
    TargetDialect server = TargetDialect::serverProject();
};

TEST_F(TargetDialectTest, StaticRootAndHomeShareIndex) {
    EXPECT_EQ(staticSite.mapRoute("/"), "index.html");
    EXPECT_EQ(staticSite.mapRoute("/home"), "index.html");
    EXPECT_EQ(staticSite.mapRoute("/"), staticSite.mapRoute("/home"));
}

TEST_F(TargetDialectTest, StaticPagesGetDocumentExtension) {
    EXPECT_EQ(staticSite.mapRoute("/about"), "about.html");
    EXPECT_EQ(staticSite.mapRoute("contact"), "contact.html");
    EXPECT_EQ(staticSite.mapRoute("/team/"), "team.html");
    EXPECT_EQ(staticSite.mapRoute("/blog/first-post"), "blog-first-post.html");
    EXPECT_EQ(staticSite.mapRoute(""), "#");
}

TEST_F(TargetDialectTest, StaticQueryAndFragmentFollowThePage) {
    EXPECT_EQ(staticSite.mapRoute("/about#team"), "about.html#team");
    EXPECT_EQ(staticSite.mapRoute("/shop?sort=price"), "shop.html?sort=price");
    EXPECT_EQ(staticSite.mapRoute("/blog/post/?page=2#comments"), "blog-post.html?page=2#comments");
    EXPECT_EQ(staticSite.mapRoute("/#pricing"), "index.html#pricing");
    EXPECT_EQ(staticSite.mapRoute("/home/"), "index.html");
    EXPECT_EQ(staticSite.mapRoute("/home?ref=nav"), "index.html?ref=nav");
}

TEST_F(TargetDialectTest, ServerQueryAndFragmentKept) {
    EXPECT_EQ(server.mapRoute("about#team"), "/about#team");
    EXPECT_EQ(server.mapRoute("/shop/?sort=price"), "/shop?sort=price");
    EXPECT_EQ(server.mapRoute("home/"), "/");
}

TEST_F(TargetDialectTest, MappingIsIdempotent) {
    for (const std::string route : {"/", "/home", "/about", "pricing", "/blog/first-post", "#top", "/about#team",
                                    "/shop?sort=price", "https://example.com/x", "mailto:hi@example.com"}) {
        const std::string once = staticSite.mapRoute(route);
        EXPECT_EQ(staticSite.mapRoute(once), once) << route;

        const std::string serverOnce = server.mapRoute(route);
        EXPECT_EQ(server.mapRoute(serverOnce), serverOnce) << route;
    }
}

TEST_F(TargetDialectTest, ExternalLinksAndAnchorsUnchanged) {
    for (const std::string link : {"#features", "http://a.com", "https://b.com/c?d=e", "mailto:x@y.z", "tel:+123"}) {
        EXPECT_EQ(staticSite.mapRoute(link), link);
        EXPECT_EQ(server.mapRoute(link), link);
        EXPECT_TRUE(TargetDialect::isPassThroughLink(link));
    }
}

TEST_F(TargetDialectTest, ServerKeepsRoutes) {
    EXPECT_EQ(server.mapRoute("/contact"), "/contact");
    EXPECT_EQ(server.mapRoute("contact"), "/contact");
    EXPECT_EQ(server.mapRoute("home"), "/");
}

TEST_F(TargetDialectTest, HrefAttributes) {
    EXPECT_EQ(staticSite.hrefAttribute("/about"), "href=\"about.html\"");
    EXPECT_EQ(server.hrefAttribute("/about"), "th:href=\"@{/about}\"");
    EXPECT_EQ(server.hrefAttribute("https://example.com"), "href=\"https://example.com\"");
}

TEST_F(TargetDialectTest, ServerHrefWithTokensUsesLiteralSubstitution) {
    EXPECT_EQ(server.hrefAttribute("/product/{{item.id}}"), "th:href=\"@{|/product/${item['id']}|}\"");
    EXPECT_EQ(server.hrefAttribute("/category/{{cat.slug}}?tab=1"),
              "th:href=\"@{|/category/${cat['slug']}?tab=1|}\"");
}

TEST_F(TargetDialectTest, NavigateHandler) {
    EXPECT_EQ(staticSite.navigateHandler("/contact"), "onclick=\"window.location.href='contact.html'\"");
}

TEST_F(TargetDialectTest, IndentUnits) {
    EXPECT_EQ(staticSite.indent(2), "    ");
    EXPECT_EQ(server.indent(1), "    ");
    EXPECT_EQ(server.indent(0), "");
}

TEST_F(TargetDialectTest, ExpressionAttributeEscaping) {
    EXPECT_EQ(TargetDialect::escapeExpressionAttribute("'a' + ${b[\"c\"]} & <d>"),
              "'a' + ${b[&quot;c&quot;]} &amp; &lt;d>");
}
