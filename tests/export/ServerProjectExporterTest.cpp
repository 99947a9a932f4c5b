#include "common/JsonUtils.h"
#include "common/PageBuilders.h"
#include "export/ServerProjectExporter.h"
#include "mocks/MockAssetFetcher.h"
#include <gtest/gtest.h>

using namespace PEX;
using namespace PEX::Test;
using ::testing::_;
using ::testing::NiceMock;

class ServerProjectExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher.SetupDefaultBehavior();
        options.projectName = "Acme Shop";
        options.groupId = "com.acme";
        options.artifactId = "shop";
    }

    static SiteDocument sampleSite(bool withApi) {
        std::vector<ComponentInstance> roots = {
            makeComponent("greet", "Label", {{"text", "Hello {{user.name}}"}}),
            makeNavigateButton("go", "Contact", "/contact"),
            makeComponent("hero", "Image", {{"src", "https://cdn.example.com/placeholder.svg"}}),
        };
        if (withApi) {
            roots.push_back(makeApiComponent("list", "/api/sample/products", "products"));
        }
        PageEntry home = makePage("Home", "/", roots);
        home.definition.dataContext["user"] = PropValue(PropMap{{"name", PropValue("Ann")}});

        PageEntry contact = makePage("Contact", "/contact", {makeComponent("title", "Label", {{"text", "Write us"}})});
        return makeSite("Acme", {home, contact});
    }

    NiceMock<MockAssetFetcher> fetcher;
    ServerProjectOptions options;
    Diagnostics diagnostics;
};

TEST_F(ServerProjectExporterTest, ProjectLayout) {
    ServerProjectExporter exporter(options, &fetcher);
    auto archive = exporter.exportProject(sampleSite(true), diagnostics);
    ASSERT_TRUE(archive.has_value());

    const std::string java = "src/main/java/com/acme/shop/";
    const std::string resources = "src/main/resources/";
    EXPECT_EQ(archive->paths(), (std::vector<std::string>{
                                    "pom.xml",
                                    java + "Application.java",
                                    java + "controller/PageController.java",
                                    java + "service/PageDataService.java",
                                    java + "service/ImageUrlResolver.java",
                                    java + "controller/ImageProxyController.java",
                                    java + "controller/ApiDataController.java",
                                    java + "service/DataService.java",
                                    resources + "application.properties",
                                    resources + "templates/home.html",
                                    resources + "pages/home.json",
                                    resources + "templates/contact.html",
                                    resources + "pages/contact.json",
                                    resources + "static/css/styles.css",
                                    resources + "static/js/main.js",
                                    resources + "static/images/placeholder.svg",
                                    resources + "static/images/placeholder-2.svg",
                                    "README.md",
                                    "Dockerfile",
                                }));

    EXPECT_TRUE(contains(*archive->find("pom.xml"), "<artifactId>lombok</artifactId>"));
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::AssetNameCollision), 1u);
}

TEST_F(ServerProjectExporterTest, TemplateBindsTokensAtRequestTime) {
    ServerProjectExporter exporter(options, &fetcher);
    auto archive = exporter.exportProject(sampleSite(false), diagnostics);
    ASSERT_TRUE(archive.has_value());

    const std::string &home = *archive->find("src/main/resources/templates/home.html");
    EXPECT_TRUE(contains(home, "<html xmlns:th=\"http://www.thymeleaf.org\" lang=\"en\">"));
    EXPECT_TRUE(contains(home, "th:text=\"'Hello ' + ${user['name']}\""));
    EXPECT_FALSE(contains(home, "Hello Ann"));
    EXPECT_TRUE(contains(home, "th:href=\"@{/contact}\""));
    EXPECT_TRUE(contains(home, "<img src=\"/images/placeholder-2.svg\""));
    EXPECT_TRUE(contains(home, "th:href=\"@{/css/styles.css}\""));

    auto pageData = JsonUtils::parseJson(*archive->find("src/main/resources/pages/home.json"));
    ASSERT_TRUE(pageData.has_value());
    EXPECT_EQ((*pageData)["dataSources"]["user"]["name"].asString(), "Ann");
}

TEST_F(ServerProjectExporterTest, NoEndpointsMeansNoApiClassesOrLombok) {
    ServerProjectExporter exporter(options, &fetcher);
    auto archive = exporter.exportProject(sampleSite(false), diagnostics);
    ASSERT_TRUE(archive.has_value());

    EXPECT_FALSE(archive->contains("src/main/java/com/acme/shop/controller/ApiDataController.java"));
    EXPECT_FALSE(archive->contains("src/main/java/com/acme/shop/service/DataService.java"));
    EXPECT_FALSE(contains(*archive->find("pom.xml"), "lombok"));
}

TEST_F(ServerProjectExporterTest, ControllerRoutesMatchTemplates) {
    ServerProjectExporter exporter(options, nullptr);
    auto archive = exporter.exportProject(sampleSite(false), diagnostics);
    ASSERT_TRUE(archive.has_value());

    const std::string &controller = *archive->find("src/main/java/com/acme/shop/controller/PageController.java");
    EXPECT_TRUE(contains(controller, "return render(\"home\", model);"));
    EXPECT_TRUE(contains(controller, "@GetMapping(\"/contact\")"));
    EXPECT_TRUE(contains(controller, "return render(\"contact\", model);"));
}

TEST_F(ServerProjectExporterTest, WithoutDownloadsImagesStayRemote) {
    ServerProjectExporter exporter(options, nullptr);
    auto archive = exporter.exportProject(sampleSite(false), diagnostics);
    ASSERT_TRUE(archive.has_value());

    EXPECT_TRUE(archive->contains("src/main/resources/static/images/placeholder.svg"));
    EXPECT_FALSE(archive->contains("src/main/resources/static/images/placeholder-2.svg"));
    EXPECT_TRUE(contains(*archive->find("src/main/resources/templates/home.html"),
                         "<img src=\"https://cdn.example.com/placeholder.svg\""));
}

TEST_F(ServerProjectExporterTest, TreeViolationAborts) {
    SiteDocument site = sampleSite(false);
    ComponentInstance looped = makeComponent("loop", "Label");
    looped.parentId = "loop";
    site.pages[0].definition.components.push_back(looped);

    EXPECT_CALL(fetcher, fetch(_)).Times(0);

    ServerProjectExporter exporter(options, &fetcher);
    EXPECT_FALSE(exporter.exportProject(site, diagnostics).has_value());
    EXPECT_TRUE(diagnostics.hasErrors());
}
