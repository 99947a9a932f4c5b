#include "common/FileHelper.h"
#include "common/JsonUtils.h"
#include "config/ExportConfig.h"
#include <filesystem>
#include <gtest/gtest.h>

using namespace PEX;

class ExportConfigTest : public ::testing::Test {
protected:
    Json::Value parse(const std::string &text) {
        auto root = JsonUtils::parseJson(text);
        EXPECT_TRUE(root.has_value());
        return root.value_or(Json::Value());
    }

    ExportConfig config;
    ExportConfigLoader loader;
};

TEST_F(ExportConfigTest, Defaults) {
    EXPECT_EQ(config.target, ExportTarget::StaticSite);
    EXPECT_EQ(config.effectiveOutput(), "site.zip");
    EXPECT_TRUE(config.options.includeCss);
    EXPECT_TRUE(config.options.includeJs);
    EXPECT_EQ(config.project.groupId, "com.example");
}

TEST_F(ExportConfigTest, EffectiveOutput) {
    config.target = ExportTarget::ServerProject;
    config.project.artifactId = "shop";
    EXPECT_EQ(config.effectiveOutput(), "shop.zip");

    config.writeDirectory = true;
    EXPECT_EQ(config.effectiveOutput(), "shop");

    config.output = "out/custom";
    EXPECT_EQ(config.effectiveOutput(), "out/custom");
}

TEST_F(ExportConfigTest, ParseTarget) {
    ExportTarget target = ExportTarget::StaticSite;
    EXPECT_TRUE(ExportConfig::parseTarget("server", target));
    EXPECT_EQ(target, ExportTarget::ServerProject);
    EXPECT_FALSE(ExportConfig::parseTarget("spring", target));
    EXPECT_EQ(target, ExportTarget::ServerProject);
    EXPECT_STREQ(ExportConfig::targetName(ExportTarget::StaticSite), "static");
}

TEST_F(ExportConfigTest, ApplyAllSections) {
    ASSERT_TRUE(loader.apply(parse(R"({
        "target": "server",
        "output": "build/shop.zip",
        "options": {"includeCss": false, "singlePage": true},
        "project": {"projectName": "Shop", "groupId": "org.shop", "artifactId": "shop", "runtimeVersion": "17"},
        "assets": {"baseUrl": "https://cms.example.com", "timeoutMs": 1500},
        "logging": {"directory": "logs", "toFile": true, "level": "Debug"},
        "unknown": 42
    })"),
                             config));

    EXPECT_TRUE(loader.getWarningMessages().empty());
    EXPECT_EQ(config.target, ExportTarget::ServerProject);
    EXPECT_EQ(config.output, "build/shop.zip");
    EXPECT_FALSE(config.options.includeCss);
    EXPECT_TRUE(config.options.includeJs);
    EXPECT_TRUE(config.options.singlePage);
    EXPECT_EQ(config.project.projectName, "Shop");
    EXPECT_EQ(config.project.groupId, "org.shop");
    EXPECT_EQ(config.project.runtimeVersion, "17");
    EXPECT_EQ(config.project.frameworkVersion, "3.2.0");
    EXPECT_EQ(config.assets.baseUrl, "https://cms.example.com");
    EXPECT_EQ(config.assets.timeoutMs, 1500);
    EXPECT_EQ(config.project.imageRepositoryBaseUrl, "https://cms.example.com");
    EXPECT_EQ(config.project.imageRepositoryTimeoutMs, 1500);
    EXPECT_EQ(config.logDirectory, "logs");
    EXPECT_TRUE(config.logToFile);
    EXPECT_EQ(config.logLevel, "Debug");
}

TEST_F(ExportConfigTest, UnknownLogLevelIsIgnored) {
    config.logLevel = "warn";
    ASSERT_TRUE(loader.apply(parse(R"({"logging": {"level": "loud"}})"), config));
    ASSERT_EQ(loader.getWarningMessages().size(), 1u);
    EXPECT_EQ(config.logLevel, "warn");
}

TEST_F(ExportConfigTest, WrongTypesKeepValues) {
    ASSERT_TRUE(loader.apply(parse(R"({
        "target": "spring",
        "writeDirectory": "yes",
        "options": [],
        "assets": {"timeoutMs": "fast"}
    })"),
                             config));

    EXPECT_EQ(loader.getWarningMessages().size(), 4u);
    EXPECT_EQ(config.target, ExportTarget::StaticSite);
    EXPECT_FALSE(config.writeDirectory);
    EXPECT_EQ(config.assets.timeoutMs, 5000);
}

TEST_F(ExportConfigTest, RootMustBeObject) {
    EXPECT_FALSE(loader.apply(parse("[1, 2]"), config));
}

TEST_F(ExportConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "pex_export_config_test.json";
    ASSERT_TRUE(FileHelper::writeFileContent(path.string(), R"({"target": "server", "writeDirectory": true})"));

    EXPECT_TRUE(loader.loadFromFile(path.string(), config));
    EXPECT_EQ(config.target, ExportTarget::ServerProject);
    EXPECT_TRUE(config.writeDirectory);

    std::filesystem::remove(path);
}

TEST_F(ExportConfigTest, LoadFromMissingOrInvalidFile) {
    EXPECT_FALSE(loader.loadFromFile("/nonexistent/pexport.json", config));

    const auto path = std::filesystem::temp_directory_path() / "pex_export_config_invalid.json";
    ASSERT_TRUE(FileHelper::writeFileContent(path.string(), "{ not json"));
    EXPECT_FALSE(loader.loadFromFile(path.string(), config));
    std::filesystem::remove(path);
}
