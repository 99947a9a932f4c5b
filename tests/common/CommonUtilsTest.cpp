#include "common/Diagnostics.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include <gtest/gtest.h>

using namespace PEX;

TEST(StringHelperTest, Escaping) {
    EXPECT_EQ(StringHelper::escapeHtml("<a href=\"x\">Tom's & Jerry</a>"),
              "&lt;a href=&quot;x&quot;&gt;Tom&#39;s &amp; Jerry&lt;/a&gt;");
    EXPECT_EQ(StringHelper::escapeSingleQuoted("it's a\\b"), "it\\'s a\\\\b");
    EXPECT_EQ(StringHelper::escapeJavaString("say \"hi\"\n"), "say \\\"hi\\\"\\n");
}

TEST(StringHelperTest, NameConversions) {
    EXPECT_EQ(StringHelper::toKebabCase("backgroundColor"), "background-color");
    EXPECT_EQ(StringHelper::toPascalCase("team-members"), "TeamMembers");
    EXPECT_EQ(StringHelper::toIdentifier("My-Site 2"), "mysite2");
    EXPECT_EQ(StringHelper::toHyphenated("About Us"), "about-us");
    EXPECT_EQ(StringHelper::toSlug("  Hello,   World!  "), "hello-world");
}

TEST(StringHelperTest, SplitKeepsEmptySegments) {
    EXPECT_EQ(StringHelper::split("a//b/", '/'), (std::vector<std::string>{"a", "", "b", ""}));
    EXPECT_TRUE(StringHelper::split("", '/').empty());
}

TEST(StringHelperTest, Base64) {
    EXPECT_EQ(StringHelper::base64Encode(""), "");
    EXPECT_EQ(StringHelper::base64Encode("f"), "Zg==");
    EXPECT_EQ(StringHelper::base64Encode("fo"), "Zm8=");
    EXPECT_EQ(StringHelper::base64Encode("foo"), "Zm9v");
    EXPECT_EQ(StringHelper::base64Encode(std::string("\xff\x00\x10", 3)), "/wAQ");
}

TEST(DiagnosticsTest, CountsAndMessages) {
    Diagnostics diagnostics;
    diagnostics.info(DiagnosticCategory::AssetNameCollision, "img", "renamed");
    diagnostics.warning(DiagnosticCategory::UnknownComponent, "w", "no emitter");
    diagnostics.error(DiagnosticCategory::TreeInvariant, "", "cycle");

    EXPECT_TRUE(diagnostics.hasErrors());
    EXPECT_EQ(diagnostics.count(DiagnosticSeverity::Warning), 1u);
    EXPECT_EQ(diagnostics.count(DiagnosticCategory::AssetNameCollision), 1u);
    EXPECT_EQ(diagnostics.getWarningMessages(), (std::vector<std::string>{"unknown-component: w: no emitter"}));
    EXPECT_EQ(diagnostics.getErrorMessages(), (std::vector<std::string>{"tree-invariant: cycle"}));

    diagnostics.clear();
    EXPECT_FALSE(diagnostics.hasErrors());
    EXPECT_TRUE(diagnostics.getAll().empty());
}

TEST(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

static std::source_location currentLocation() {
    return std::source_location::current();
}

TEST(LoggerTest, CallerNameDropsSignature) {
    const std::string name = detail::callerName(currentLocation());
    EXPECT_NE(name.find("currentLocation"), std::string::npos);
    EXPECT_EQ(name.find('('), std::string::npos);
}
