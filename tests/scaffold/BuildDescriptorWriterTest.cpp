#include "common/PageBuilders.h"
#include "scaffold/BuildDescriptorWriter.h"
#include <gtest/gtest.h>
#include <libxml++/libxml++.h>

using namespace PEX;
using namespace PEX::Test;

class BuildDescriptorWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.groupId = "com.acme";
        options.artifactId = "shop";
        options.version = "0.3.0";
        options.frameworkVersion = "3.2.5";
        options.runtimeVersion = "17";
    }

    static std::string childText(const xmlpp::Element *parent, const std::string &name) {
        auto *child = dynamic_cast<const xmlpp::Element *>(parent->get_first_child(name));
        if (!child || !child->get_first_child_text()) {
            return "";
        }
        return child->get_first_child_text()->get_content();
    }

    ServerProjectOptions options;
};

TEST_F(BuildDescriptorWriterTest, ProjectCoordinates) {
    auto pom = BuildDescriptorWriter(options).write(false);
    ASSERT_TRUE(pom.has_value());

    xmlpp::DomParser parser;
    parser.parse_memory(*pom);
    ASSERT_TRUE(parser);

    const xmlpp::Element *project = parser.get_document()->get_root_node();
    ASSERT_NE(project, nullptr);
    EXPECT_EQ(project->get_name(), "project");
    EXPECT_EQ(project->get_namespace_uri(), "http://maven.apache.org/POM/4.0.0");
    EXPECT_EQ(childText(project, "modelVersion"), "4.0.0");
    EXPECT_EQ(childText(project, "groupId"), "com.acme");
    EXPECT_EQ(childText(project, "artifactId"), "shop");
    EXPECT_EQ(childText(project, "version"), "0.3.0");
    EXPECT_EQ(childText(project, "packaging"), "jar");

    auto *parent = dynamic_cast<const xmlpp::Element *>(project->get_first_child("parent"));
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(childText(parent, "artifactId"), "spring-boot-starter-parent");
    EXPECT_EQ(childText(parent, "version"), "3.2.5");

    auto *properties = dynamic_cast<const xmlpp::Element *>(project->get_first_child("properties"));
    ASSERT_NE(properties, nullptr);
    EXPECT_EQ(childText(properties, "java.version"), "17");
}

TEST_F(BuildDescriptorWriterTest, DependenciesWithoutLombok) {
    auto pom = BuildDescriptorWriter(options).write(false);
    ASSERT_TRUE(pom.has_value());

    EXPECT_TRUE(contains(*pom, "<artifactId>spring-boot-starter-web</artifactId>"));
    EXPECT_TRUE(contains(*pom, "<artifactId>spring-boot-starter-thymeleaf</artifactId>"));
    EXPECT_TRUE(contains(*pom, "<artifactId>jackson-databind</artifactId>"));
    EXPECT_TRUE(contains(*pom, "<artifactId>spring-boot-maven-plugin</artifactId>"));
    EXPECT_FALSE(contains(*pom, "lombok"));
}

TEST_F(BuildDescriptorWriterTest, LombokIsOptionalAndExcluded) {
    auto pom = BuildDescriptorWriter(options).write(true);
    ASSERT_TRUE(pom.has_value());

    EXPECT_EQ(countOccurrences(*pom, "<artifactId>lombok</artifactId>"), 2u);
    EXPECT_TRUE(contains(*pom, "<optional>true</optional>"));
    EXPECT_TRUE(contains(*pom, "<exclude>"));
}

TEST_F(BuildDescriptorWriterTest, TextIsEscaped) {
    options.projectName = "Tom & Jerry <Shop>";
    auto pom = BuildDescriptorWriter(options).write(false);
    ASSERT_TRUE(pom.has_value());
    EXPECT_TRUE(contains(*pom, "<name>Tom &amp; Jerry &lt;Shop&gt;</name>"));
}
