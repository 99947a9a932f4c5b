#include "scaffold/BuildDescriptorWriter.h"
#include "common/Logger.h"

namespace PEX {

namespace {

const char *const MAVEN_NAMESPACE = "http://maven.apache.org/POM/4.0.0";
const char *const XSI_NAMESPACE = "http://www.w3.org/2001/XMLSchema-instance";
const char *const MAVEN_SCHEMA_LOCATION = "http://maven.apache.org/POM/4.0.0 https://maven.apache.org/xsd/maven-4.0.0.xsd";

const char *const DATABASE_DEPENDENCIES_COMMENT = R"( Uncomment for database support
        <dependency>
            <groupId>org.springframework.boot</groupId>
            <artifactId>spring-boot-starter-data-jpa</artifactId>
        </dependency>
        <dependency>
            <groupId>com.mysql</groupId>
            <artifactId>mysql-connector-j</artifactId>
            <scope>runtime</scope>
        </dependency>
        )";

}  // namespace

BuildDescriptorWriter::BuildDescriptorWriter(const ServerProjectOptions &options) : options_(options) {}

xmlpp::Element *BuildDescriptorWriter::addTextElement(xmlpp::Element *parent, const std::string &name,
                                                      const std::string &text) {
    xmlpp::Element *element = parent->add_child_element(name);
    element->add_child_text(text);
    return element;
}

void BuildDescriptorWriter::addDependency(xmlpp::Element *dependencies, const std::string &groupId,
                                          const std::string &artifactId) {
    xmlpp::Element *dependency = dependencies->add_child_element("dependency");
    addTextElement(dependency, "groupId", groupId);
    addTextElement(dependency, "artifactId", artifactId);
}

std::optional<std::string> BuildDescriptorWriter::write(bool includeLombok) const {
    try {
        xmlpp::Document document;
        xmlpp::Element *project = document.create_root_node("project", MAVEN_NAMESPACE);
        project->set_namespace_declaration(XSI_NAMESPACE, "xsi");
        project->set_attribute("schemaLocation", MAVEN_SCHEMA_LOCATION, "xsi");

        addTextElement(project, "modelVersion", "4.0.0");

        xmlpp::Element *parent = project->add_child_element("parent");
        addTextElement(parent, "groupId", "org.springframework.boot");
        addTextElement(parent, "artifactId", "spring-boot-starter-parent");
        addTextElement(parent, "version", options_.frameworkVersion);
        parent->add_child_element("relativePath");

        addTextElement(project, "groupId", options_.groupId);
        addTextElement(project, "artifactId", options_.artifactId);
        addTextElement(project, "version", options_.version);
        addTextElement(project, "packaging", "jar");
        addTextElement(project, "name", options_.projectName);
        addTextElement(project, "description", "Server-rendered site generated by pexport");

        xmlpp::Element *properties = project->add_child_element("properties");
        addTextElement(properties, "java.version", options_.runtimeVersion);

        xmlpp::Element *dependencies = project->add_child_element("dependencies");
        addDependency(dependencies, "org.springframework.boot", "spring-boot-starter-web");
        addDependency(dependencies, "org.springframework.boot", "spring-boot-starter-thymeleaf");
        addDependency(dependencies, "com.fasterxml.jackson.core", "jackson-databind");
        if (includeLombok) {
            xmlpp::Element *lombok = dependencies->add_child_element("dependency");
            addTextElement(lombok, "groupId", "org.projectlombok");
            addTextElement(lombok, "artifactId", "lombok");
            addTextElement(lombok, "optional", "true");
        }
        dependencies->add_child_comment(DATABASE_DEPENDENCIES_COMMENT);

        xmlpp::Element *plugin =
            project->add_child_element("build")->add_child_element("plugins")->add_child_element("plugin");
        addTextElement(plugin, "groupId", "org.springframework.boot");
        addTextElement(plugin, "artifactId", "spring-boot-maven-plugin");
        if (includeLombok) {
            xmlpp::Element *exclude = plugin->add_child_element("configuration")
                                          ->add_child_element("excludes")
                                          ->add_child_element("exclude");
            addTextElement(exclude, "groupId", "org.projectlombok");
            addTextElement(exclude, "artifactId", "lombok");
        }

        std::string xml = document.write_to_string_formatted("UTF-8");
        LOG_DEBUG("BuildDescriptorWriter: pom.xml for {}:{} ({} bytes, lombok: {})", options_.groupId,
                  options_.artifactId, xml.size(), includeLombok);
        return xml;

    } catch (const std::exception &e) {
        LOG_ERROR("BuildDescriptorWriter: Failed to build pom.xml: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace PEX
