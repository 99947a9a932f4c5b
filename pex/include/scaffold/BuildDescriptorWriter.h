#pragma once

#include "model/ExportOptions.h"
#include <libxml++/libxml++.h>
#include <optional>
#include <string>

namespace PEX {

/**
 * @brief Maven pom.xml of the generated project, built as an XML document
 */
class BuildDescriptorWriter {
public:
    explicit BuildDescriptorWriter(const ServerProjectOptions &options);

    /**
     * @brief Serialized pom.xml
     * @param includeLombok Add Lombok and exclude it from the repackaged jar
     * @return The document, or std::nullopt when serialization failed (logged)
     */
    std::optional<std::string> write(bool includeLombok) const;

private:
    static xmlpp::Element *addTextElement(xmlpp::Element *parent, const std::string &name, const std::string &text);
    static void addDependency(xmlpp::Element *dependencies, const std::string &groupId, const std::string &artifactId);

    ServerProjectOptions options_;
};

}  // namespace PEX
