#include "model/ExportOptions.h"
#include "common/StringHelper.h"

namespace PEX {

std::string ServerProjectOptions::javaPackage() const {
    std::string suffix = StringHelper::toIdentifier(artifactId);
    if (suffix.empty()) {
        suffix = "site";
    }
    return groupId.empty() ? suffix : groupId + "." + suffix;
}

}  // namespace PEX
