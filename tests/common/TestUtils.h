#pragma once

#include <cstdlib>
#include <string>

namespace PEX {
namespace Test {
namespace Utils {

/**
 * @brief Check if running in Docker TSAN environment
 *
 * HTTP tests are skipped there because cpp-httplib server threads do not play
 * well with TSAN instrumentation.
 *
 * @return true if IN_DOCKER_TSAN is set to a truthy value (non-empty, not "0", not "false")
 */
inline bool isInDockerTsan() {
    const char *env = std::getenv("IN_DOCKER_TSAN");
    if (!env) {
        return false;
    }

    std::string value(env);
    return !value.empty() && value != "0" && value != "false";
}

}  // namespace Utils
}  // namespace Test
}  // namespace PEX
