#pragma once

#include <string>

namespace PEX {

enum class ExportTarget { StaticSite, ServerProject };

/**
 * @brief Switches for the static site target
 */
struct ExportOptions {
    bool includeCss = true;  // external css/styles.css instead of an inline <style>
    bool includeJs = true;   // external js/main.js instead of an inline <script>
    bool minify = false;     // reserved, accepted and ignored
    bool singlePage = false;
};

/**
 * @brief Identity of the generated server-rendered project
 */
struct ServerProjectOptions {
    std::string projectName = "my-site";
    std::string groupId = "com.example";
    std::string artifactId = "my-site";
    std::string version = "1.0.0";
    std::string frameworkVersion = "3.2.0";
    std::string runtimeVersion = "21";
    std::string imageRepositoryBaseUrl = "http://localhost:8080";
    int imageRepositoryTimeoutMs = 5000;

    /**
     * @brief groupId plus the artifactId reduced to lower-case alphanumerics (com.example.mysite)
     */
    std::string javaPackage() const;
};

/**
 * @brief Asset download settings
 */
struct AssetFetchOptions {
    std::string baseUrl = "http://localhost:8080";  // resolves root-relative asset URLs
    int timeoutMs = 5000;
    int maxRetries = 0;
    bool enabled = true;
};

}  // namespace PEX
