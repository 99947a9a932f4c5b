#pragma once

#include "model/ExportOptions.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Settings of one pexport run, from a JSON file and the command line
 */
struct ExportConfig {
    ExportTarget target = ExportTarget::StaticSite;
    std::string output;           // zip file or directory, derived from the target when empty
    bool writeDirectory = false;  // write the files instead of a zip

    ExportOptions options;
    ServerProjectOptions project;
    AssetFetchOptions assets;

    std::string logDirectory;
    bool logToFile = false;
    std::string logLevel;  // overrides SPDLOG_LEVEL when set, -v overrides both

    /**
     * @brief Output path to use: output if set, else site.zip or <artifactId>.zip (no extension for directories)
     */
    std::string effectiveOutput() const;

    static const char *targetName(ExportTarget target);

    /**
     * @brief "static" or "server"
     * @return false for anything else, @p target unchanged
     */
    static bool parseTarget(const std::string &name, ExportTarget &target);
};

/**
 * @brief Reads ExportConfig JSON files
 *
 * Unknown keys are ignored. A key of the wrong type keeps the current value and
 * is reported as a warning.
 */
class ExportConfigLoader {
public:
    /**
     * @brief Apply the file's settings on top of @p config
     * @return false when the file cannot be read or is not a JSON object
     */
    bool loadFromFile(const std::string &path, ExportConfig &config);

    /**
     * @brief Apply a parsed document on top of @p config
     */
    bool apply(const Json::Value &root, ExportConfig &config);

    const std::vector<std::string> &getWarningMessages() const {
        return warningMessages_;
    }

private:
    void readString(const Json::Value &object, const std::string &key, std::string &value);
    void readBool(const Json::Value &object, const std::string &key, bool &value);
    void readInt(const Json::Value &object, const std::string &key, int &value);
    const Json::Value *section(const Json::Value &root, const std::string &key);

    void addWarning(const std::string &message);

    std::vector<std::string> warningMessages_;
};

}  // namespace PEX
