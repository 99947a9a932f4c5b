#include "config/ExportConfig.h"
#include "common/FileHelper.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace PEX {

const char *ExportConfig::targetName(ExportTarget target) {
    return target == ExportTarget::ServerProject ? "server" : "static";
}

bool ExportConfig::parseTarget(const std::string &name, ExportTarget &target) {
    if (name == "static") {
        target = ExportTarget::StaticSite;
        return true;
    } else if (name == "server") {
        target = ExportTarget::ServerProject;
        return true;
    }
    return false;
}

std::string ExportConfig::effectiveOutput() const {
    if (!output.empty()) {
        return output;
    }
    const std::string base = target == ExportTarget::ServerProject ? project.artifactId : "site";
    return writeDirectory ? base : base + ".zip";
}

void ExportConfigLoader::addWarning(const std::string &message) {
    warningMessages_.push_back(message);
    LOG_WARN("ExportConfigLoader: {}", message);
}

void ExportConfigLoader::readString(const Json::Value &object, const std::string &key, std::string &value) {
    if (!JsonUtils::hasKey(object, key)) {
        return;
    }
    if (!object[key].isString()) {
        addWarning(fmt::format("'{}' must be a string, keeping '{}'", key, value));
        return;
    }
    value = object[key].asString();
}

void ExportConfigLoader::readBool(const Json::Value &object, const std::string &key, bool &value) {
    if (!JsonUtils::hasKey(object, key)) {
        return;
    }
    if (!object[key].isBool()) {
        addWarning(fmt::format("'{}' must be true or false, keeping {}", key, value));
        return;
    }
    value = object[key].asBool();
}

void ExportConfigLoader::readInt(const Json::Value &object, const std::string &key, int &value) {
    if (!JsonUtils::hasKey(object, key)) {
        return;
    }
    if (!object[key].isInt()) {
        addWarning(fmt::format("'{}' must be an integer, keeping {}", key, value));
        return;
    }
    value = object[key].asInt();
}

const Json::Value *ExportConfigLoader::section(const Json::Value &root, const std::string &key) {
    if (!JsonUtils::hasKey(root, key)) {
        return nullptr;
    }
    if (!root[key].isObject()) {
        addWarning(fmt::format("'{}' must be an object, section ignored", key));
        return nullptr;
    }
    return &root[key];
}

bool ExportConfigLoader::apply(const Json::Value &root, ExportConfig &config) {
    if (!root.isObject()) {
        LOG_ERROR("ExportConfigLoader: Configuration root must be a JSON object");
        return false;
    }

    std::string target = ExportConfig::targetName(config.target);
    readString(root, "target", target);
    if (!ExportConfig::parseTarget(target, config.target)) {
        addWarning(fmt::format("Unknown target '{}', keeping '{}'", target, ExportConfig::targetName(config.target)));
    }

    readString(root, "output", config.output);
    readBool(root, "writeDirectory", config.writeDirectory);

    if (const Json::Value *options = section(root, "options")) {
        readBool(*options, "includeCss", config.options.includeCss);
        readBool(*options, "includeJs", config.options.includeJs);
        readBool(*options, "minify", config.options.minify);
        readBool(*options, "singlePage", config.options.singlePage);
    }

    if (const Json::Value *project = section(root, "project")) {
        readString(*project, "projectName", config.project.projectName);
        readString(*project, "groupId", config.project.groupId);
        readString(*project, "artifactId", config.project.artifactId);
        readString(*project, "version", config.project.version);
        readString(*project, "frameworkVersion", config.project.frameworkVersion);
        readString(*project, "runtimeVersion", config.project.runtimeVersion);
    }

    if (const Json::Value *assets = section(root, "assets")) {
        readString(*assets, "baseUrl", config.assets.baseUrl);
        readInt(*assets, "timeoutMs", config.assets.timeoutMs);
        readInt(*assets, "maxRetries", config.assets.maxRetries);
        // The generated project proxies runtime images to the same repository
        config.project.imageRepositoryBaseUrl = config.assets.baseUrl;
        config.project.imageRepositoryTimeoutMs = config.assets.timeoutMs;
    }

    if (const Json::Value *logging = section(root, "logging")) {
        readString(*logging, "directory", config.logDirectory);
        readBool(*logging, "toFile", config.logToFile);

        std::string level = config.logLevel;
        readString(*logging, "level", level);
        if (level != config.logLevel) {
            if (Logger::parseLevel(level)) {
                config.logLevel = level;
            } else {
                addWarning(fmt::format("'level' must be one of trace, debug, info, warn, error, critical, off; "
                                       "ignoring '{}'",
                                       level));
            }
        }
    }

    return true;
}

bool ExportConfigLoader::loadFromFile(const std::string &path, ExportConfig &config) {
    std::string content;
    if (!FileHelper::loadFileContent(path, content)) {
        LOG_ERROR("ExportConfigLoader: Cannot read configuration file {}", path);
        return false;
    }

    std::string error;
    auto root = JsonUtils::parseJson(content, &error);
    if (!root) {
        LOG_ERROR("ExportConfigLoader: Invalid JSON in {}: {}", path, error);
        return false;
    }

    if (!apply(*root, config)) {
        return false;
    }

    LOG_DEBUG("ExportConfigLoader: Loaded {} (target: {})", path, ExportConfig::targetName(config.target));
    return true;
}

}  // namespace PEX
