#pragma once

#include "common/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace PEX {

/**
 * @brief Filesystem helpers shared by the CLI, the packager and tests
 */
class FileHelper {
public:
    /**
     * @brief Strip a "file:" or "file://" URI prefix
     */
    static std::string normalizePath(const std::string &path) {
        if (path.find("file://") == 0) {
            return path.substr(7);
        } else if (path.find("file:") == 0) {
            return path.substr(5);
        }
        return path;
    }

    /**
     * @brief Read a whole file in binary mode
     * @param filePath Path to file
     * @param content Output parameter for file content
     * @return true if file loaded successfully, false on error
     */
    static bool loadFileContent(const std::string &filePath, std::string &content) {
        std::ifstream file(normalizePath(filePath), std::ios::binary);
        if (!file.is_open()) {
            LOG_ERROR("FileHelper: Failed to open file: {}", filePath);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        content = buffer.str();
        return true;
    }

    /**
     * @brief Write @p content to @p filePath, creating parent directories
     * @return true on success
     */
    static bool writeFileContent(const std::string &filePath, const std::string &content) {
        try {
            std::filesystem::path path(filePath);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("FileHelper: Cannot create directory for {}: {}", filePath, e.what());
            return false;
        }

        std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("FileHelper: Failed to open file for writing: {}", filePath);
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            LOG_ERROR("FileHelper: Failed to write file: {}", filePath);
            return false;
        }

        LOG_DEBUG("FileHelper: Wrote {} bytes to {}", content.size(), filePath);
        return true;
    }
};

}  // namespace PEX
