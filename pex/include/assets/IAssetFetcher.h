#pragma once

#include <string>

namespace PEX {

/**
 * @brief Outcome of downloading one asset
 */
struct FetchResult {
    bool success = false;
    std::string body;
    std::string contentType;
    std::string error;

    static FetchResult ok(std::string body, std::string contentType) {
        FetchResult result;
        result.success = true;
        result.body = std::move(body);
        result.contentType = std::move(contentType);
        return result;
    }

    static FetchResult failure(std::string error) {
        FetchResult result;
        result.error = std::move(error);
        return result;
    }
};

/**
 * @brief Downloads referenced images so they can be packaged
 *
 * fetch() is called concurrently from several threads and must be safe to do so.
 */
class IAssetFetcher {
public:
    virtual ~IAssetFetcher() = default;

    /**
     * @param url Absolute http(s) URL or a root-relative path as authored
     */
    virtual FetchResult fetch(const std::string &url) const = 0;
};

}  // namespace PEX
