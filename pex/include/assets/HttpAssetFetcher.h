#pragma once

#include "assets/IAssetFetcher.h"
#include "model/ExportOptions.h"
#include <httplib.h>
#include <memory>
#include <string>

namespace PEX {

/**
 * @brief IAssetFetcher over HTTP(S) using cpp-httplib
 *
 * Root-relative URLs are resolved against the configured base URL. A new client
 * is created for every request, so concurrent fetches share no state.
 */
class HttpAssetFetcher : public IAssetFetcher {
public:
    explicit HttpAssetFetcher(const AssetFetchOptions &options);

    FetchResult fetch(const std::string &url) const override;

    /**
     * @brief Absolute URL for @p url, or an empty string when it cannot be resolved
     */
    std::string resolveUrl(const std::string &url) const;

private:
    struct ParsedUrl {
        std::string scheme;
        std::string host;
        int port = 80;
        std::string path;
    };

    static bool parseUrl(const std::string &url, ParsedUrl &parsed);
    std::unique_ptr<httplib::Client> createHttpClient(const ParsedUrl &parsed) const;
    httplib::Result performRequestWithRetry(const ParsedUrl &parsed, const std::string &url) const;
    static std::string describeError(httplib::Error error);

    AssetFetchOptions options_;
};

}  // namespace PEX
