#pragma once

#include "assets/IAssetFetcher.h"
#include "common/Diagnostics.h"
#include "model/PageDefinition.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace PEX {

enum class AssetReferenceKind {
    Static,   // absolute http(s) URL or root-relative path, packaged
    Dynamic,  // contains a {{path}} token, resolved at runtime
    Ignored   // empty, relative or data: URL, left as authored
};

/**
 * @brief One distinct static image URL and where it ends up in the export
 */
struct AssetEntry {
    std::string url;       // as authored, the key used for rewriting
    std::string instanceId;  // first component referencing it
    std::string fileName;  // unique within the export
    bool fetched = false;
    std::string data;
    std::string contentType;
};

/**
 * @brief Finds, names, downloads and relinks the images a set of pages references
 *
 * References are props.src (else props.url) and every url(...) inside
 * styles.backgroundImage, walked depth-first pre-order, pages in order. Names are
 * assigned in that order before anything is downloaded, so the output does not
 * depend on which download finishes first.
 */
class AssetCollector {
public:
    /**
     * @param fetcher Downloads assets; nullptr plans names only and fetches nothing
     * @param diagnostics Receives collision infos and fetch failure warnings
     */
    AssetCollector(const IAssetFetcher *fetcher, Diagnostics &diagnostics);

    /**
     * @brief Keep @p fileName free, e.g. for a file the export ships itself
     */
    void reserveFileName(const std::string &fileName) {
        reserved_.insert(fileName);
    }

    static AssetReferenceKind classify(const std::string &url);

    /**
     * @brief Contents of every url(...) in a CSS value, quotes removed
     */
    static std::vector<std::string> extractCssUrls(const std::string &cssValue);

    /**
     * @brief Safe local file name for a URL, before collision handling
     */
    static std::string sanitizeFilename(const std::string &url);

    /**
     * @brief Distinct static URLs of @p pages in first-seen order, each with its unique file name
     */
    std::vector<AssetEntry> plan(const std::vector<const PageDefinition *> &pages);

    /**
     * @brief Download every entry concurrently; failures stay unfetched and are reported
     */
    void fetchAll(std::vector<AssetEntry> &entries) const;

    /**
     * @brief plan() then fetchAll()
     */
    std::vector<AssetEntry> collect(const std::vector<const PageDefinition *> &pages);

    /**
     * @brief URL -> @p localPrefix + file name, for fetched entries only
     */
    static std::map<std::string, std::string> localMapping(const std::vector<AssetEntry> &entries,
                                                           const std::string &localPrefix);

    /**
     * @brief URL -> data:<type>;base64,... for fetched entries only
     */
    static std::map<std::string, std::string> dataUrlMapping(const std::vector<AssetEntry> &entries);

    /**
     * @brief Replace mapped URLs in one left-to-right pass, longest match first at each position
     *
     * A URL only matches on its own, not as part of a longer URL. The HTML-escaped
     * form of each URL is matched as well.
     */
    static std::string rewriteUrls(const std::string &markup, const std::map<std::string, std::string> &mapping);

    /**
     * @brief Media type for embedding: the response type without parameters, else guessed from the extension
     */
    static std::string mediaType(const AssetEntry &entry);

private:
    void collectFromComponent(const ComponentInstance &component, std::vector<AssetEntry> &entries,
                              std::map<std::string, size_t> &seen) const;
    void addReference(const std::string &url, const ComponentInstance &component, std::vector<AssetEntry> &entries,
                      std::map<std::string, size_t> &seen) const;
    void allocateNames(std::vector<AssetEntry> &entries);

    const IAssetFetcher *fetcher_;
    Diagnostics &diagnostics_;
    std::set<std::string> reserved_;
};

}  // namespace PEX
