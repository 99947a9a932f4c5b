#include "assets/AssetCollector.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <regex>

namespace PEX {

namespace {

bool isUrlCharacter(char c, const char *extra) {
    return std::isalnum(static_cast<unsigned char>(c)) || std::string(extra).find(c) != std::string::npos;
}

// Escaped quotes end a URL inside an attribute value: url(&quot;...&quot;)
bool startsWithEntity(const std::string &markup, size_t position) {
    return markup.compare(position, 6, "&quot;") == 0 || markup.compare(position, 5, "&#39;") == 0;
}

bool startsWithHttp(const std::string &url) {
    const std::string lower = StringHelper::toLower(url);
    return StringHelper::startsWith(lower, "http://") || StringHelper::startsWith(lower, "https://");
}

std::string extensionMediaType(const std::string &fileName) {
    const auto dot = fileName.rfind('.');
    const std::string extension = dot == std::string::npos ? "" : StringHelper::toLower(fileName.substr(dot + 1));
    if (extension == "png") {
        return "image/png";
    } else if (extension == "jpg" || extension == "jpeg") {
        return "image/jpeg";
    } else if (extension == "gif") {
        return "image/gif";
    } else if (extension == "svg") {
        return "image/svg+xml";
    } else if (extension == "webp") {
        return "image/webp";
    } else if (extension == "avif") {
        return "image/avif";
    } else if (extension == "ico") {
        return "image/x-icon";
    }
    return "application/octet-stream";
}

}  // namespace

AssetCollector::AssetCollector(const IAssetFetcher *fetcher, Diagnostics &diagnostics)
    : fetcher_(fetcher), diagnostics_(diagnostics) {}

AssetReferenceKind AssetCollector::classify(const std::string &url) {
    const std::string trimmed = StringHelper::trim(url);
    if (trimmed.empty()) {
        return AssetReferenceKind::Ignored;
    }
    if (StringHelper::contains(trimmed, "{{") && StringHelper::contains(trimmed, "}}")) {
        return AssetReferenceKind::Dynamic;
    }
    if (startsWithHttp(trimmed) || StringHelper::startsWith(trimmed, "/")) {
        return AssetReferenceKind::Static;
    }
    return AssetReferenceKind::Ignored;
}

std::vector<std::string> AssetCollector::extractCssUrls(const std::string &cssValue) {
    static const std::regex urlPattern(R"(url\(\s*(['"]?)(.*?)\1\s*\))", std::regex_constants::icase);

    std::vector<std::string> urls;
    for (auto it = std::sregex_iterator(cssValue.begin(), cssValue.end(), urlPattern); it != std::sregex_iterator();
         ++it) {
        urls.push_back(StringHelper::trim((*it)[2].str()));
    }
    return urls;
}

std::string AssetCollector::sanitizeFilename(const std::string &url) {
    std::string path = StringHelper::trim(url);
    const auto queryStart = path.find_first_of("?#");
    if (queryStart != std::string::npos) {
        path.erase(queryStart);
    }

    const bool absolute = startsWithHttp(path);
    if (absolute || StringHelper::startsWith(path, "//")) {
        const auto hostStart = path.find("//") + 2;
        const auto hostEnd = path.find('/', hostStart);
        const std::string host = path.substr(hostStart, hostEnd == std::string::npos ? std::string::npos
                                                                                     : hostEnd - hostStart);
        if (host.empty()) {
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count();
            LOG_WARN("AssetCollector: Cannot parse URL '{}', using a generated name", url);
            return "image_" + std::to_string(millis) + ".png";
        }
        path = hostEnd == std::string::npos ? "" : path.substr(hostEnd);
    }

    std::string name = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
    if (name.empty()) {
        name = "image";
    }
    if (name.find('.') == std::string::npos) {
        name += ".png";
    }

    for (char &c : name) {
        if (!isUrlCharacter(c, "._-")) {
            c = '_';
        }
    }
    return name;
}

void AssetCollector::addReference(const std::string &url, const ComponentInstance &component,
                                  std::vector<AssetEntry> &entries, std::map<std::string, size_t> &seen) const {
    const std::string trimmed = StringHelper::trim(url);
    switch (classify(trimmed)) {
    case AssetReferenceKind::Static:
        if (seen.find(trimmed) == seen.end()) {
            seen[trimmed] = entries.size();
            AssetEntry entry;
            entry.url = trimmed;
            entry.instanceId = component.instanceId;
            entries.push_back(std::move(entry));
        }
        break;
    case AssetReferenceKind::Dynamic:
        LOG_DEBUG("AssetCollector: '{}' in {} is resolved at runtime, not packaged", trimmed, component.instanceId);
        break;
    case AssetReferenceKind::Ignored:
        break;
    }
}

void AssetCollector::collectFromComponent(const ComponentInstance &component, std::vector<AssetEntry> &entries,
                                          std::map<std::string, size_t> &seen) const {
    const std::string src = Props::getFirstString(component.props, {"src", "url"});
    if (!src.empty()) {
        addReference(src, component, entries, seen);
    }

    auto background = component.styles.find("backgroundImage");
    if (background != component.styles.end()) {
        for (const auto &url : extractCssUrls(background->second)) {
            addReference(url, component, entries, seen);
        }
    }

    for (const auto &child : component.children) {
        collectFromComponent(child, entries, seen);
    }
}

void AssetCollector::allocateNames(std::vector<AssetEntry> &entries) {
    std::set<std::string> used = reserved_;
    for (auto &entry : entries) {
        const std::string base = sanitizeFilename(entry.url);
        std::string name = base;

        if (used.count(name) > 0) {
            const auto dot = base.rfind('.');
            const std::string stem = dot == std::string::npos ? base : base.substr(0, dot);
            const std::string extension = dot == std::string::npos ? "" : base.substr(dot);
            for (int suffix = 2; used.count(name) > 0; ++suffix) {
                name = stem + "-" + std::to_string(suffix) + extension;
            }
            diagnostics_.info(DiagnosticCategory::AssetNameCollision, entry.instanceId,
                              fmt::format("'{}' would be saved as {}, renamed to {}", entry.url, base, name));
        }

        used.insert(name);
        entry.fileName = name;
    }
}

std::vector<AssetEntry> AssetCollector::plan(const std::vector<const PageDefinition *> &pages) {
    std::vector<AssetEntry> entries;
    std::map<std::string, size_t> seen;

    for (const PageDefinition *page : pages) {
        if (!page) {
            continue;
        }
        for (const auto &component : page->components) {
            collectFromComponent(component, entries, seen);
        }
    }

    allocateNames(entries);
    LOG_DEBUG("AssetCollector: {} distinct static assets referenced", entries.size());
    return entries;
}

void AssetCollector::fetchAll(std::vector<AssetEntry> &entries) const {
    if (!fetcher_) {
        LOG_INFO("AssetCollector: Asset download disabled, {} URLs left as authored", entries.size());
        return;
    }

    std::vector<std::future<FetchResult>> pending;
    pending.reserve(entries.size());
    for (const auto &entry : entries) {
        pending.push_back(std::async(std::launch::async, [fetcher = fetcher_, url = entry.url]() -> FetchResult {
            try {
                return fetcher->fetch(url);
            } catch (const std::exception &e) {
                return FetchResult::failure(e.what());
            }
        }));
    }

    size_t fetchedCount = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        FetchResult result = pending[i].get();
        AssetEntry &entry = entries[i];

        if (!result.success) {
            diagnostics_.warning(DiagnosticCategory::AssetFetchFailure, entry.instanceId,
                                 fmt::format("Could not download '{}': {}", entry.url, result.error));
            continue;
        }

        entry.fetched = true;
        entry.data = std::move(result.body);
        entry.contentType = std::move(result.contentType);
        ++fetchedCount;
    }

    LOG_INFO("AssetCollector: Downloaded {} of {} assets", fetchedCount, entries.size());
}

std::vector<AssetEntry> AssetCollector::collect(const std::vector<const PageDefinition *> &pages) {
    std::vector<AssetEntry> entries = plan(pages);
    fetchAll(entries);
    return entries;
}

std::map<std::string, std::string> AssetCollector::localMapping(const std::vector<AssetEntry> &entries,
                                                                const std::string &localPrefix) {
    std::map<std::string, std::string> mapping;
    for (const auto &entry : entries) {
        if (entry.fetched) {
            mapping[entry.url] = localPrefix + entry.fileName;
        }
    }
    return mapping;
}

std::string AssetCollector::mediaType(const AssetEntry &entry) {
    std::string type = StringHelper::trim(entry.contentType.substr(0, entry.contentType.find(';')));
    if (type.empty() || type == "application/octet-stream") {
        type = extensionMediaType(entry.fileName);
    }
    return StringHelper::toLower(type);
}

std::map<std::string, std::string> AssetCollector::dataUrlMapping(const std::vector<AssetEntry> &entries) {
    std::map<std::string, std::string> mapping;
    for (const auto &entry : entries) {
        if (entry.fetched) {
            mapping[entry.url] = "data:" + mediaType(entry) + ";base64," + StringHelper::base64Encode(entry.data);
        }
    }
    return mapping;
}

std::string AssetCollector::rewriteUrls(const std::string &markup, const std::map<std::string, std::string> &mapping) {
    std::vector<std::pair<std::string, std::string>> replacements;
    for (const auto &[url, target] : mapping) {
        if (url.empty()) {
            continue;
        }
        replacements.emplace_back(url, target);
        const std::string escaped = StringHelper::escapeHtml(url);
        if (escaped != url) {
            replacements.emplace_back(escaped, StringHelper::escapeHtml(target));
        }
    }
    std::stable_sort(replacements.begin(), replacements.end(),
                     [](const auto &a, const auto &b) { return a.first.size() > b.first.size(); });

    std::string result;
    result.reserve(markup.size());

    size_t position = 0;
    while (position < markup.size()) {
        const bool boundaryBefore = position == 0 || !isUrlCharacter(markup[position - 1], "/._-~%:");
        bool replaced = false;

        if (boundaryBefore) {
            for (const auto &[from, to] : replacements) {
                if (markup.compare(position, from.size(), from) != 0) {
                    continue;
                }
                const size_t end = position + from.size();
                if (end < markup.size() && isUrlCharacter(markup[end], "/._-~%?#&=+") &&
                    !startsWithEntity(markup, end)) {
                    continue;
                }
                result += to;
                position = end;
                replaced = true;
                break;
            }
        }

        if (!replaced) {
            result += markup[position];
            ++position;
        }
    }
    return result;
}

}  // namespace PEX
