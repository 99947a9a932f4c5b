#include "assets/HttpAssetFetcher.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include <algorithm>
#include <chrono>
#include <regex>
#include <thread>

namespace PEX {

HttpAssetFetcher::HttpAssetFetcher(const AssetFetchOptions &options) : options_(options) {
    LOG_DEBUG("HttpAssetFetcher: Created with base URL '{}', timeout {}ms, {} retries", options_.baseUrl,
              options_.timeoutMs, options_.maxRetries);
}

std::string HttpAssetFetcher::resolveUrl(const std::string &url) const {
    const std::string trimmed = StringHelper::trim(url);
    if (StringHelper::startsWith(trimmed, "http://") || StringHelper::startsWith(trimmed, "https://")) {
        return trimmed;
    }
    if (StringHelper::startsWith(trimmed, "//")) {
        return "https:" + trimmed;
    }
    if (StringHelper::startsWith(trimmed, "/")) {
        std::string base = options_.baseUrl;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base.empty() ? "" : base + trimmed;
    }
    return "";
}

bool HttpAssetFetcher::parseUrl(const std::string &url, ParsedUrl &parsed) {
    std::regex urlPattern(R"(^(https?)://([^:/?#\s]+)(?::(\d+))?([^#]*)?)", std::regex_constants::icase);
    std::smatch match;
    if (!std::regex_search(url, match, urlPattern)) {
        return false;
    }

    parsed.scheme = StringHelper::toLower(match[1].str());
    parsed.host = match[2].str();

    if (match[3].matched) {
        try {
            parsed.port = std::stoi(match[3].str());
        } catch (const std::exception &) {
            return false;
        }
    } else {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }

    parsed.path = match[4].matched ? match[4].str() : "";
    if (parsed.path.empty() || parsed.path.front() != '/') {
        parsed.path = "/" + parsed.path;
    }
    return true;
}

std::unique_ptr<httplib::Client> HttpAssetFetcher::createHttpClient(const ParsedUrl &parsed) const {
    try {
        std::string origin = parsed.scheme + "://" + parsed.host;
        if ((parsed.scheme == "http" && parsed.port != 80) || (parsed.scheme == "https" && parsed.port != 443)) {
            origin += ":" + std::to_string(parsed.port);
        }

        auto client = std::make_unique<httplib::Client>(origin);
        const auto timeout = std::chrono::milliseconds(std::max(options_.timeoutMs, 1));
        client->set_connection_timeout(timeout);
        client->set_read_timeout(timeout);
        client->set_write_timeout(timeout);
        client->set_follow_location(true);
        return client;

    } catch (const std::exception &e) {
        LOG_ERROR("HttpAssetFetcher: Failed to create HTTP client: {}", e.what());
        return nullptr;
    }
}

httplib::Result HttpAssetFetcher::performRequestWithRetry(const ParsedUrl &parsed, const std::string &url) const {
    httplib::Result result;
    int attempts = 0;

    while (attempts <= options_.maxRetries) {
        attempts++;

        auto client = createHttpClient(parsed);
        if (!client) {
            break;
        }

        LOG_DEBUG("HttpAssetFetcher: GET attempt {} for '{}'", attempts, url);
        result = client->Get(parsed.path);

        if (result && result->status >= 200 && result->status < 300) {
            break;
        }

        if (attempts <= options_.maxRetries) {
            auto waitTime = std::chrono::milliseconds(100 * attempts);
            LOG_DEBUG("HttpAssetFetcher: Retrying '{}' in {}ms", url, waitTime.count());
            std::this_thread::sleep_for(waitTime);
        }
    }

    return result;
}

std::string HttpAssetFetcher::describeError(httplib::Error error) {
    switch (error) {
    case httplib::Error::Connection:
        return "Connection failed";
    case httplib::Error::Read:
        return "Read error";
    case httplib::Error::Write:
        return "Write error";
    case httplib::Error::Canceled:
        return "Request canceled";
    case httplib::Error::SSLConnection:
        return "SSL connection failed";
    case httplib::Error::SSLServerVerification:
        return "SSL server verification failed";
    default:
        return "HTTP error " + std::to_string(static_cast<int>(error));
    }
}

FetchResult HttpAssetFetcher::fetch(const std::string &url) const {
    const std::string absolute = resolveUrl(url);
    ParsedUrl parsed;
    if (absolute.empty() || !parseUrl(absolute, parsed)) {
        return FetchResult::failure("Cannot resolve URL '" + url + "'");
    }

    try {
        auto result = performRequestWithRetry(parsed, absolute);
        if (!result) {
            return FetchResult::failure(describeError(result.error()));
        }
        if (result->status < 200 || result->status >= 300) {
            return FetchResult::failure("HTTP " + std::to_string(result->status));
        }

        LOG_DEBUG("HttpAssetFetcher: Downloaded '{}' ({} bytes)", absolute, result->body.size());
        return FetchResult::ok(result->body, result->get_header_value("Content-Type"));

    } catch (const std::exception &e) {
        LOG_ERROR("HttpAssetFetcher: Exception while fetching '{}': {}", absolute, e.what());
        return FetchResult::failure(e.what());
    }
}

}  // namespace PEX
