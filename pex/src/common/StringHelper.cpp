#include "common/StringHelper.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace PEX {

std::string StringHelper::trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string StringHelper::toLower(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool StringHelper::startsWith(const std::string &text, const std::string &prefix) {
    return text.starts_with(prefix);
}

bool StringHelper::contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

std::vector<std::string> StringHelper::split(const std::string &text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string StringHelper::replaceAll(std::string text, const std::string &from, const std::string &to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string StringHelper::stripWhitespace(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

std::string StringHelper::escapeHtml(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        case '\'':
            result += "&#39;";
            break;
        default:
            result += c;
            break;
        }
    }
    return result;
}

std::string StringHelper::escapeSingleQuoted(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '\'') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string StringHelper::escapeJavaString(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '\\':
            result += "\\\\";
            break;
        case '"':
            result += "\\\"";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            result += c;
            break;
        }
    }
    return result;
}

std::string StringHelper::toKebabCase(const std::string &camelCase) {
    std::string result;
    result.reserve(camelCase.size() + 4);
    for (char c : camelCase) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            result += '-';
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

std::string StringHelper::toPascalCase(const std::string &text) {
    std::string result;
    bool startOfPart = true;
    for (char c : text) {
        if (c == '-' || c == '_') {
            startOfPart = true;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        result += static_cast<char>(startOfPart ? std::toupper(uc) : std::tolower(uc));
        startOfPart = false;
    }
    return result;
}

std::string StringHelper::toIdentifier(const std::string &text) {
    std::string result;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            result += static_cast<char>(std::tolower(uc));
        }
    }
    return result;
}

std::string StringHelper::toHyphenated(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        result += std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '-';
    }
    return result;
}

std::string StringHelper::toSlug(const std::string &text) {
    std::string result;
    bool pendingDash = false;
    for (char c : trim(text)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pendingDash = true;
            continue;
        }
        if (!std::isalnum(uc) && c != '-' && c != '_') {
            continue;
        }
        if (pendingDash && !result.empty()) {
            result += '-';
        }
        pendingDash = false;
        result += static_cast<char>(std::tolower(uc));
    }
    return result;
}

std::string StringHelper::base64Encode(const std::string &bytes) {
    static const char *alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                         static_cast<uint8_t>(bytes[i + 2]);
        result += alphabet[(chunk >> 18) & 0x3F];
        result += alphabet[(chunk >> 12) & 0x3F];
        result += alphabet[(chunk >> 6) & 0x3F];
        result += alphabet[chunk & 0x3F];
    }

    size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        uint32_t chunk = static_cast<uint8_t>(bytes[i]) << 16;
        result += alphabet[(chunk >> 18) & 0x3F];
        result += alphabet[(chunk >> 12) & 0x3F];
        result += "==";
    } else if (remaining == 2) {
        uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8);
        result += alphabet[(chunk >> 18) & 0x3F];
        result += alphabet[(chunk >> 12) & 0x3F];
        result += alphabet[(chunk >> 6) & 0x3F];
        result += '=';
    }

    return result;
}

}  // namespace PEX
