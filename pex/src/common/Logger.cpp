#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace PEX {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

constexpr const char *LOGGER_NAME = "PEX";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// SPDLOG_LEVEL wins over the built-in default of info
spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::info;
    }
    return Logger::parseLevel(envLevel).value_or(spdlog::level::info);
}

}  // namespace

std::optional<spdlog::level::level_enum> Logger::parseLevel(const std::string &name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) { return std::tolower(c); });

    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "info") {
        return spdlog::level::info;
    } else if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    } else if (level == "err" || level == "error") {
        return spdlog::level::err;
    } else if (level == "critical") {
        return spdlog::level::critical;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

spdlog::logger &Logger::instance() {
    if (!logger_) {
        logger_ = spdlog::get(LOGGER_NAME);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(LOGGER_NAME);
        }
        logger_->set_pattern(CONSOLE_PATTERN);
        logger_->set_level(levelFromEnvironment());
    }
    return *logger_;
}

void Logger::setLevel(spdlog::level::level_enum level) {
    instance().set_level(level);
}

void Logger::log(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    spdlog::logger &logger = instance();
    if (logger.should_log(level)) {
        logger.log(level, detail::callerName(loc) + "() - " + message);
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    if (logDir.empty() || !logToFile) {
        instance();
        return;
    }

    // A console logger created by an earlier log call is replaced, keeping its level
    const spdlog::level::level_enum level = logger_ ? logger_->level() : levelFromEnvironment();

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    std::filesystem::path logPath = std::filesystem::path(logDir) / "pex.log";
    try {
        std::filesystem::create_directories(logDir);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    } catch (const std::exception &e) {
        instance().error("Logger: Cannot log to {}: {}", logPath.string(), e.what());
        return;
    }

    spdlog::drop(LOGGER_NAME);
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(level);
    spdlog::register_logger(logger_);
}

namespace detail {

std::string callerName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && (std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1])) ||
                           fullName[nameEnd - 1] == ')')) {
        nameEnd--;
    }

    // The return type ends at the last top-level space before the name
    size_t nameStart = 0;
    int angleDepth = 0;
    int parenDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == '(') {
            parenDepth++;
        } else if (c == ')') {
            parenDepth--;
        } else if (c == ' ' && angleDepth == 0 && parenDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string qualified = fullName.substr(nameStart, nameEnd - nameStart);
    size_t firstUseful = qualified.find_first_not_of(" *&");
    qualified = firstUseful == std::string::npos ? "" : qualified.substr(firstUseful);

    // Drop template arguments, keep the class path
    std::string result;
    int templateDepth = 0;
    for (char c : qualified) {
        if (c == '<') {
            templateDepth++;
        } else if (c == '>') {
            templateDepth--;
        } else if (templateDepth == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace detail

}  // namespace PEX
