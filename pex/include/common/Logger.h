#pragma once

#include <memory>
#include <optional>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace PEX {

namespace detail {
std::string callerName(const std::source_location &loc);
}  // namespace detail

/**
 * @brief Process-wide logging facade over spdlog
 *
 * The first log call lazily creates a colored console logger named "PEX".
 * initialize(logDir) additionally writes pex.log from then on.
 * The level is taken from SPDLOG_LEVEL and can be changed with setLevel().
 * Every line is prefixed with the calling function, e.g. "PEX::AssetCollector::plan() - ".
 */
class Logger {
public:
    /**
     * @param logDir Directory receiving pex.log; console only when empty
     * @param logToFile Add the file sink
     */
    static void initialize(const std::string &logDir = "", bool logToFile = false);

    static void setLevel(spdlog::level::level_enum level);

    /**
     * @brief Level for a name as accepted by SPDLOG_LEVEL and the config file (case-insensitive)
     * @return std::nullopt for an unknown name
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string &name);

    static void log(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(spdlog::level::trace, message, loc);
    }

    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(spdlog::level::debug, message, loc);
    }

    static void info(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(spdlog::level::info, message, loc);
    }

    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(spdlog::level::warn, message, loc);
    }

    static void error(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(spdlog::level::err, message, loc);
    }

private:
    static spdlog::logger &instance();

    static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace PEX

#define LOG_TRACE(...) PEX::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) PEX::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) PEX::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) PEX::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) PEX::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
