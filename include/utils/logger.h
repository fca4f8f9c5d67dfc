#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
namespace sinks { class sink; }
}

namespace sams {
namespace utils {

/**
 * Process-wide logging facade over spdlog.
 *
 * Every shard manager component logs through its own named logger
 * ("sams.router", "sams.migration", ...). All component loggers share the
 * root sinks; each one follows the root level unless a level was set for
 * that component.
 *
 * A source file selects its component by defining SAMS_LOG_COMPONENT
 * before its first include.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    static void init(const std::string& log_file = "sams_sharding.log", Level level = Level::INFO);
    // Console-only logger, used by tests and the demo when no file is wanted
    static void initConsole(Level level = Level::INFO);
    static void initWithSinks(std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks,
                              Level level = Level::INFO);
    static void shutdown();

    // Logger of one component, created on first use
    static std::shared_ptr<spdlog::logger> get(const std::string& component);

    static void setLevel(Level level);
    static void setComponentLevel(const std::string& component, Level level);
    static void setComponentLevels(const std::map<std::string, std::string>& levels);
    static Level getComponentLevel(const std::string& component);
    static void setPattern(const std::string& pattern);

    // Unknown names map to INFO
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(const char* component, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(const char* component, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(const char* component, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(const char* component, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(const char* component, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(const char* component, FormatString&& fmt, Args&&... args);
};

} // namespace utils
} // namespace sams

#include "utils/logger_impl.h"

#ifndef SAMS_LOG_COMPONENT
#define SAMS_LOG_COMPONENT "core"
#endif

#define SAMS_TRACE(...) ::sams::utils::Logger::trace(SAMS_LOG_COMPONENT, __VA_ARGS__)
#define SAMS_DEBUG(...) ::sams::utils::Logger::debug(SAMS_LOG_COMPONENT, __VA_ARGS__)
#define SAMS_INFO(...) ::sams::utils::Logger::info(SAMS_LOG_COMPONENT, __VA_ARGS__)
#define SAMS_WARN(...) ::sams::utils::Logger::warn(SAMS_LOG_COMPONENT, __VA_ARGS__)
#define SAMS_ERROR(...) ::sams::utils::Logger::error(SAMS_LOG_COMPONENT, __VA_ARGS__)
#define SAMS_CRITICAL(...) ::sams::utils::Logger::critical(SAMS_LOG_COMPONENT, __VA_ARGS__)
