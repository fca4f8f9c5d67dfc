#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace sams {
namespace utils {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

spdlog::level::level_enum toSpdlog(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

struct LoggerState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    Logger::Level level = Logger::Level::INFO;
    std::string pattern = kDefaultPattern;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::map<std::string, Logger::Level> overrides;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

Logger::Level effectiveLevel(const LoggerState& s, const std::string& component) {
    auto it = s.overrides.find(component);
    return it != s.overrides.end() ? it->second : s.level;
}

// Caller holds the state mutex
std::shared_ptr<spdlog::logger> makeLogger(LoggerState& s, const std::string& component) {
    auto logger = std::make_shared<spdlog::logger>("sams." + component, s.sinks.begin(), s.sinks.end());
    logger->set_level(toSpdlog(effectiveLevel(s, component)));
    logger->set_pattern(s.pattern);
    return logger;
}

void resetSinks(std::vector<spdlog::sink_ptr> sinks, Logger::Level level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sinks = std::move(sinks);
    s.level = level;
    s.loggers.clear();
}

} // namespace

void Logger::init(const std::string& log_file, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        resetSinks({console_sink, file_sink}, level);
        get("core")->info("Logger initialized (file: {}, level: {})", log_file, levelToString(level));
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        initConsole(level);
    }
}

void Logger::initConsole(Level level) {
    resetSinks({std::make_shared<spdlog::sinks::stdout_color_sink_mt>()}, level);
}

void Logger::initWithSinks(std::vector<spdlog::sink_ptr> sinks, Level level) {
    resetSinks(std::move(sinks), level);
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (auto& [component, logger] : s.loggers) {
        logger->flush();
    }
    s.loggers.clear();
    s.sinks.clear();
    s.overrides.clear();
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& component) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.loggers.find(component);
    if (it != s.loggers.end()) {
        return it->second;
    }
    if (s.sinks.empty()) {
        s.sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    auto logger = makeLogger(s, component);
    s.loggers.emplace(component, logger);
    return logger;
}

void Logger::setLevel(Level level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
    for (auto& [component, logger] : s.loggers) {
        logger->set_level(toSpdlog(effectiveLevel(s, component)));
    }
}

void Logger::setComponentLevel(const std::string& component, Level level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.overrides[component] = level;
    auto it = s.loggers.find(component);
    if (it != s.loggers.end()) {
        it->second->set_level(toSpdlog(level));
    }
}

void Logger::setComponentLevels(const std::map<std::string, std::string>& levels) {
    for (const auto& [component, level] : levels) {
        setComponentLevel(component, levelFromString(level));
    }
}

Logger::Level Logger::getComponentLevel(const std::string& component) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return effectiveLevel(s, component);
}

void Logger::setPattern(const std::string& pattern) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.pattern = pattern;
    for (auto& [component, logger] : s.loggers) {
        logger->set_pattern(pattern);
    }
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace sams
