#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace sams {
namespace utils {

namespace detail {

template<typename FormatString, typename... Args>
inline void emit(const char* component, spdlog::level::level_enum lvl,
                 FormatString&& fmt, Args&&... args) {
    auto logger = Logger::get(component);
    if (logger && logger->should_log(lvl)) {
        logger->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
    }
}

} // namespace detail

template<typename FormatString, typename... Args>
void Logger::trace(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::trace, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::debug, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::info, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::warn, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::err, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::critical(const char* component, FormatString&& fmt, Args&&... args) {
    detail::emit(component, spdlog::level::critical, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace sams
