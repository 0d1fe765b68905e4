#pragma once

#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace branch {

enum class LogLevel {
    None, // silences all output
    Error,
    Warning,
    Info,
    Debug,
    Trace
};

namespace logging {

// Host sink; replaces stderr output when set.
using SinkType = void (*)(LogLevel level, std::string_view message);

void set_level(LogLevel level);
LogLevel level();
void set_sink(SinkType sink);

const char* level_name(LogLevel level);
// Accepts none|error|warning|info|debug|trace; returns false on anything else.
bool parse_level(std::string_view text, LogLevel& out);

void write(LogLevel level, std::string_view message);
void write_args(LogLevel level, fmt::string_view fmt, fmt::format_args args);

template <typename... T>
inline void write(LogLevel level, fmt::format_string<T...> fmt, T&&... args) {
    // Avoid arg packing if filtered.
    if (level <= logging::level())
        write_args(level, fmt, fmt::make_format_args(args...));
}

} // namespace logging

template <typename... T>
inline void log_error(fmt::format_string<T...> fmt, T&&... args) {
    logging::write(LogLevel::Error, fmt, std::forward<T>(args)...);
}

template <typename... T>
inline void log_warning(fmt::format_string<T...> fmt, T&&... args) {
    logging::write(LogLevel::Warning, fmt, std::forward<T>(args)...);
}

template <typename... T>
inline void log_info(fmt::format_string<T...> fmt, T&&... args) {
    logging::write(LogLevel::Info, fmt, std::forward<T>(args)...);
}

template <typename... T>
inline void log_debug(fmt::format_string<T...> fmt, T&&... args) {
    logging::write(LogLevel::Debug, fmt, std::forward<T>(args)...);
}

} // namespace branch
