#include "branch_engine/log.hpp"

#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <mutex>

namespace branch {
namespace logging {

static LogLevel s_level = LogLevel::Warning;
static SinkType s_sink = nullptr;
static std::mutex s_output_mutex;
static const auto s_start_time = std::chrono::steady_clock::now();

void set_level(LogLevel level) { s_level = level; }

LogLevel level() { return s_level; }

void set_sink(SinkType sink) { s_sink = sink; }

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "none";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "none";
}

bool parse_level(std::string_view text, LogLevel& out) {
    static constexpr LogLevel all[] = { LogLevel::None, LogLevel::Error, LogLevel::Warning,
                                        LogLevel::Info, LogLevel::Debug, LogLevel::Trace };
    for (LogLevel l : all) {
        if (text == level_name(l)) {
            out = l;
            return true;
        }
    }
    return false;
}

static float message_time() {
    const auto elapsed = std::chrono::steady_clock::now() - s_start_time;
    return std::chrono::duration<float>(elapsed).count();
}

void write(LogLevel level, std::string_view message) {
    if (level == LogLevel::None || level > s_level)
        return;

    std::lock_guard<std::mutex> lock(s_output_mutex);
    if (s_sink) {
        s_sink(level, message);
        return;
    }
    fmt::print(stderr, "[{:10.4f}] {:<7} {}\n", message_time(), level_name(level), message);
    std::fflush(stderr);
}

void write_args(LogLevel level, fmt::string_view fmt, fmt::format_args args) {
    if (level > s_level)
        return;

    fmt::memory_buffer buffer;
    fmt::vformat_to(std::back_inserter(buffer), fmt, args);
    write(level, std::string_view(buffer.data(), buffer.size()));
}

} // namespace logging
} // namespace branch
