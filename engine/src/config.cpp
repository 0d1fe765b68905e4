#include "branch_engine/config.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/json_codec.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace branch {

static constexpr int kMaxOffsetMinutes = 14 * 60;

static int checked_offset(long long minutes, const std::string& origin) {
    if (minutes < -kMaxOffsetMinutes || minutes > kMaxOffsetMinutes) {
        raise(ErrorKind::InvalidConfig, "{}: utc offset {} out of range", origin, minutes);
    }
    return static_cast<int>(minutes);
}

static LogLevel checked_level(const std::string& text, const std::string& origin) {
    LogLevel level = LogLevel::Warning;
    if (!logging::parse_level(text, level)) raise(ErrorKind::InvalidConfig, "{}: unknown log level '{}'", origin, text);
    return level;
}

static ReturnMode checked_mode(const std::string& text, const std::string& origin) {
    try {
        return parse_return_mode(text);
    } catch (const BranchError& e) {
        raise(ErrorKind::InvalidConfig, "{}: {}", origin, e.what());
    }
}

EngineConfig config_from_json(const Json::Value& v, EngineConfig c) {
    if (!v.isObject()) raise(ErrorKind::InvalidConfig, "config: expected a JSON object");

    if (v.isMember("storage_root")) {
        if (!v["storage_root"].isString()) raise(ErrorKind::InvalidConfig, "config: storage_root must be a string");
        c.storageRoot = v["storage_root"].asString();
    }
    if (v.isMember("utc_offset_minutes")) {
        if (!v["utc_offset_minutes"].isInt()) raise(ErrorKind::InvalidConfig, "config: utc_offset_minutes must be an integer");
        c.utcOffsetMinutes = checked_offset(v["utc_offset_minutes"].asInt(), "config");
    }
    if (v.isMember("log_level")) {
        if (!v["log_level"].isString()) raise(ErrorKind::InvalidConfig, "config: log_level must be a string");
        c.logLevel = checked_level(v["log_level"].asString(), "config");
    }
    if (v.isMember("default_return_mode")) {
        if (!v["default_return_mode"].isString()) raise(ErrorKind::InvalidConfig, "config: default_return_mode must be a string");
        c.defaultReturnMode = checked_mode(v["default_return_mode"].asString(), "config");
    }
    return c;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) raise(ErrorKind::InvalidConfig, "Cannot open config file {}", path);
    std::ostringstream buf;
    buf << in.rdbuf();
    try {
        return config_from_json(parse_json_text(buf.str(), path));
    } catch (const BranchError& e) {
        if (e.kind() == ErrorKind::InvalidConfig) throw;
        raise(ErrorKind::InvalidConfig, "{}", e.what());
    }
}

static const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

EngineConfig apply_env_overrides(EngineConfig c) {
    if (const char* v = env("BRANCH_STORAGE_ROOT")) c.storageRoot = v;
    if (const char* v = env("BRANCH_UTC_OFFSET_MINUTES")) {
        char* end = nullptr;
        long long minutes = std::strtoll(v, &end, 10);
        if (end == v || *end != '\0') raise(ErrorKind::InvalidConfig, "BRANCH_UTC_OFFSET_MINUTES: not an integer: {}", v);
        c.utcOffsetMinutes = checked_offset(minutes, "BRANCH_UTC_OFFSET_MINUTES");
    }
    if (const char* v = env("BRANCH_LOG_LEVEL")) c.logLevel = checked_level(v, "BRANCH_LOG_LEVEL");
    if (const char* v = env("BRANCH_RETURN_MODE")) c.defaultReturnMode = checked_mode(v, "BRANCH_RETURN_MODE");
    return c;
}

} // namespace branch
