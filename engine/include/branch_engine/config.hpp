#pragma once

#include "branch_engine/log.hpp"
#include "branch_engine/service.hpp"

#include <json/value.h>
#include <string>

namespace branch {

struct EngineConfig {
    std::string storageRoot = "data/conversations";
    int utcOffsetMinutes = 480;
    LogLevel logLevel = LogLevel::Warning;
    ReturnMode defaultReturnMode = ReturnMode::Full;
};

// Members: storage_root, utc_offset_minutes, log_level, default_return_mode.
// Unknown members are ignored; present members of the wrong type or value
// raise InvalidConfig.
EngineConfig config_from_json(const Json::Value& v, EngineConfig base = EngineConfig());

// Reads a JSON config file. Throws InvalidConfig if it cannot be read or parsed.
EngineConfig load_config(const std::string& path);

// BRANCH_STORAGE_ROOT, BRANCH_UTC_OFFSET_MINUTES, BRANCH_LOG_LEVEL, BRANCH_RETURN_MODE
EngineConfig apply_env_overrides(EngineConfig config);

} // namespace branch
