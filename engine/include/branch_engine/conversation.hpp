#pragma once

#include "branch_engine/clock.hpp"
#include "branch_engine/store.hpp"
#include "branch_engine/types.hpp"

#include <json/value.h>
#include <string>
#include <string_view>
#include <vector>

namespace branch {

struct ConversationInfo {
    std::string file; // store id of conversation.json
    std::string settingsFile;
    std::string variablesFile;
    std::string slug; // folder name under the storage root
    std::string name;
    std::string type;
    std::string updatedAt;
    std::string rootNodeId;
    size_t nodesCount = 0;
};

// Store ids of the three files in one conversation folder.
struct ConversationFiles {
    std::string slug;
    std::string conversation;
    std::string settings;
    std::string variables;
};

enum class SettingsAction { Get, Update };
enum class VariablesAction { Get, Set, Merge, Reset };

// Case-insensitive; unknown actions are InvalidOperation.
SettingsAction parse_settings_action(std::string_view text);
VariablesAction parse_variables_action(std::string_view text);

// Replaces / \ : * ? " < > | with '-', trims surrounding whitespace and any
// trailing dots or spaces. May return an empty string.
std::string sanitize_filename(std::string_view name);

// One assistant root "n_root<i>" per opening; the first one is active.
Document new_conversation(const std::string& name, const std::string& description,
                          const std::vector<std::string>& openings, const Clock& clock);

// Stores the new document as "<slug>/conversation.json" next to default
// settings.json and an empty variables.json. The slug is the sanitized name,
// suffixed -2, -3, ... while the folder or any of its three files exists.
ConversationInfo create_conversation(DocumentStore& store, const std::string& name, const std::string& description,
                                     const std::vector<std::string>& openings, const Clock& clock);

// A ref ending in ".json" names one of the three files and resolves to its
// folder; anything else is taken as the slug itself.
ConversationFiles conversation_files(const std::string& ref);

// get returns the stored settings ({} when the file is missing). update
// overwrites only the keys in patch: type ("threaded" or "sandbox"), preset,
// character, persona, llm_config (asset refs, null or "" stored as given)
// and regex_rules, world_books (ref arrays, null and empty entries dropped).
// Asset refs must stay inside characters/, presets/, personas/,
// regex_rules/, world_books/ or llm_configs/ (AccessDenied otherwise).
// Returns {settings_file, settings, slug}.
Json::Value conversation_settings(DocumentStore& store, const ConversationFiles& files, SettingsAction action,
                                  const Json::Value& patch = Json::Value());

// get, set (replace), merge (shallow, keys overwrite) or reset to {}.
// set and merge need an object. Returns {variables_file, variables, slug}.
Json::Value conversation_variables(DocumentStore& store, const ConversationFiles& files, VariablesAction action,
                                   const Json::Value& data = Json::Value());

} // namespace branch
