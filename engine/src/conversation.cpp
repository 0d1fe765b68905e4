#include "branch_engine/conversation.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/json_codec.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/tree_utils.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <iterator>

namespace branch {

static const char* kEmptyOpening = "(empty)";
static const char* kConversationFile = "conversation.json";
static const char* kSettingsFile = "settings.json";
static const char* kVariablesFile = "variables.json";
static const char* kDefaultType = "threaded";

static const std::array<const char*, 6> kAssetDirs = { "characters", "presets", "personas",
                                                      "regex_rules", "world_books", "llm_configs" };

static std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::string sanitize_filename(std::string_view name) {
    std::string s = trim(name);
    for (char& c : s) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                c = '-';
                break;
            default:
                break;
        }
    }
    while (!s.empty() && (s.back() == '.' || s.back() == ' ')) s.pop_back();
    return s;
}

Document new_conversation(const std::string& name, const std::string& description,
                          const std::vector<std::string>& openings, const Clock& clock) {
    Document d;
    const std::string ts = iso_timestamp(clock);
    const size_t count = openings.empty() ? 1 : openings.size();
    for (size_t i = 0; i < count; ++i) {
        std::string content = i < openings.size() ? trim(openings[i]) : std::string();
        if (content.empty()) content = kEmptyOpening;
        add_node(d, fmt::format("n_root{}", i + 1), kNoNode, Role::Assistant, std::move(content), ts);
    }
    d.activePath.push_back(d.roots.front());
    d.metadata["name"] = trim(name);
    d.metadata["description"] = trim(description);
    d.updatedAt = ts;
    return d;
}

static std::string lower(std::string_view text) {
    std::string s = trim(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

SettingsAction parse_settings_action(std::string_view text) {
    const std::string a = lower(text);
    if (a == "get") return SettingsAction::Get;
    if (a == "update") return SettingsAction::Update;
    raise(ErrorKind::InvalidOperation, "Unsupported action: {} (must be 'get' or 'update')", text);
}

VariablesAction parse_variables_action(std::string_view text) {
    const std::string a = lower(text);
    if (a == "get") return VariablesAction::Get;
    if (a == "set") return VariablesAction::Set;
    if (a == "merge") return VariablesAction::Merge;
    if (a == "reset") return VariablesAction::Reset;
    raise(ErrorKind::InvalidOperation, "Unsupported action: {}", text);
}

static ConversationFiles files_for_slug(const std::string& slug) {
    return ConversationFiles{ slug, slug + "/" + kConversationFile, slug + "/" + kSettingsFile,
                              slug + "/" + kVariablesFile };
}

static bool slug_taken(DocumentStore& store, const std::string& slug) {
    const ConversationFiles f = files_for_slug(slug);
    return store.exists(slug) || store.exists(f.conversation) || store.exists(f.settings) || store.exists(f.variables);
}

ConversationFiles conversation_files(const std::string& ref) {
    const std::string r = trim(ref);
    if (r.empty()) raise(ErrorKind::InvalidOperation, "Either a conversation file or a slug must be given");
    const std::filesystem::path p(r);
    if (p.extension() != ".json") return files_for_slug(r);

    const std::string name = p.filename().string();
    if (name != kConversationFile && name != kSettingsFile && name != kVariablesFile) {
        raise(ErrorKind::InvalidOperation, "Not a conversation file: {}", ref);
    }
    const std::string folder = p.parent_path().generic_string();
    if (folder.empty()) raise(ErrorKind::InvalidOperation, "Conversation file has no folder: {}", ref);
    return files_for_slug(folder);
}

static Json::Value load_object_or_empty(DocumentStore& store, const std::string& id) {
    if (!store.exists(id)) return Json::Value(Json::objectValue);
    return store.load(id);
}

// Null and "" pass through; anything else must name a file under an asset folder.
static Json::Value checked_asset_ref(const Json::Value& v, const std::string& field) {
    if (v.isNull()) return v;
    if (!v.isString()) raise(ErrorKind::InvalidOperation, "{} must be a string", field);
    const std::string ref = v.asString();
    if (ref.empty()) return v;

    const std::filesystem::path norm = std::filesystem::path(ref).lexically_normal();
    auto first = norm.begin();
    bool allowed = !norm.is_absolute() && norm.has_filename() && first != norm.end() && std::next(first) != norm.end();
    if (allowed) {
        const std::string dir = first->string();
        allowed = std::find_if(kAssetDirs.begin(), kAssetDirs.end(), [&](const char* d) { return dir == d; }) !=
                  kAssetDirs.end();
    }
    if (!allowed) raise(ErrorKind::AccessDenied, "Invalid {}, outside allowed data dirs: {}", field, ref);
    return v;
}

static Json::Value checked_asset_list(const Json::Value& v, const std::string& field) {
    Json::Value out(Json::arrayValue);
    if (v.isNull()) return out;
    if (!v.isArray()) raise(ErrorKind::InvalidOperation, "{} must be an array of strings", field);
    for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
        const Json::Value& item = v[i];
        if (item.isNull() || (item.isString() && item.asString().empty())) continue;
        out.append(checked_asset_ref(item, fmt::format("{}[{}]", field, i)));
    }
    return out;
}

static Json::Value default_settings() {
    Json::Value s(Json::objectValue);
    s["type"] = kDefaultType;
    s["preset"] = "";
    s["character"] = "";
    s["persona"] = "";
    s["regex_rules"] = Json::Value(Json::arrayValue);
    s["world_books"] = Json::Value(Json::arrayValue);
    return s;
}

ConversationInfo create_conversation(DocumentStore& store, const std::string& name, const std::string& description,
                                     const std::vector<std::string>& openings, const Clock& clock) {
    std::string base = sanitize_filename(name);
    if (base.empty()) base = "conversation";
    std::string slug = base;
    for (int idx = 2; slug_taken(store, slug); ++idx) {
        slug = fmt::format("{}-{}", base, idx);
    }
    const ConversationFiles files = files_for_slug(slug);

    std::string displayName = trim(name);
    Document d = new_conversation(displayName.empty() ? slug : displayName, description, openings, clock);
    ConversationInfo info;
    info.file = files.conversation;
    info.settingsFile = files.settings;
    info.variablesFile = files.variables;
    info.slug = slug;
    info.name = d.metadata["name"].asString();
    info.type = kDefaultType;
    info.updatedAt = d.updatedAt;
    info.rootNodeId = node_at(d, d.roots.front()).id;
    info.nodesCount = live_node_count(d);

    store.save(info.file, document_to_json(d));
    store.save(info.settingsFile, default_settings());
    store.save(info.variablesFile, Json::Value(Json::objectValue));
    log_info("created conversation {} with {} opening(s)", info.file, info.nodesCount);
    return info;
}

Json::Value conversation_settings(DocumentStore& store, const ConversationFiles& files, SettingsAction action,
                                  const Json::Value& patch) {
    Json::Value settings = load_object_or_empty(store, files.settings);
    if (action == SettingsAction::Update) {
        if (!patch.isObject()) raise(ErrorKind::InvalidOperation, "patch must be an object for action=update");
        static const std::array<const char*, 7> kKeys = { "type",        "preset",      "character", "persona",
                                                          "regex_rules", "world_books", "llm_config" };
        for (const auto& key : patch.getMemberNames()) {
            if (std::find_if(kKeys.begin(), kKeys.end(), [&](const char* k) { return key == k; }) == kKeys.end()) {
                raise(ErrorKind::InvalidOperation, "Unsupported settings field: {}", key);
            }
        }
        // validate everything before touching the stored object
        Json::Value next = settings;
        if (patch.isMember("type")) {
            const Json::Value& t = patch["type"];
            if (!t.isString() || (t.asString() != "threaded" && t.asString() != "sandbox")) {
                raise(ErrorKind::InvalidOperation, "Invalid type value: {} (must be 'threaded' or 'sandbox')",
                      t.isString() ? t.asString() : write_json_text(t, false));
            }
            next["type"] = t;
        }
        for (const char* field : { "preset", "character", "persona", "llm_config" }) {
            if (patch.isMember(field)) next[field] = checked_asset_ref(patch[field], field);
        }
        for (const char* field : { "regex_rules", "world_books" }) {
            if (patch.isMember(field)) next[field] = checked_asset_list(patch[field], field);
        }
        store.save(files.settings, next);
        settings = next;
        log_debug("settings of {} updated ({} field(s))", files.slug, patch.size());
    }

    Json::Value out(Json::objectValue);
    out["settings_file"] = files.settings;
    out["settings"] = settings;
    out["slug"] = files.slug;
    return out;
}

Json::Value conversation_variables(DocumentStore& store, const ConversationFiles& files, VariablesAction action,
                                   const Json::Value& data) {
    if ((action == VariablesAction::Set || action == VariablesAction::Merge) && !data.isObject()) {
        raise(ErrorKind::InvalidOperation, "data must be an object for set/merge");
    }
    Json::Value variables(Json::objectValue);
    switch (action) {
        case VariablesAction::Get:
            variables = load_object_or_empty(store, files.variables);
            break;
        case VariablesAction::Set:
            variables = data;
            break;
        case VariablesAction::Merge:
            variables = load_object_or_empty(store, files.variables);
            for (const auto& key : data.getMemberNames()) variables[key] = data[key];
            break;
        case VariablesAction::Reset:
            break;
    }
    if (action != VariablesAction::Get) {
        store.save(files.variables, variables);
        log_debug("variables of {} saved ({} key(s))", files.slug, variables.size());
    }

    Json::Value out(Json::objectValue);
    out["variables_file"] = files.variables;
    out["variables"] = variables;
    out["slug"] = files.slug;
    return out;
}

} // namespace branch
