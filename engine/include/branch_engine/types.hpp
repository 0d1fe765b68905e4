#pragma once

#include "branch_engine/clock.hpp"

#include <json/value.h>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace branch {

using NodeHandle = std::uint32_t;
constexpr NodeHandle kNoNode = 0xFFFFFFFFu;

enum class Role { System, User, Assistant };

struct Node {
    std::string id;
    NodeHandle parent = kNoNode; // kNoNode denotes root
    Role role = Role::System;
    std::string content;
    std::string updatedAt;
    std::vector<NodeHandle> children; // ordered
    Json::Value extra;                // unrecognised per-node members, written back untouched
    bool alive = true;                // false once removed by a cascading delete
};

// One conversation. Nodes live in an arena addressed by handle; `ids` maps the
// public string ids onto it. Handles of deleted nodes are never reused.
struct Document {
    std::vector<Node> arena;
    std::unordered_map<std::string, NodeHandle> ids;
    std::vector<NodeHandle> roots;      // ordered root ids
    std::vector<NodeHandle> activePath; // as stored; see normalize_path
    std::string updatedAt;
    Json::Value metadata = Json::Value(Json::objectValue); // name, description and other top-level members
};

// Commands
enum class CommandType {
    Append,
    Retry,
    RetryUserMessage,
    TruncateAfter,
    DeleteBranch,
    SwitchBranch,
    UpdateContent
};

struct Command {
    CommandType type;
    // target node id: parent for Append, retried node for Retry, user node for
    // RetryUserMessage, the edited/deleted node otherwise (unused by SwitchBranch)
    std::string id;
    std::string newId;   // Append/Retry
    std::string role;    // Append/Retry
    std::string content; // Append/Retry/UpdateContent
    int targetJ = 0;     // SwitchBranch, 1-based
};

enum class RetryAction { RetryAssistant, CreateAssistant };

struct Outcome {
    Document doc;
    // Node the command acted on: created, retried, switched to, edited or deleted.
    std::string nodeId;
    // Empty assistant slot created alongside the node, if any.
    std::string placeholderId;
    std::optional<RetryAction> retryAction; // RetryUserMessage only
    bool changed = true; // false when RetryUserMessage only reported an existing reply
};

// Engine API. Never modifies `doc`; throws BranchError on failure.
Outcome apply_command(const Document& doc, const Command& cmd, const Clock& clock);

// Helper: a document with one root node on the active path.
Document initial_document(const std::string& rootId, Role role, const std::string& content, const Clock& clock);

} // namespace branch
