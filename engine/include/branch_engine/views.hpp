#pragma once

#include "branch_engine/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace branch {

struct Message {
    Role role;
    std::string content;
};

struct MessageExport {
    std::vector<Message> messages;
    std::vector<std::string> path; // normalized active path, placeholder included
};

struct BranchLevel {
    size_t depth = 0;
    std::string nodeId;
    std::optional<size_t> j;
    size_t n = 0;
};

struct BranchTable {
    BranchLevel latest;
    std::vector<BranchLevel> levels; // depth 1..path length
};

struct LatestMessage {
    std::string nodeId;
    Role role = Role::System;
    std::string content;
    size_t depth = 0;
};

// An empty assistant slot created by Append or RetryUserMessage: assistant
// role, blank content, and an id tagged "append" or "retry".
bool is_placeholder(const Node& node);

// All projections normalize the active path first and never modify `d`.
MessageExport export_messages(const Document& d);
BranchLevel latest_summary(const Document& d);
BranchTable branch_table(const Document& d);
LatestMessage latest_message(const Document& d);

} // namespace branch
