#pragma once

#include "branch_engine/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace branch {

// Role names
const char* role_name(Role role);
Role parse_role(std::string_view text); // throws InvalidRole

// Arena access
Node& node_at(Document& d, NodeHandle h);
const Node& node_at(const Document& d, NodeHandle h);
std::optional<NodeHandle> find_node(const Document& d, const std::string& id);
NodeHandle require_node(const Document& d, const std::string& id, const char* what); // throws NotFound
size_t live_node_count(const Document& d);

// Sibling container: roots for a root node, else the parent's children
const std::vector<NodeHandle>& siblings_cref(const Document& d, NodeHandle h);
std::optional<size_t> index_of(const std::vector<NodeHandle>& vec, NodeHandle h);

// Creation and removal
NodeHandle add_node(Document& d, const std::string& id, NodeHandle parent, Role role,
                    std::string content, std::string updatedAt);
std::vector<NodeHandle> collect_subtree(const Document& d, NodeHandle top);
void remove_nodes(Document& d, const std::vector<NodeHandle>& doomed);

// Synthetic id "<prefix><millis>", bumped until it does not collide.
std::string make_placeholder_id(const Document& d, const std::string& prefix, std::int64_t millis);

std::vector<std::string> path_ids(const Document& d, const std::vector<NodeHandle>& path);

} // namespace branch
