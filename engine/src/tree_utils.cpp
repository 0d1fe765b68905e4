#include "branch_engine/tree_utils.hpp"
#include "branch_engine/error.hpp"
#include <algorithm>
#include <cassert>

namespace branch {

const char* role_name(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "system";
}

Role parse_role(std::string_view text) {
    if (text == "system") return Role::System;
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    raise(ErrorKind::InvalidRole, "Invalid role: {}", text);
}

Node& node_at(Document& d, NodeHandle h) {
    assert(h < d.arena.size() && d.arena[h].alive);
    return d.arena[h];
}

const Node& node_at(const Document& d, NodeHandle h) {
    assert(h < d.arena.size() && d.arena[h].alive);
    return d.arena[h];
}

std::optional<NodeHandle> find_node(const Document& d, const std::string& id) {
    auto it = d.ids.find(id);
    if (it == d.ids.end()) return std::nullopt;
    return it->second;
}

NodeHandle require_node(const Document& d, const std::string& id, const char* what) {
    auto h = find_node(d, id);
    if (!h) raise(ErrorKind::NotFound, "{} not found: {}", what, id);
    return *h;
}

size_t live_node_count(const Document& d) {
    return d.ids.size();
}

const std::vector<NodeHandle>& siblings_cref(const Document& d, NodeHandle h) {
    NodeHandle parent = node_at(d, h).parent;
    if (parent == kNoNode) {
        return d.roots;
    }
    return node_at(d, parent).children;
}

std::optional<size_t> index_of(const std::vector<NodeHandle>& vec, NodeHandle h) {
    auto it = std::find(vec.begin(), vec.end(), h);
    if (it == vec.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(vec.begin(), it));
}

NodeHandle add_node(Document& d, const std::string& id, NodeHandle parent, Role role,
                    std::string content, std::string updatedAt) {
    if (d.ids.count(id)) raise(ErrorKind::DuplicateId, "Node ID already exists: {}", id);
    Node n;
    n.id = id;
    n.parent = parent;
    n.role = role;
    n.content = std::move(content);
    n.updatedAt = std::move(updatedAt);
    NodeHandle h = static_cast<NodeHandle>(d.arena.size());
    d.arena.push_back(std::move(n));
    d.ids[id] = h;
    if (parent == kNoNode) {
        d.roots.push_back(h);
    } else {
        node_at(d, parent).children.push_back(h);
    }
    return h;
}

std::vector<NodeHandle> collect_subtree(const Document& d, NodeHandle top) {
    std::vector<NodeHandle> out;
    std::vector<bool> visited(d.arena.size(), false);
    std::vector<NodeHandle> stack{ top };
    while (!stack.empty()) {
        NodeHandle cur = stack.back();
        stack.pop_back();
        if (visited[cur]) continue;
        visited[cur] = true;
        out.push_back(cur);
        const auto& ch = node_at(d, cur).children;
        for (auto it = ch.rbegin(); it != ch.rend(); ++it) {
            if (!visited[*it]) stack.push_back(*it);
        }
    }
    return out;
}

void remove_nodes(Document& d, const std::vector<NodeHandle>& doomed) {
    std::vector<bool> gone(d.arena.size(), false);
    for (NodeHandle h : doomed) gone[h] = true;
    auto scrub = [&](std::vector<NodeHandle>& vec) {
        vec.erase(std::remove_if(vec.begin(), vec.end(), [&](NodeHandle c) { return gone[c]; }), vec.end());
    };
    for (NodeHandle h : doomed) {
        Node& n = d.arena[h];
        d.ids.erase(n.id);
        n.alive = false;
        n.children.clear();
        n.content.clear();
    }
    for (auto& n : d.arena) {
        if (n.alive) scrub(n.children);
    }
    scrub(d.roots);
}

std::string make_placeholder_id(const Document& d, const std::string& prefix, std::int64_t millis) {
    std::string id = prefix + std::to_string(millis);
    while (d.ids.count(id)) {
        ++millis;
        id = prefix + std::to_string(millis);
    }
    return id;
}

std::vector<std::string> path_ids(const Document& d, const std::vector<NodeHandle>& path) {
    std::vector<std::string> out;
    out.reserve(path.size());
    for (NodeHandle h : path) out.push_back(node_at(d, h).id);
    return out;
}

} // namespace branch
