#include "branch_engine/views.hpp"
#include "branch_engine/path.hpp"
#include "branch_engine/tree_utils.hpp"
#include <algorithm>
#include <cctype>

namespace branch {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_placeholder(const Node& node) {
    if (node.role != Role::Assistant || !is_blank(node.content)) return false;
    const std::string id = lowercase(node.id);
    return id.find("append") != std::string::npos || id.find("retry") != std::string::npos;
}

static BranchLevel level_at(const Document& d, const std::vector<NodeHandle>& path, size_t depth) {
    BranchLevel row;
    row.depth = depth;
    row.nodeId = node_at(d, path[depth - 1]).id;
    SiblingIndex si = sibling_index(d, path, depth);
    row.j = si.j;
    row.n = si.n;
    return row;
}

MessageExport export_messages(const Document& d) {
    MessageExport out;
    auto path = normalize_path(d);
    out.path = path_ids(d, path);
    size_t count = path.size();
    if (is_placeholder(node_at(d, path.back()))) --count;
    out.messages.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const Node& n = node_at(d, path[i]);
        out.messages.push_back(Message{ n.role, n.content });
    }
    return out;
}

BranchLevel latest_summary(const Document& d) {
    auto path = normalize_path(d);
    return level_at(d, path, path.size());
}

BranchTable branch_table(const Document& d) {
    BranchTable table;
    auto path = normalize_path(d);
    for (size_t depth = 1; depth <= path.size(); ++depth) {
        table.levels.push_back(level_at(d, path, depth));
    }
    table.latest = table.levels.back();
    return table;
}

LatestMessage latest_message(const Document& d) {
    auto path = normalize_path(d);
    const Node& tail = node_at(d, path.back());
    LatestMessage out;
    out.nodeId = tail.id;
    out.role = tail.role;
    out.content = tail.content;
    out.depth = path.size();
    return out;
}

} // namespace branch
