#include "branch_engine/path.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/tree_utils.hpp"

namespace branch {

std::vector<NodeHandle> normalize_path(const Document& d) {
    NodeHandle root;
    if (!d.activePath.empty()) {
        root = d.activePath.front();
    } else if (!d.roots.empty()) {
        root = d.roots.front();
    } else {
        raise(ErrorKind::InvalidDocument, "invalid doc: no valid root found in roots or active_path");
    }
    if (!index_of(d.roots, root)) {
        raise(ErrorKind::InvalidDocument, "active_path root '{}' not in roots array", node_at(d, root).id);
    }

    std::vector<NodeHandle> norm{ root };
    for (size_t i = 1; i < d.activePath.size(); ++i) {
        const auto& ch = node_at(d, norm.back()).children;
        if (!index_of(ch, d.activePath[i])) {
            log_debug("active_path cut at depth {} ({} of {} kept)", i + 1, norm.size(), d.activePath.size());
            break;
        }
        norm.push_back(d.activePath[i]);
    }
    return norm;
}

SiblingIndex sibling_index(const Document& d, const std::vector<NodeHandle>& path, size_t depth) {
    SiblingIndex out;
    if (depth == 0 || depth > path.size()) return out;
    const std::vector<NodeHandle>& sibs = depth == 1 ? d.roots : node_at(d, path[depth - 2]).children;
    out.n = sibs.size();
    if (auto idx = index_of(sibs, path[depth - 1])) out.j = *idx + 1;
    return out;
}

} // namespace branch
