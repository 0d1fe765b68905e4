#pragma once

#include "branch_engine/types.hpp"
#include <optional>
#include <vector>

namespace branch {

// Longest connected, rooted prefix of the stored active path. Falls back to
// the first root when the stored path is empty. Throws InvalidDocument when no
// valid root exists or the path's root is not listed in `roots`.
std::vector<NodeHandle> normalize_path(const Document& d);

struct SiblingIndex {
    std::optional<size_t> j; // 1-based; empty when the node is missing from its sibling list
    size_t n = 0;
};

// Position of path[depth-1] among its siblings; depth is 1-based.
SiblingIndex sibling_index(const Document& d, const std::vector<NodeHandle>& path, size_t depth);

} // namespace branch
