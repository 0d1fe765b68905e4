#include "branch_engine/types.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/path.hpp"
#include "branch_engine/tree_utils.hpp"
#include <algorithm>

namespace branch {

static const char* kAppendPlaceholderPrefix = "n_append_ass";
static const char* kRetryPlaceholderPrefix = "n_retry_ass";

static Document clone(const Document& d) { return d; }

static bool is_tail(const Document& d, NodeHandle h) {
    return !d.activePath.empty() && d.activePath.back() == h;
}

static void append(Outcome& out, const Command& cmd, const Clock& clock) {
    Document& d = out.doc;
    if (find_node(d, cmd.newId)) raise(ErrorKind::DuplicateId, "Node ID already exists: {}", cmd.newId);
    NodeHandle parent = require_node(d, cmd.id, "Parent node");
    Role role = parse_role(cmd.role);

    const std::string ts = iso_timestamp(clock);
    bool parentWasTail = is_tail(d, parent);
    NodeHandle h = add_node(d, cmd.newId, parent, role, cmd.content, ts);
    if (parentWasTail) d.activePath.push_back(h);

    // every appended message gets an empty assistant slot for the reply
    std::string slotId = make_placeholder_id(d, kAppendPlaceholderPrefix, clock.nowMillis());
    bool nodeIsTail = is_tail(d, h);
    NodeHandle slot = add_node(d, slotId, h, Role::Assistant, "", ts);
    if (nodeIsTail) d.activePath.push_back(slot);

    out.nodeId = cmd.newId;
    out.placeholderId = slotId;
}

static void retry(Outcome& out, const Command& cmd, const Clock& clock) {
    Document& d = out.doc;
    if (find_node(d, cmd.newId)) raise(ErrorKind::DuplicateId, "New node ID already exists: {}", cmd.newId);
    NodeHandle target = require_node(d, cmd.id, "Retry node");
    Role role = parse_role(cmd.role);
    NodeHandle parent = node_at(d, target).parent;
    if (parent == kNoNode) raise(ErrorKind::InvalidOperation, "Cannot retry root node: {}", cmd.id);

    NodeHandle h = add_node(d, cmd.newId, parent, role, cmd.content, iso_timestamp(clock));
    if (auto idx = index_of(d.activePath, target)) {
        d.activePath.resize(*idx);
        d.activePath.push_back(h);
    } else if (is_tail(d, parent)) {
        d.activePath.push_back(h);
    }
    out.nodeId = cmd.newId;
}

static void retry_user_message(Outcome& out, const Command& cmd, const Clock& clock) {
    Document& d = out.doc;
    NodeHandle user = require_node(d, cmd.id, "User node");
    if (node_at(d, user).role != Role::User) {
        raise(ErrorKind::InvalidOperation, "Node {} is not a user message", cmd.id);
    }

    // 1) the reply the active path already shows
    if (auto idx = index_of(d.activePath, user)) {
        if (*idx + 1 < d.activePath.size()) {
            NodeHandle next = d.activePath[*idx + 1];
            if (node_at(d, next).role == Role::Assistant) {
                out.nodeId = node_at(d, next).id;
                out.retryAction = RetryAction::RetryAssistant;
                out.changed = false;
                return;
            }
        }
    }
    // 2) any reply hanging off the user node
    for (NodeHandle c : node_at(d, user).children) {
        if (node_at(d, c).role == Role::Assistant) {
            out.nodeId = node_at(d, c).id;
            out.retryAction = RetryAction::RetryAssistant;
            out.changed = false;
            return;
        }
    }
    // 3) none yet: open an empty slot for one
    std::string slotId = make_placeholder_id(d, kRetryPlaceholderPrefix, clock.nowMillis());
    bool userIsTail = is_tail(d, user);
    NodeHandle slot = add_node(d, slotId, user, Role::Assistant, "", iso_timestamp(clock));
    if (userIsTail) d.activePath.push_back(slot);
    out.nodeId = slotId;
    out.placeholderId = slotId;
    out.retryAction = RetryAction::CreateAssistant;
}

static void cut_path_at_first(Document& d, const std::vector<NodeHandle>& doomed) {
    for (size_t i = 0; i < d.activePath.size(); ++i) {
        if (std::find(doomed.begin(), doomed.end(), d.activePath[i]) != doomed.end()) {
            d.activePath.resize(i);
            return;
        }
    }
}

static void truncate_after(Outcome& out, const Command& cmd) {
    Document& d = out.doc;
    NodeHandle target = require_node(d, cmd.id, "Node");
    auto doomed = collect_subtree(d, target);
    remove_nodes(d, doomed);
    cut_path_at_first(d, doomed);
    log_debug("truncate {}: removed {} node(s)", cmd.id, doomed.size());
    out.nodeId = cmd.id;
}

static void delete_branch(Outcome& out, const Command& cmd) {
    Document& d = out.doc;
    NodeHandle target = require_node(d, cmd.id, "Node");
    NodeHandle parent = node_at(d, target).parent;
    size_t oldIndex = index_of(siblings_cref(d, target), target).value_or(0);
    auto pathIdx = index_of(d.activePath, target);

    auto doomed = collect_subtree(d, target);
    remove_nodes(d, doomed);
    cut_path_at_first(d, doomed);

    // a deleted root leaves the path empty; normalize_path falls back to roots[0]
    if (pathIdx && parent != kNoNode) {
        const auto& sibs = node_at(d, parent).children;
        if (!sibs.empty()) {
            // prefer the successor that slid into the vacated slot, else the new last sibling
            d.activePath.push_back(oldIndex < sibs.size() ? sibs[oldIndex] : sibs.back());
        }
    }
    log_debug("delete {}: removed {} node(s)", cmd.id, doomed.size());
    out.nodeId = cmd.id;
}

static void switch_branch(Outcome& out, const Command& cmd) {
    Document& d = out.doc;
    NodeHandle tail = d.activePath.back();
    NodeHandle parent = node_at(d, tail).parent;
    const auto& sibs = siblings_cref(d, tail);
    if (cmd.targetJ < 1 || static_cast<size_t>(cmd.targetJ) > sibs.size()) {
        raise(ErrorKind::OutOfRange, "Invalid target_j={}, must be between 1 and {}", cmd.targetJ, sibs.size());
    }
    NodeHandle chosen = sibs[static_cast<size_t>(cmd.targetJ) - 1];
    if (parent == kNoNode) {
        d.activePath.assign(1, chosen);
    } else {
        d.activePath.back() = chosen;
    }
    out.nodeId = node_at(d, chosen).id;
}

static void update_content(Outcome& out, const Command& cmd, const Clock& clock) {
    Document& d = out.doc;
    Node& n = node_at(d, require_node(d, cmd.id, "Node"));
    n.content = cmd.content;
    n.updatedAt = iso_timestamp(clock);
    out.nodeId = cmd.id;
}

Outcome apply_command(const Document& d0, const Command& cmd, const Clock& clock) {
    Outcome out;
    out.doc = clone(d0);
    out.doc.activePath = normalize_path(out.doc);

    switch (cmd.type) {
        case CommandType::Append:
            append(out, cmd, clock);
            break;
        case CommandType::Retry:
            retry(out, cmd, clock);
            break;
        case CommandType::RetryUserMessage:
            retry_user_message(out, cmd, clock);
            break;
        case CommandType::TruncateAfter:
            truncate_after(out, cmd);
            break;
        case CommandType::DeleteBranch:
            delete_branch(out, cmd);
            break;
        case CommandType::SwitchBranch:
            switch_branch(out, cmd);
            break;
        case CommandType::UpdateContent:
            update_content(out, cmd, clock);
            break;
    }
    if (out.changed) out.doc.updatedAt = iso_timestamp(clock);
    return out;
}

Document initial_document(const std::string& rootId, Role role, const std::string& content, const Clock& clock) {
    Document d;
    const std::string ts = iso_timestamp(clock);
    NodeHandle root = add_node(d, rootId, kNoNode, role, content, ts);
    d.activePath.push_back(root);
    d.updatedAt = ts;
    return d;
}

} // namespace branch
