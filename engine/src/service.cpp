#include "branch_engine/service.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/json_codec.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/path.hpp"
#include "branch_engine/tree_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace branch {

ReturnMode parse_return_mode(std::string_view text) {
    std::string mode(text);
    std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mode.empty() || mode == "doc" || mode == "full") return ReturnMode::Full;
    if (mode == "node" || mode == "path") return ReturnMode::NodeAndPath;
    if (mode == "none" || mode == "status") return ReturnMode::StatusOnly;
    raise(ErrorKind::InvalidOperation, "Unsupported return_mode: {}", text);
}

int parse_target_j(const std::string& text) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        raise(ErrorKind::OutOfRange, "Invalid target_j={}", text);
    }
    return static_cast<int>(value);
}

DocumentSource DocumentSource::inline_doc(Json::Value doc) {
    DocumentSource src;
    src.inlineDoc = std::move(doc);
    return src;
}

DocumentSource DocumentSource::stored(std::string id) {
    DocumentSource src;
    src.storedId = std::move(id);
    return src;
}

static Json::Value string_array(const std::vector<std::string>& ids) {
    Json::Value arr(Json::arrayValue);
    for (const auto& id : ids) arr.append(id);
    return arr;
}

Json::Value level_to_json(const BranchLevel& level) {
    Json::Value out(Json::objectValue);
    out["depth"] = static_cast<Json::UInt64>(level.depth);
    out["node_id"] = level.nodeId;
    out["j"] = level.j ? Json::Value(static_cast<Json::UInt64>(*level.j)) : Json::Value(Json::nullValue);
    out["n"] = static_cast<Json::UInt64>(level.n);
    return out;
}

static Json::Value optional_level(const std::optional<BranchLevel>& level) {
    return level ? level_to_json(*level) : Json::Value(Json::nullValue);
}

namespace {

struct Renderer {
    Json::Value operator()(const FullResponse& r) const {
        Json::Value out = r.doc;
        out["active_path"] = string_array(r.activePath);
        out["latest"] = optional_level(r.latest);
        out["success"] = true;
        return out;
    }

    Json::Value operator()(const NodeResponse& r) const {
        Json::Value out(Json::objectValue);
        out["success"] = true;
        out["node"] = r.node;
        out["active_path"] = string_array(r.activePath);
        out["latest"] = optional_level(r.latest);
        out["updated_at"] = r.updatedAt;
        return out;
    }

    Json::Value operator()(const StatusResponse& r) const {
        Json::Value out(Json::objectValue);
        out["success"] = true;
        out["node_id"] = r.nodeId;
        out["active_path"] = string_array(r.activePath);
        out["latest"] = optional_level(r.latest);
        out["updated_at"] = r.updatedAt;
        return out;
    }
};

} // namespace

Json::Value render(const Response& response) {
    return std::visit(Renderer{}, response);
}

// A document whose last root was deleted has no latest node.
static std::optional<BranchLevel> latest_if_any(const Document& d) {
    if (d.roots.empty()) return std::nullopt;
    return latest_summary(d);
}

BranchService::BranchService(DocumentStore& store, Clock clock) : store_(store), clock_(std::move(clock)) {}

Document BranchService::load(const DocumentSource& src) {
    if (src.inlineDoc) return document_from_json(*src.inlineDoc);
    return document_from_json(store_.load(src.storedId));
}

Outcome BranchService::run(const DocumentSource& src, const Command& cmd) {
    Outcome out = apply_command(load(src), cmd, clock_);
    if (out.changed && src.persistent()) {
        store_.save(src.storedId, document_to_json(out.doc));
    }
    log_debug("command {} on {} -> {}", static_cast<int>(cmd.type),
              src.persistent() ? src.storedId : std::string("<inline>"), out.nodeId);
    return out;
}

Response BranchService::respond(const Outcome& out, ReturnMode mode) const {
    const Document& d = out.doc;
    auto latest = latest_if_any(d);
    std::vector<std::string> activePath = d.roots.empty() ? std::vector<std::string>{} : path_ids(d, normalize_path(d));

    switch (mode) {
        case ReturnMode::Full:
            return FullResponse{ document_to_json(d), activePath, latest };
        case ReturnMode::NodeAndPath: {
            auto h = find_node(d, out.nodeId);
            Json::Value node = h ? node_to_json(d, *h) : Json::Value(Json::nullValue);
            if (!out.placeholderId.empty()) node["placeholder_id"] = out.placeholderId;
            return NodeResponse{ node, activePath, latest, d.updatedAt };
        }
        case ReturnMode::StatusOnly:
            return StatusResponse{ out.nodeId, activePath, latest, d.updatedAt };
    }
    return FullResponse{ document_to_json(d), activePath, latest };
}

Response BranchService::append(const DocumentSource& src, const std::string& newId, const std::string& parentId,
                               const std::string& role, const std::string& content, ReturnMode mode) {
    Command cmd{ CommandType::Append, parentId };
    cmd.newId = newId;
    cmd.role = role;
    cmd.content = content;
    return respond(run(src, cmd), mode);
}

Response BranchService::retry(const DocumentSource& src, const std::string& newId, const std::string& targetId,
                              const std::string& role, const std::string& content, ReturnMode mode) {
    Command cmd{ CommandType::Retry, targetId };
    cmd.newId = newId;
    cmd.role = role;
    cmd.content = content;
    return respond(run(src, cmd), mode);
}

Response BranchService::truncate_after(const DocumentSource& src, const std::string& nodeId, ReturnMode mode) {
    return respond(run(src, Command{ CommandType::TruncateAfter, nodeId }), mode);
}

Response BranchService::delete_branch(const DocumentSource& src, const std::string& nodeId, ReturnMode mode) {
    return respond(run(src, Command{ CommandType::DeleteBranch, nodeId }), mode);
}

Response BranchService::switch_branch(const DocumentSource& src, int targetJ, ReturnMode mode) {
    Command cmd{ CommandType::SwitchBranch };
    cmd.targetJ = targetJ;
    return respond(run(src, cmd), mode);
}

Response BranchService::update_content(const DocumentSource& src, const std::string& nodeId,
                                       const std::string& content, ReturnMode mode) {
    Command cmd{ CommandType::UpdateContent, nodeId };
    cmd.content = content;
    return respond(run(src, cmd), mode);
}

Json::Value BranchService::retry_user_message(const DocumentSource& src, const std::string& userId) {
    Outcome out = run(src, Command{ CommandType::RetryUserMessage, userId });
    Json::Value resp(Json::objectValue);
    resp["success"] = true;
    resp["user_node_id"] = userId;
    resp["assistant_node_id"] = out.nodeId;
    if (out.retryAction == RetryAction::RetryAssistant) {
        resp["action"] = "retry_assistant";
        return resp;
    }
    const Document& d = out.doc;
    resp["action"] = "create_assistant";
    resp["node_updated_at"] = node_at(d, require_node(d, out.nodeId, "Node")).updatedAt;
    resp["active_path"] = string_array(path_ids(d, normalize_path(d)));
    resp["latest"] = level_to_json(latest_summary(d));
    resp["updated_at"] = d.updatedAt;
    resp["doc"] = document_to_json(d);
    return resp;
}

Json::Value BranchService::messages(const DocumentSource& src) {
    MessageExport ex = export_messages(load(src));
    Json::Value out(Json::objectValue);
    Json::Value msgs(Json::arrayValue);
    for (const auto& m : ex.messages) {
        Json::Value item(Json::objectValue);
        item["role"] = role_name(m.role);
        item["content"] = m.content;
        msgs.append(item);
    }
    out["messages"] = msgs;
    out["path"] = string_array(ex.path);
    return out;
}

Json::Value BranchService::branch_table(const DocumentSource& src) {
    BranchTable table = branch::branch_table(load(src));
    Json::Value out(Json::objectValue);
    out["latest"] = level_to_json(table.latest);
    Json::Value levels(Json::arrayValue);
    for (const auto& level : table.levels) levels.append(level_to_json(level));
    out["levels"] = levels;
    return out;
}

Json::Value BranchService::latest(const DocumentSource& src) {
    Document d = load(src);
    Json::Value out(Json::objectValue);
    out["active_path"] = string_array(path_ids(d, normalize_path(d)));
    out["latest"] = level_to_json(latest_summary(d));
    return out;
}

Json::Value BranchService::latest_message(const DocumentSource& src) {
    LatestMessage m = branch::latest_message(load(src));
    Json::Value out(Json::objectValue);
    out["node_id"] = m.nodeId;
    out["role"] = role_name(m.role);
    out["content"] = m.content;
    out["depth"] = static_cast<Json::UInt64>(m.depth);
    return out;
}

} // namespace branch
