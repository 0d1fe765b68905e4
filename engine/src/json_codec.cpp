#include "branch_engine/json_codec.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/tree_utils.hpp"

#include <json/reader.h>
#include <json/writer.h>
#include <memory>

namespace branch {

static bool is_structural_key(const std::string& key) {
    return key == "roots" || key == "nodes" || key == "children" || key == "active_path" || key == "updated_at";
}

static bool is_node_key(const std::string& key) {
    return key == "pid" || key == "role" || key == "content" || key == "node_updated_at";
}

static std::string string_member(const Json::Value& obj, const char* key, const std::string& owner) {
    const Json::Value& v = obj[key];
    if (v.isNull()) return std::string();
    if (!v.isString()) raise(ErrorKind::InvalidDocument, "{}: '{}' must be a string", owner, key);
    return v.asString();
}

static Role role_member(const Json::Value& obj, const std::string& owner) {
    const std::string text = string_member(obj, "role", owner);
    if (text.empty()) return Role::System;
    if (text == "system") return Role::System;
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    raise(ErrorKind::InvalidDocument, "{}: invalid role '{}'", owner, text);
}

static const Json::Value& array_member(const Json::Value& doc, const char* key) {
    const Json::Value& v = doc[key];
    if (!v.isNull() && !v.isArray()) raise(ErrorKind::InvalidDocument, "invalid doc: '{}' must be an array", key);
    return v;
}

Document document_from_json(const Json::Value& v) {
    if (!v.isObject()) raise(ErrorKind::InvalidDocument, "invalid doc: expected a JSON object");
    Document d;

    const Json::Value& nodes = v["nodes"];
    if (!nodes.isNull() && !nodes.isObject()) raise(ErrorKind::InvalidDocument, "invalid doc: 'nodes' must be an object");

    // pass 1: allocate every node so parents can be resolved in any order
    for (const auto& id : nodes.getMemberNames()) {
        const Json::Value& nv = nodes[id];
        const std::string owner = "node " + id;
        if (!nv.isObject()) raise(ErrorKind::InvalidDocument, "{}: expected an object", owner);
        Node n;
        n.id = id;
        n.role = role_member(nv, owner);
        n.content = string_member(nv, "content", owner);
        n.updatedAt = string_member(nv, "node_updated_at", owner);
        for (const auto& key : nv.getMemberNames()) {
            if (!is_node_key(key)) n.extra[key] = nv[key];
        }
        d.ids[id] = static_cast<NodeHandle>(d.arena.size());
        d.arena.push_back(std::move(n));
    }

    // pass 2: parent links
    for (auto& n : d.arena) {
        const Json::Value& pid = nodes[n.id]["pid"];
        if (pid.isNull()) continue;
        if (!pid.isString()) raise(ErrorKind::InvalidDocument, "node {}: 'pid' must be a string or null", n.id);
        auto parent = find_node(d, pid.asString());
        if (!parent) raise(ErrorKind::InvalidDocument, "node {}: parent '{}' does not exist", n.id, pid.asString());
        if (*parent == d.ids[n.id]) raise(ErrorKind::InvalidDocument, "node {} is its own parent", n.id);
        n.parent = *parent;
    }

    // explicit children ordering, restricted to edges that agree with pid
    const Json::Value& children = v["children"];
    if (!children.isNull() && !children.isObject()) raise(ErrorKind::InvalidDocument, "invalid doc: 'children' must be an object");
    for (const auto& pidKey : children.getMemberNames()) {
        auto parent = find_node(d, pidKey);
        const Json::Value& arr = children[pidKey];
        if (!parent || !arr.isArray()) {
            log_debug("dropping children entry for '{}'", pidKey);
            continue;
        }
        auto& list = d.arena[*parent].children;
        for (const auto& cv : arr) {
            if (!cv.isString()) continue;
            auto child = find_node(d, cv.asString());
            if (!child || d.arena[*child].parent != *parent || index_of(list, *child)) {
                log_debug("dropping children edge {} -> {}", pidKey, cv.asString());
                continue;
            }
            list.push_back(*child);
        }
    }
    // edges implied only by pid go to the end of the parent's list
    for (NodeHandle h = 0; h < d.arena.size(); ++h) {
        NodeHandle p = d.arena[h].parent;
        if (p == kNoNode) continue;
        auto& list = d.arena[p].children;
        if (!index_of(list, h)) list.push_back(h);
    }

    for (const auto& rv : array_member(v, "roots")) {
        auto h = rv.isString() ? find_node(d, rv.asString()) : std::nullopt;
        if (!h || d.arena[*h].parent != kNoNode || index_of(d.roots, *h)) {
            log_debug("dropping roots entry {}", rv.isString() ? rv.asString() : std::string("<non-string>"));
            continue;
        }
        d.roots.push_back(*h);
    }

    // unknown ids end the stored path; normalize_path handles the rest
    for (const auto& pv : array_member(v, "active_path")) {
        auto h = pv.isString() ? find_node(d, pv.asString()) : std::nullopt;
        if (!h) break;
        d.activePath.push_back(*h);
    }

    d.updatedAt = string_member(v, "updated_at", "doc");
    for (const auto& key : v.getMemberNames()) {
        if (!is_structural_key(key)) d.metadata[key] = v[key];
    }
    return d;
}

static Json::Value id_array(const Document& d, const std::vector<NodeHandle>& hs) {
    Json::Value arr(Json::arrayValue);
    for (NodeHandle h : hs) arr.append(node_at(d, h).id);
    return arr;
}

static Json::Value node_body(const Document& d, const Node& n) {
    Json::Value out = n.extra.isObject() ? n.extra : Json::Value(Json::objectValue);
    out["pid"] = n.parent == kNoNode ? Json::Value(Json::nullValue) : Json::Value(node_at(d, n.parent).id);
    out["role"] = role_name(n.role);
    out["content"] = n.content;
    if (!n.updatedAt.empty()) out["node_updated_at"] = n.updatedAt;
    return out;
}

Json::Value document_to_json(const Document& d) {
    Json::Value out = d.metadata.isObject() ? d.metadata : Json::Value(Json::objectValue);
    out["roots"] = id_array(d, d.roots);

    Json::Value nodes(Json::objectValue);
    Json::Value children(Json::objectValue);
    for (const auto& n : d.arena) {
        if (!n.alive) continue;
        nodes[n.id] = node_body(d, n);
        if (!n.children.empty()) children[n.id] = id_array(d, n.children);
    }
    out["nodes"] = nodes;
    out["children"] = children;
    out["active_path"] = id_array(d, d.activePath);
    if (!d.updatedAt.empty()) out["updated_at"] = d.updatedAt;
    return out;
}

Json::Value node_to_json(const Document& d, NodeHandle h) {
    const Node& n = node_at(d, h);
    Json::Value out = node_body(d, n);
    out["node_id"] = n.id;
    return out;
}

Json::Value parse_json_text(const std::string& text, const std::string& origin) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        raise(ErrorKind::InvalidDocument, "Failed to parse {}: {}", origin, errs);
    }
    return root;
}

std::string write_json_text(const Json::Value& v, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

} // namespace branch
