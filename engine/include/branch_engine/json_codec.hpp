#pragma once

#include "branch_engine/types.hpp"
#include <json/value.h>
#include <string>

namespace branch {

// Builds the arena from the wire form. Children are rebuilt from the explicit
// `children` map first and then completed from each node's `pid`; dangling
// ids in `roots`, `children` and `active_path` are dropped. Throws
// InvalidDocument for non-object input, a `pid` naming a missing node, or an
// unknown role.
Document document_from_json(const Json::Value& v);

Json::Value document_to_json(const Document& d);
Json::Value node_to_json(const Document& d, NodeHandle h); // includes "node_id"

Json::Value parse_json_text(const std::string& text, const std::string& origin); // throws InvalidDocument
std::string write_json_text(const Json::Value& v, bool pretty = true);

} // namespace branch
