#pragma once

#include "branch_engine/clock.hpp"
#include "branch_engine/store.hpp"
#include "branch_engine/types.hpp"
#include "branch_engine/views.hpp"

#include <json/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace branch {

enum class ReturnMode { Full, NodeAndPath, StatusOnly };

// doc|full -> Full, node|path -> NodeAndPath, none|status -> StatusOnly (case-insensitive).
ReturnMode parse_return_mode(std::string_view text);

// Decimal target_j from text; OutOfRange for anything that is not a whole int.
int parse_target_j(const std::string& text);

// Where an operation's document comes from: an inline JSON object (copied,
// never persisted) or an id in the service's store (saved after mutation).
struct DocumentSource {
    std::optional<Json::Value> inlineDoc;
    std::string storedId;

    static DocumentSource inline_doc(Json::Value doc);
    static DocumentSource stored(std::string id);
    bool persistent() const { return !inlineDoc.has_value(); }
};

struct FullResponse {
    Json::Value doc;
    std::vector<std::string> activePath;
    std::optional<BranchLevel> latest;
};

struct NodeResponse {
    Json::Value node; // affected node, or null when it no longer exists
    std::vector<std::string> activePath;
    std::optional<BranchLevel> latest;
    std::string updatedAt;
};

struct StatusResponse {
    std::string nodeId;
    std::vector<std::string> activePath;
    std::optional<BranchLevel> latest;
    std::string updatedAt;
};

using Response = std::variant<FullResponse, NodeResponse, StatusResponse>;

Json::Value render(const Response& response);
Json::Value level_to_json(const BranchLevel& level);

class BranchService {
public:
    BranchService(DocumentStore& store, Clock clock);

    // Mutations
    Response append(const DocumentSource& src, const std::string& newId, const std::string& parentId,
                    const std::string& role, const std::string& content, ReturnMode mode = ReturnMode::Full);
    Response retry(const DocumentSource& src, const std::string& newId, const std::string& targetId,
                   const std::string& role, const std::string& content, ReturnMode mode = ReturnMode::Full);
    Response truncate_after(const DocumentSource& src, const std::string& nodeId, ReturnMode mode = ReturnMode::Full);
    Response delete_branch(const DocumentSource& src, const std::string& nodeId, ReturnMode mode = ReturnMode::Full);
    Response switch_branch(const DocumentSource& src, int targetJ, ReturnMode mode = ReturnMode::Full);
    Response update_content(const DocumentSource& src, const std::string& nodeId, const std::string& content,
                            ReturnMode mode = ReturnMode::Full);
    Json::Value retry_user_message(const DocumentSource& src, const std::string& userId);

    // Views
    Json::Value messages(const DocumentSource& src);
    Json::Value branch_table(const DocumentSource& src);
    Json::Value latest(const DocumentSource& src);
    Json::Value latest_message(const DocumentSource& src);

    Document load(const DocumentSource& src);

private:
    Outcome run(const DocumentSource& src, const Command& cmd);
    Response respond(const Outcome& out, ReturnMode mode) const;

    DocumentStore& store_;
    Clock clock_;
};

} // namespace branch
