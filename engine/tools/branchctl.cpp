#include "branch_engine/config.hpp"
#include "branch_engine/conversation.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/json_codec.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/service.hpp"

#include <fmt/core.h>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace branch;

static void usage() {
    fmt::print(stderr,
               "usage: branchctl [--config FILE] [--root DIR] [--mode doc|node|none] [--log-level LEVEL] COMMAND ...\n"
               "\n"
               "FILE is a document id under the storage root, or '-' to read a document from stdin\n"
               "(stdin documents are never saved).\n"
               "\n"
               "  messages FILE                          export the active path as chat messages\n"
               "  table FILE                             branch table (j/n per depth)\n"
               "  latest FILE                            active path and latest node summary\n"
               "  latest-message FILE                    last message on the active path\n"
               "  append FILE PARENT ROLE CONTENT [ID]   append a message plus an empty reply slot\n"
               "  retry FILE TARGET ROLE CONTENT [ID]    add an alternative to TARGET\n"
               "  retry-user FILE USER_ID                find or create the reply to a user message\n"
               "  truncate FILE NODE                     delete NODE and its descendants\n"
               "  delete FILE NODE                       delete NODE's branch and land on a sibling\n"
               "  switch FILE J                          switch the tail to sibling J (1-based)\n"
               "  update FILE NODE CONTENT               replace a node's content\n"
               "  create NAME [DESCRIPTION [OPENING...]] create a new conversation\n"
               "  settings REF get|update [PATCH_JSON]   read or patch a conversation's settings.json\n"
               "  variables REF get|set|merge|reset [DATA_JSON]\n"
               "                                         read or change a conversation's variables.json\n"
               "\n"
               "REF is a conversation slug or one of the files in its folder.\n");
}

// Wraps argv after the options have been consumed.
class Args {
public:
    explicit Args(std::vector<std::string> v) : v_(std::move(v)) {}

    size_t size() const { return v_.size(); }
    const std::string& at(size_t i) const {
        if (i >= v_.size()) throw std::out_of_range("missing argument");
        return v_[i];
    }
    std::string opt(size_t i, const std::string& fallback) const { return i < v_.size() ? v_[i] : fallback; }

private:
    std::vector<std::string> v_;
};

static DocumentSource source_for(const std::string& file) {
    if (file != "-") return DocumentSource::stored(file);
    std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    return DocumentSource::inline_doc(parse_json_text(text, "stdin"));
}

static std::string generated_id(const Clock& clock) {
    return fmt::format("n{}", clock.nowMillis());
}

static Json::Value run_command(BranchService& service, DocumentStore& store, const Clock& clock,
                               ReturnMode mode, const std::string& command, const Args& a) {
    if (command == "create") {
        std::vector<std::string> openings;
        for (size_t i = 2; i < a.size(); ++i) openings.push_back(a.at(i));
        ConversationInfo info = create_conversation(store, a.at(0), a.opt(1, ""), openings, clock);
        Json::Value out(Json::objectValue);
        out["file"] = info.file;
        out["settings_file"] = info.settingsFile;
        out["variables_file"] = info.variablesFile;
        out["slug"] = info.slug;
        out["name"] = info.name;
        out["type"] = info.type;
        out["updated_at"] = info.updatedAt;
        out["root_node_id"] = info.rootNodeId;
        out["nodes_count"] = static_cast<Json::UInt64>(info.nodesCount);
        return out;
    }
    if (command == "settings") {
        SettingsAction action = parse_settings_action(a.at(1));
        Json::Value patch = a.size() > 2 ? parse_json_text(a.at(2), "patch") : Json::Value();
        return conversation_settings(store, conversation_files(a.at(0)), action, patch);
    }
    if (command == "variables") {
        VariablesAction action = parse_variables_action(a.at(1));
        Json::Value data = a.size() > 2 ? parse_json_text(a.at(2), "data") : Json::Value();
        return conversation_variables(store, conversation_files(a.at(0)), action, data);
    }

    DocumentSource src = source_for(a.at(0));
    if (command == "messages") return service.messages(src);
    if (command == "table") return service.branch_table(src);
    if (command == "latest") return service.latest(src);
    if (command == "latest-message") return service.latest_message(src);
    if (command == "retry-user") return service.retry_user_message(src, a.at(1));
    if (command == "append")
        return render(service.append(src, a.opt(4, generated_id(clock)), a.at(1), a.at(2), a.at(3), mode));
    if (command == "retry")
        return render(service.retry(src, a.opt(4, generated_id(clock)), a.at(1), a.at(2), a.at(3), mode));
    if (command == "truncate") return render(service.truncate_after(src, a.at(1), mode));
    if (command == "delete") return render(service.delete_branch(src, a.at(1), mode));
    if (command == "update") return render(service.update_content(src, a.at(1), a.at(2), mode));
    if (command == "switch") return render(service.switch_branch(src, parse_target_j(a.at(1)), mode));
    throw std::invalid_argument("unknown command: " + command);
}

int main(int argc, char** argv) {
    std::optional<std::string> configPath, root, modeText, levelText;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) break;
        if (arg == "--help") {
            usage();
            return 0;
        }
        if (i + 1 >= argc) {
            usage();
            return 2;
        }
        if (arg == "--config") configPath = argv[++i];
        else if (arg == "--root") root = argv[++i];
        else if (arg == "--mode") modeText = argv[++i];
        else if (arg == "--log-level") levelText = argv[++i];
        else {
            usage();
            return 2;
        }
    }
    if (i >= argc) {
        usage();
        return 2;
    }
    const std::string command = argv[i++];
    Args args(std::vector<std::string>(argv + i, argv + argc));

    try {
        EngineConfig config = configPath ? load_config(*configPath) : EngineConfig();
        config = apply_env_overrides(config);
        if (root) config.storageRoot = *root;
        if (modeText) config.defaultReturnMode = parse_return_mode(*modeText);
        if (levelText && !logging::parse_level(*levelText, config.logLevel)) {
            raise(ErrorKind::InvalidConfig, "unknown log level '{}'", *levelText);
        }
        logging::set_level(config.logLevel);

        FileDocumentStore store(config.storageRoot);
        Clock clock = system_clock(config.utcOffsetMinutes);
        BranchService service(store, clock);

        Json::Value out = run_command(service, store, clock, config.defaultReturnMode, command, args);
        fmt::print("{}\n", write_json_text(out));
        return 0;
    } catch (const BranchError& e) {
        Json::Value err(Json::objectValue);
        err["success"] = false;
        err["error_code"] = error_kind_name(e.kind());
        err["message"] = e.what();
        fmt::print("{}\n", write_json_text(err));
        log_error("{}: {}", command, e.what());
        return 1;
    } catch (const std::logic_error& e) {
        fmt::print(stderr, "branchctl: {}\n\n", e.what());
        usage();
        return 2;
    } catch (const std::exception& e) {
        fmt::print(stderr, "branchctl: {}\n", e.what());
        return 1;
    }
}
