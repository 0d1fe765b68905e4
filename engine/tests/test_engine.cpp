#include "branch_engine/types.hpp"
#include "branch_engine/log.hpp"
#include "branch_engine/path.hpp"
#include "branch_engine/tree_utils.hpp"
#include "branch_engine/views.hpp"
#include "test_support.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <random>
#include <unordered_set>
#include <vector>

using namespace branch;
using namespace branch::test;

static const Clock kClock = fixed_clock(1700000000000);
static const char* kStamp = "2023-11-15T06:13:20+08:00";

// r -> u1 -> {a1, a2, a3}, a2 -> u2; active path ends at u2
static const char* kBaseDoc = R"({
  "name": "demo",
  "roots": ["r"],
  "nodes": {
    "r":  {"pid": null, "role": "system", "content": "sys"},
    "u1": {"pid": "r", "role": "user", "content": "hello"},
    "a1": {"pid": "u1", "role": "assistant", "content": "first"},
    "a2": {"pid": "u1", "role": "assistant", "content": "second"},
    "a3": {"pid": "u1", "role": "assistant", "content": "third"},
    "u2": {"pid": "a2", "role": "user", "content": "more"}
  },
  "children": {"r": ["u1"], "u1": ["a1", "a2", "a3"], "a2": ["u2"]},
  "active_path": ["r", "u1", "a2", "u2"]
})";

static Document base_with_path(const std::vector<std::string>& path) {
    Document d = doc_from_text(kBaseDoc);
    d.activePath.clear();
    for (const auto& id : path) d.activePath.push_back(*find_node(d, id));
    return d;
}

static std::vector<std::string> active(const Document& d) { return path_ids(d, d.activePath); }

static std::vector<std::string> child_ids(const Document& d, const std::string& id) {
    return path_ids(d, node_at(d, *find_node(d, id)).children);
}

static std::string snapshot(const Document& d) { return write_json_text(document_to_json(d)); }

// Invariant checks: linkage both ways, each node contained exactly once, all
// nodes reachable, active path connected and rooted, wire form reloads intact
static void verify_invariants(const Document& d) {
    size_t alive = 0;
    for (NodeHandle h = 0; h < d.arena.size(); ++h) {
        const Node& n = d.arena[h];
        if (!n.alive) continue;
        ++alive;
        auto it = d.ids.find(n.id);
        assert_true(it != d.ids.end() && it->second == h, "id map points at node");
        std::unordered_set<NodeHandle> childset;
        for (NodeHandle c : n.children) {
            assert_true(c < d.arena.size() && d.arena[c].alive, "child exists");
            assert_true(childset.insert(c).second, "no duplicate children");
            assert_true(d.arena[c].parent == h, "child parent link");
        }
    }
    assert_eq_size(d.ids.size(), alive, "id map size matches live nodes");

    std::vector<int> contain(d.arena.size(), 0);
    std::unordered_set<NodeHandle> rootset;
    for (NodeHandle r : d.roots) {
        assert_true(r < d.arena.size() && d.arena[r].alive, "root exists");
        assert_true(d.arena[r].parent == kNoNode, "root has no parent");
        assert_true(rootset.insert(r).second, "no duplicate roots");
        contain[r] += 1;
    }
    for (const auto& n : d.arena) {
        if (!n.alive) continue;
        for (NodeHandle c : n.children) contain[c] += 1;
    }
    for (NodeHandle h = 0; h < d.arena.size(); ++h) {
        if (d.arena[h].alive) assert_true(contain[h] == 1, "node appears exactly once in roots or under its parent");
    }

    std::vector<bool> seen(d.arena.size(), false);
    std::vector<NodeHandle> stack(d.roots.begin(), d.roots.end());
    size_t reached = 0;
    while (!stack.empty()) {
        NodeHandle h = stack.back();
        stack.pop_back();
        assert_true(!seen[h], "no node reached twice");
        seen[h] = true;
        ++reached;
        for (NodeHandle c : d.arena[h].children) stack.push_back(c);
    }
    assert_eq_size(reached, alive, "no orphans reachable from roots");

    if (!d.activePath.empty()) {
        assert_true(index_of(d.roots, d.activePath.front()).has_value(), "active path starts at a root");
        for (size_t i = 1; i < d.activePath.size(); ++i) {
            NodeHandle h = d.activePath[i];
            assert_true(d.arena[h].alive, "active path node exists");
            assert_true(index_of(d.arena[d.activePath[i - 1]].children, h).has_value(), "active path connected");
        }
        assert_ids(path_ids(d, normalize_path(d)), active(d), "active path already normalized");
    }

    Document back = document_from_json(document_to_json(d));
    assert_eq_size(live_node_count(back), alive, "node count survives round trip");
    assert_ids(active(back), active(d), "active path survives round trip");
    assert_ids(path_ids(back, back.roots), path_ids(d, d.roots), "roots survive round trip");
}

static Outcome apply_and_check(const Document& d, const Command& cmd, std::optional<long> expectDelta = std::nullopt,
                               const Clock& clock = kClock) {
    Outcome out = apply_command(d, cmd, clock);
    verify_invariants(out.doc);
    if (expectDelta.has_value()) {
        long delta = static_cast<long>(live_node_count(out.doc)) - static_cast<long>(live_node_count(d));
        assert_true(delta == *expectDelta, "node count delta matches expectation");
    }
    return out;
}

int main() {
    logging::set_level(LogLevel::None);

    // 1) Initial document
    Document d = initial_document("r", Role::System, "sys", kClock);
    verify_invariants(d);
    assert_ids(active(d), { "r" }, "initial path is the root");
    assert_eq(d.updatedAt, kStamp, "initial updated_at");
    assert_eq(node_at(d, d.roots[0]).updatedAt, kStamp, "root node timestamp");

    // 2) Append under the tail: node plus placeholder extend the path
    Outcome o = apply_and_check(d, Command{ CommandType::Append, "r", "u1", "user", "hi" }, +2);
    assert_ids(active(o.doc), { "r", "u1", "n_append_ass1700000000000" }, "append extends path by two");
    assert_eq(o.nodeId, "u1", "append reports new node");
    assert_eq(o.placeholderId, "n_append_ass1700000000000", "append reports placeholder");
    {
        const Node& slot = node_at(o.doc, *find_node(o.doc, o.placeholderId));
        assert_true(slot.role == Role::Assistant, "placeholder is assistant");
        assert_true(slot.content.empty(), "placeholder is empty");
        assert_true(is_placeholder(slot), "placeholder is recognised");
        assert_eq(node_at(o.doc, slot.parent).id, "u1", "placeholder hangs off the new node");
    }
    assert_eq(o.doc.updatedAt, kStamp, "append refreshes updated_at");

    // Append under a non-tail node: path unchanged, placeholder id bumped past the existing one
    Outcome o2 = apply_and_check(o.doc, Command{ CommandType::Append, "r", "u1b", "user", "alt" }, +2);
    assert_ids(active(o2.doc), active(o.doc), "off-path append keeps path");
    assert_eq(o2.placeholderId, "n_append_ass1700000000001", "placeholder id made unique");
    assert_ids(child_ids(o2.doc, "r"), { "u1", "u1b" }, "append goes to the end of children");

    // 3) Append errors, checked in order: duplicate id, missing parent, bad role
    {
        const std::string before = snapshot(o.doc);
        expect_error([&] { apply_command(o.doc, Command{ CommandType::Append, "nope", "u1", "robot", "x" }, kClock); },
                     ErrorKind::DuplicateId, "duplicate id wins over missing parent");
        expect_error([&] { apply_command(o.doc, Command{ CommandType::Append, "nope", "fresh", "robot", "x" }, kClock); },
                     ErrorKind::NotFound, "missing parent wins over bad role");
        expect_error([&] { apply_command(o.doc, Command{ CommandType::Append, "u1", "fresh", "robot", "x" }, kClock); },
                     ErrorKind::InvalidRole, "bad role rejected");
        assert_eq(snapshot(o.doc), before, "failed append leaves document untouched");
    }

    // 4) Retry
    d = doc_from_text(kBaseDoc);
    verify_invariants(d);
    o = apply_and_check(d, Command{ CommandType::Retry, "a2", "a4", "assistant", "fourth" }, +1);
    assert_ids(active(o.doc), { "r", "u1", "a4" }, "retry of an on-path node replaces it and drops the tail");
    assert_ids(child_ids(o.doc, "u1"), { "a1", "a2", "a3", "a4" }, "retry appends a sibling");
    assert_true(find_node(o.doc, "u2").has_value(), "retry keeps the old continuation");
    assert_eq(o.nodeId, "a4", "retry reports new node");

    o = apply_and_check(d, Command{ CommandType::Retry, "a1", "a4", "assistant", "fourth" }, +1);
    assert_ids(active(o.doc), { "r", "u1", "a2", "u2" }, "off-path retry keeps path when parent is not the tail");

    o = apply_and_check(base_with_path({ "r", "u1" }), Command{ CommandType::Retry, "a1", "a9", "assistant", "x" }, +1);
    assert_ids(active(o.doc), { "r", "u1", "a9" }, "off-path retry extends path when parent is the tail");

    expect_error([&] { apply_command(d, Command{ CommandType::Retry, "r", "r2", "system", "x" }, kClock); },
                 ErrorKind::InvalidOperation, "root cannot be retried");
    expect_error([&] { apply_command(d, Command{ CommandType::Retry, "a2", "a1", "assistant", "x" }, kClock); },
                 ErrorKind::DuplicateId, "retry with an existing id");
    expect_error([&] { apply_command(d, Command{ CommandType::Retry, "zz", "a9", "assistant", "x" }, kClock); },
                 ErrorKind::NotFound, "retry of a missing node");
    expect_error([&] { apply_command(d, Command{ CommandType::Retry, "a2", "a9", "bot", "x" }, kClock); },
                 ErrorKind::InvalidRole, "retry with a bad role");

    // 5) RetryUserMessage: path reply, then any reply, then a new slot
    o = apply_and_check(d, Command{ CommandType::RetryUserMessage, "u1" }, 0);
    assert_eq(o.nodeId, "a2", "reply on the active path wins");
    assert_true(o.retryAction == RetryAction::RetryAssistant, "existing reply reported");
    assert_true(!o.changed, "reporting an existing reply is not a change");
    assert_eq(o.doc.updatedAt, "", "updated_at untouched without a change");

    o = apply_and_check(base_with_path({ "r", "u1" }), Command{ CommandType::RetryUserMessage, "u1" }, 0);
    assert_eq(o.nodeId, "a1", "first assistant child when the path stops at the user");
    assert_true(o.retryAction == RetryAction::RetryAssistant, "child reply reported");

    o = apply_and_check(d, Command{ CommandType::RetryUserMessage, "u2" }, +1);
    assert_eq(o.nodeId, "n_retry_ass1700000000000", "slot created for an unanswered user");
    assert_eq(o.placeholderId, o.nodeId, "slot is the placeholder");
    assert_true(o.retryAction == RetryAction::CreateAssistant, "creation reported");
    assert_ids(active(o.doc), { "r", "u1", "a2", "u2", "n_retry_ass1700000000000" }, "slot appended to path");
    assert_eq(o.doc.updatedAt, kStamp, "creation refreshes updated_at");

    o = apply_and_check(base_with_path({ "r", "u1", "a1" }), Command{ CommandType::RetryUserMessage, "u2" }, +1);
    assert_ids(active(o.doc), { "r", "u1", "a1" }, "off-path slot leaves path alone");

    expect_error([&] { apply_command(d, Command{ CommandType::RetryUserMessage, "a1" }, kClock); },
                 ErrorKind::InvalidOperation, "retry-user on an assistant node");
    expect_error([&] { apply_command(d, Command{ CommandType::RetryUserMessage, "zz" }, kClock); },
                 ErrorKind::NotFound, "retry-user on a missing node");

    // 6) TruncateAfter
    o = apply_and_check(d, Command{ CommandType::TruncateAfter, "a2" }, -2);
    assert_ids(active(o.doc), { "r", "u1" }, "truncate collapses path to the surviving ancestor");
    assert_true(!find_node(o.doc, "a2") && !find_node(o.doc, "u2"), "subtree removed");
    assert_ids(child_ids(o.doc, "u1"), { "a1", "a3" }, "parent children scrubbed");

    o = apply_and_check(d, Command{ CommandType::TruncateAfter, "a3" }, -1);
    assert_ids(active(o.doc), active(d), "truncating off-path keeps path");

    o = apply_and_check(d, Command{ CommandType::TruncateAfter, "u2" }, -1);
    assert_ids(active(o.doc), { "r", "u1", "a2" }, "truncating the tail");
    assert_true(o.doc.ids.size() == 5 && document_to_json(o.doc)["children"].isMember("a2") == false,
                "emptied children entry dropped from wire form");

    expect_error([&] { apply_command(d, Command{ CommandType::TruncateAfter, "zz" }, kClock); },
                 ErrorKind::NotFound, "truncate of a missing node");

    // 7) DeleteBranch re-anchors on a neighbouring sibling
    o = apply_and_check(d, Command{ CommandType::DeleteBranch, "a2" }, -2);
    assert_ids(active(o.doc), { "r", "u1", "a3" }, "successor takes the vacated slot");
    assert_eq(o.nodeId, "a2", "delete reports the removed node");

    o = apply_and_check(base_with_path({ "r", "u1", "a3" }), Command{ CommandType::DeleteBranch, "a3" }, -1);
    assert_ids(active(o.doc), { "r", "u1", "a2" }, "deleting the last sibling lands on the new last");

    o = apply_and_check(d, Command{ CommandType::DeleteBranch, "u2" }, -1);
    assert_ids(active(o.doc), { "r", "u1", "a2" }, "sole child leaves nothing to re-anchor on");

    o = apply_and_check(d, Command{ CommandType::DeleteBranch, "a1" }, -1);
    assert_ids(active(o.doc), active(d), "deleting off-path keeps path");

    {
        Document two = doc_from_text(R"({"roots":["r1","r2"],
            "nodes":{"r1":{"pid":null,"role":"system","content":"one"},
                     "r2":{"pid":null,"role":"system","content":"two"},
                     "c":{"pid":"r1","role":"user","content":"hey"}},
            "active_path":["r1","c"]})");
        verify_invariants(two);
        o = apply_and_check(two, Command{ CommandType::DeleteBranch, "r1" }, -2);
        assert_true(o.doc.activePath.empty(), "deleting an active root leaves the stored path empty");
        assert_ids(path_ids(o.doc, normalize_path(o.doc)), { "r2" }, "empty path resolves to the remaining root");
        assert_ids(path_ids(o.doc, o.doc.roots), { "r2" }, "root removed from roots");

        o = apply_and_check(o.doc, Command{ CommandType::DeleteBranch, "r2" }, -1);
        assert_true(o.doc.roots.empty() && o.doc.activePath.empty(), "last root deleted");
        const Document empty = o.doc;
        expect_error([&] { apply_command(empty, Command{ CommandType::UpdateContent, "x", "", "", "y" }, kClock); },
                     ErrorKind::InvalidDocument, "a document without roots cannot be operated on");
    }
    {
        Document three = doc_from_text(R"({"roots":["r1","r2","r3"],
            "nodes":{"r1":{"pid":null,"role":"system","content":"one"},
                     "r2":{"pid":null,"role":"system","content":"two"},
                     "r3":{"pid":null,"role":"system","content":"three"}},
            "active_path":["r2"]})");
        o = apply_and_check(three, Command{ CommandType::DeleteBranch, "r2" }, -1);
        assert_true(o.doc.activePath.empty(), "middle root deleted without re-anchoring");
        assert_ids(path_ids(o.doc, normalize_path(o.doc)), { "r1" }, "path falls back to the first root, not the successor");
        assert_ids(path_ids(o.doc, o.doc.roots), { "r1", "r3" }, "remaining roots keep their order");
    }

    // 8) SwitchBranch
    {
        Document two = doc_from_text(R"({"roots":["r1","r2"],
            "nodes":{"r1":{"pid":null,"role":"system","content":"root"},
                     "r2":{"pid":null,"role":"system","content":"root"}},
            "active_path":["r1"]})");
        Command sw{ CommandType::SwitchBranch };
        sw.targetJ = 2;
        o = apply_and_check(two, sw, 0);
        assert_ids(active(o.doc), { "r2" }, "switch among roots");
        BranchLevel latest = latest_summary(o.doc);
        assert_eq_size(latest.depth, 1, "latest depth");
        assert_eq(latest.nodeId, "r2", "latest node");
        assert_true(latest.j == size_t(2), "latest j");
        assert_eq_size(latest.n, 2, "latest n");
        sw.targetJ = 3;
        expect_error([&] { apply_command(two, sw, kClock); }, ErrorKind::OutOfRange, "switch past the last root");
    }
    {
        Document mid = base_with_path({ "r", "u1", "a2" });
        Command sw{ CommandType::SwitchBranch };
        sw.targetJ = 3;
        o = apply_and_check(mid, sw, 0);
        assert_ids(active(o.doc), { "r", "u1", "a3" }, "switch replaces the tail");
        assert_eq(o.nodeId, "a3", "switch reports the chosen node");
        sw.targetJ = 1;
        o = apply_and_check(mid, sw, 0);
        assert_ids(active(o.doc), { "r", "u1", "a1" }, "switch to the first sibling");
        sw.targetJ = 0;
        expect_error([&] { apply_command(mid, sw, kClock); }, ErrorKind::OutOfRange, "switch to zero");
        sw.targetJ = 4;
        try {
            apply_command(mid, sw, kClock);
            assert_true(false, "switch past the end must fail");
        } catch (const BranchError& e) {
            assert_true(e.kind() == ErrorKind::OutOfRange, "switch past the end kind");
            assert_eq(e.what(), "Invalid target_j=4, must be between 1 and 3", "switch range message");
        }
    }

    // 9) UpdateContent
    {
        const Clock later = fixed_clock(1700000060000);
        o = apply_and_check(d, Command{ CommandType::UpdateContent, "a1", "", "", "edited" }, 0, later);
        const Node& a1 = node_at(o.doc, *find_node(o.doc, "a1"));
        assert_eq(a1.content, "edited", "content replaced");
        assert_eq(a1.updatedAt, "2023-11-15T06:14:20+08:00", "node timestamp refreshed");
        assert_eq(o.doc.updatedAt, "2023-11-15T06:14:20+08:00", "document timestamp refreshed");
        assert_ids(active(o.doc), active(d), "update keeps path");
        expect_error([&] { apply_command(d, Command{ CommandType::UpdateContent, "zz", "", "", "x" }, kClock); },
                     ErrorKind::NotFound, "update of a missing node");
    }

    // 10) Mutations start from the repaired path
    {
        Document drifted = base_with_path({ "r", "a1" });
        o = apply_and_check(drifted, Command{ CommandType::Append, "r", "u9", "user", "again" }, +2);
        assert_ids(active(o.doc), { "r", "u9", "n_append_ass1700000000000" }, "drifted path repaired before append");
    }

    // 11) Property-ish fuzz: random operations maintain invariants
    {
        std::mt19937 rng(static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
        std::int64_t now = 1700000000000;
        Clock ticking;
        ticking.nowMillis = [&now] { return now; };
        static const char* roles[] = { "user", "assistant", "system", "narrator" };

        Document s = initial_document("root", Role::System, "sys", ticking);
        int fresh = 0;
        size_t accepted = 0;
        for (int i = 0; i < 2000; ++i) {
            now += 1000;
            if (s.roots.empty()) s = initial_document("root", Role::System, "sys", ticking);
            std::vector<std::string> ids;
            for (const auto& kv : s.ids) ids.push_back(kv.first);
            std::uniform_int_distribution<size_t> pick(0, ids.size() - 1);
            std::uniform_int_distribution<int> cmdDist(0, 9);
            std::uniform_int_distribution<int> coin(0, 3);
            const std::string id = ids[pick(rng)];
            const std::string newId = coin(rng) == 0 ? ids[pick(rng)] : "f" + std::to_string(fresh++);
            const std::string role = roles[coin(rng)];

            Command cmd{ CommandType::UpdateContent, id, "", "", "z" };
            switch (cmdDist(rng)) {
                case 0: case 1: case 2:
                    cmd = Command{ CommandType::Append, id, newId, role, "x" };
                    break;
                case 3: case 4:
                    cmd = Command{ CommandType::Retry, id, newId, role, "y" };
                    break;
                case 5:
                    cmd = Command{ CommandType::RetryUserMessage, id };
                    break;
                case 6:
                    cmd = Command{ CommandType::TruncateAfter, id };
                    break;
                case 7:
                    cmd = Command{ CommandType::DeleteBranch, id };
                    break;
                case 8:
                    cmd = Command{ CommandType::SwitchBranch };
                    cmd.targetJ = coin(rng);
                    break;
                default:
                    break;
            }

            const std::string before = snapshot(s);
            try {
                Outcome out = apply_command(s, cmd, ticking);
                verify_invariants(out.doc);
                s = std::move(out.doc);
                ++accepted;
            } catch (const BranchError&) {
                assert_eq(snapshot(s), before, "rejected command leaves document untouched");
            }
        }
        assert_true(accepted > 0, "fuzz applied some commands");
    }

    std::cout << "All engine tests passed." << std::endl;
    return 0;
}
