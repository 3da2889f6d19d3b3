#include <gtest/gtest.h>

#include <string>

#include "core/snapshot.hpp"
#include "util/registry_fixture.hpp"

using namespace termdeck;
using namespace termdeck::test;

class SnapshotTest : public RegistryFixture
{
};

namespace
{

Session make_session(const SessionId& id, std::optional<WorkspaceId> ws = std::nullopt)
{
    Session s;
    s.id           = id;
    s.params       = host_params(id);
    s.status       = SessionStatus::Connected;
    s.workspace_id = std::move(ws);
    return s;
}

Workspace make_workspace(const WorkspaceId& id, NodePtr root)
{
    Workspace ws;
    ws.id    = id;
    ws.root  = std::move(root);
    ws.title = "Workspace";
    return ws;
}

}   // namespace

// ─── Serialization ───────────────────────────────────────────────────────────

TEST_F(SnapshotTest, SerializeThenDeserializePreservesState)
{
    SessionId   a, b;
    WorkspaceId ws = pair(a, b);
    SessionId   c  = orphan("c");
    registry_.rename_workspace(ws, "Build \"farm\"");
    registry_.update_split_sizes(ws, registry_.workspace(ws)->root->id, {0.25f, 0.75f});
    registry_.reorder_tabs(ws, c, TabDropPosition::Before);

    Snapshot    original = registry_.snapshot();
    std::string text     = serialize_snapshot(original);
    auto        decoded  = deserialize_snapshot(text);
    ASSERT_TRUE(decoded.has_value());

    EXPECT_EQ(decoded->version, Snapshot::CURRENT_VERSION);
    EXPECT_EQ(decoded->active_tab, original.active_tab);
    EXPECT_EQ(decoded->tab_order, original.tab_order);
    ASSERT_EQ(decoded->sessions.size(), 3u);
    EXPECT_EQ(decoded->sessions[0].id, a);
    EXPECT_EQ(decoded->sessions[0].params, original.sessions[0].params);
    EXPECT_EQ(decoded->sessions[0].workspace_id, ws);
    EXPECT_FALSE(decoded->sessions[2].workspace_id.has_value());

    ASSERT_EQ(decoded->workspaces.size(), 1u);
    const Workspace& w = decoded->workspaces[0];
    EXPECT_EQ(w.title, "Build \"farm\"");
    EXPECT_EQ(w.focused_session_id, a);
    EXPECT_EQ(w.root->id, original.workspaces[0].root->id);
    EXPECT_TRUE(equivalent(w.root, original.workspaces[0].root));
    EXPECT_NEAR(w.root->sizes[1], 0.75f, 1e-6f);
}

TEST_F(SnapshotTest, StartupCommandAndSnippetSurvive)
{
    auto ws = registry_.run_on_hosts(Snippet{"snip-9", "Logs", "tail -f /var/log/syslog"},
                                     {host_params("a"), host_params("b")});
    ASSERT_TRUE(ws.has_value());

    auto decoded = deserialize_snapshot(serialize_snapshot(registry_.snapshot()));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->workspaces.size(), 1u);
    EXPECT_EQ(decoded->workspaces[0].view_mode, ViewMode::Focus);
    EXPECT_EQ(decoded->workspaces[0].snippet_id, "snip-9");
    for (const auto& s : decoded->sessions)
        EXPECT_EQ(s.startup_command, "tail -f /var/log/syslog");
}

TEST(SnapshotDecode, RejectsNonSnapshots)
{
    EXPECT_FALSE(deserialize_snapshot("").has_value());
    EXPECT_FALSE(deserialize_snapshot("{not json").has_value());
    EXPECT_FALSE(deserialize_snapshot("[1, 2]").has_value());
    EXPECT_FALSE(deserialize_snapshot(R"({"version": 2})").has_value());
    EXPECT_FALSE(deserialize_snapshot(R"({"version": 0})").has_value());
}

TEST(SnapshotDecode, SkipsMalformedRecords)
{
    auto snap = deserialize_snapshot(R"({
        "version": 1,
        "sessions": [{"id": "session-1"}, {"status": "connected"}, 7],
        "workspaces": [{"title": "no id"}]
    })");
    ASSERT_TRUE(snap.has_value());
    ASSERT_EQ(snap->sessions.size(), 1u);
    EXPECT_EQ(snap->sessions[0].status, SessionStatus::Disconnected);
    EXPECT_TRUE(snap->workspaces.empty());
}

TEST(SnapshotDecode, CollapsesDegenerateSplits)
{
    auto snap = deserialize_snapshot(R"({
        "version": 1,
        "workspaces": [{
            "id": "ws-5",
            "root": {"type": "split", "id": "split-6", "direction": "vertical", "sizes": [1, 1],
                     "children": [
                        {"type": "pane", "session_id": "session-1"},
                        {"type": "split", "id": "split-7", "direction": "horizontal",
                         "children": [{"type": "pane", "session_id": "session-2"},
                                      {"type": "bogus"}]}
                     ]}
        }]
    })");
    ASSERT_TRUE(snap.has_value());
    ASSERT_EQ(snap->workspaces.size(), 1u);
    EXPECT_EQ(describe(snap->workspaces[0].root), "V[session-1, session-2]");
    EXPECT_EQ(snap->workspaces[0].root->id, "split-6");
}

// ─── Repair ──────────────────────────────────────────────────────────────────

TEST(SnapshotRepair, ConsistentSnapshotNeedsNoRepair)
{
    Snapshot snap;
    snap.sessions = {make_session("session-1", "ws-3"), make_session("session-2", "ws-3")};
    snap.workspaces = {make_workspace(
        "ws-3", make_split(SplitDirection::Vertical, {make_pane("session-1"), make_pane("session-2")}))};

    EXPECT_EQ(repair_snapshot(snap), 0u);
    EXPECT_EQ(snap.sessions[0].status, SessionStatus::Disconnected);
}

TEST(SnapshotRepair, DropsDuplicateAndUnknownSessions)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1"), make_session("session-1"), make_session("")};
    snap.workspaces = {make_workspace(
        "ws-3", make_split(SplitDirection::Vertical, {make_pane("session-1"), make_pane("session-9")}))};

    EXPECT_GT(repair_snapshot(snap), 0u);
    ASSERT_EQ(snap.sessions.size(), 1u);
    // One known member is still a workspace.
    ASSERT_EQ(snap.workspaces.size(), 1u);
    EXPECT_EQ(describe(snap.workspaces[0].root), "session-1");
    EXPECT_EQ(snap.sessions[0].workspace_id, "ws-3");
}

TEST(SnapshotRepair, DropsWorkspaceWithNoKnownMembers)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1")};
    snap.workspaces = {make_workspace(
        "ws-3", make_split(SplitDirection::Vertical, {make_pane("session-8"), make_pane("session-9")}))};

    EXPECT_EQ(repair_snapshot(snap), 3u);
    EXPECT_TRUE(snap.workspaces.empty());
    EXPECT_FALSE(snap.sessions[0].workspace_id.has_value());
}

TEST(SnapshotRepair, OnePaneWorkspaceIsConsistent)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1", "ws-2")};
    snap.workspaces = {make_workspace("ws-2", make_pane("session-1"))};

    EXPECT_EQ(repair_snapshot(snap), 0u);
    ASSERT_EQ(snap.workspaces.size(), 1u);
    EXPECT_EQ(snap.sessions[0].workspace_id, "ws-2");
}

TEST(SnapshotRepair, RepeatedPaneKeepsFirstOccurrence)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1", "ws-4"), make_session("session-2", "ws-4")};
    snap.workspaces = {make_workspace(
        "ws-4",
        make_split(SplitDirection::Vertical,
                   {make_pane("session-1"),
                    make_split(SplitDirection::Horizontal, {make_pane("session-2"), make_pane("session-1")})}))};

    EXPECT_EQ(repair_snapshot(snap), 1u);
    ASSERT_EQ(snap.workspaces.size(), 1u);
    EXPECT_EQ(describe(snap.workspaces[0].root), "V[session-1, session-2]");
    EXPECT_EQ(snap.sessions[0].workspace_id, "ws-4");
}

TEST(SnapshotRepair, SessionInTwoWorkspacesStaysInFirst)
{
    Snapshot snap;
    for (const char* id : {"session-1", "session-2", "session-3", "session-4"})
        snap.sessions.push_back(make_session(id));
    snap.workspaces = {
        make_workspace("ws-5",
                       make_split(SplitDirection::Vertical, {make_pane("session-1"), make_pane("session-2")})),
        make_workspace("ws-6",
                       make_split(SplitDirection::Vertical,
                                  {make_pane("session-2"), make_pane("session-3"), make_pane("session-4")})),
    };

    EXPECT_GT(repair_snapshot(snap), 0u);
    ASSERT_EQ(snap.workspaces.size(), 2u);
    EXPECT_EQ(describe(snap.workspaces[1].root), "V[session-3, session-4]");
    EXPECT_EQ(snap.sessions[1].workspace_id, "ws-5");
    EXPECT_EQ(snap.sessions[2].workspace_id, "ws-6");
}

TEST(SnapshotRepair, ResetsForeignFocus)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1", "ws-3"), make_session("session-2", "ws-3")};
    Workspace ws    = make_workspace(
        "ws-3", make_split(SplitDirection::Vertical, {make_pane("session-1"), make_pane("session-2")}));
    ws.focused_session_id = "session-8";
    snap.workspaces       = {ws};

    EXPECT_EQ(repair_snapshot(snap), 1u);
    EXPECT_FALSE(snap.workspaces[0].focused_session_id.has_value());
}

TEST(SnapshotRepair, FixesMembershipFlags)
{
    Snapshot snap;
    snap.sessions   = {make_session("session-1"), make_session("session-2", "ws-x")};
    snap.workspaces = {make_workspace(
        "ws-3", make_split(SplitDirection::Vertical, {make_pane("session-1"), make_pane("session-2")}))};

    EXPECT_EQ(repair_snapshot(snap), 2u);
    EXPECT_EQ(snap.sessions[0].workspace_id, "ws-3");
    EXPECT_EQ(snap.sessions[1].workspace_id, "ws-3");
}
