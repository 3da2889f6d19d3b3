#include <gtest/gtest.h>

#include <memory>

#include "core/session_connector.hpp"
#include "core/snapshot.hpp"
#include "util/fake_terminal_backend.hpp"
#include "util/registry_fixture.hpp"

using namespace termdeck;
using namespace termdeck::test;

class SessionConnectorTest : public RegistryFixture
{
   protected:
    FakeTerminalBackend backend_;
    std::unique_ptr<SessionConnector> connector_ =
        std::make_unique<SessionConnector>(registry_, backend_);
};

// ─── Connection kinds ────────────────────────────────────────────────────────

TEST(ConnectionKindFor, ProtocolNames)
{
    ConnectionParams p;
    EXPECT_EQ(connection_kind_for(p), ConnectionKind::Ssh);
    p.mosh_enabled = true;
    EXPECT_EQ(connection_kind_for(p), ConnectionKind::Mosh);
    p.mosh_enabled = false;
    p.protocol     = "telnet";
    EXPECT_EQ(connection_kind_for(p), ConnectionKind::Telnet);
    p.protocol = "serial";
    EXPECT_EQ(connection_kind_for(p), ConnectionKind::Serial);
    p.protocol = "local";
    EXPECT_EQ(connection_kind_for(p), ConnectionKind::Local);
    EXPECT_STREQ(to_string(ConnectionKind::Mosh), "mosh");
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

TEST_F(SessionConnectorTest, NewSessionsConnect)
{
    SessionId     local  = registry_.create_local_terminal();
    SessionId     remote = orphan("db");
    SessionHandle h      = connector_->handle_for(remote);

    ASSERT_NE(h, INVALID_SESSION_HANDLE);
    EXPECT_NE(connector_->handle_for(local), INVALID_SESSION_HANDLE);
    EXPECT_EQ(connector_->connection_count(), 2u);
    EXPECT_EQ(connector_->session_for(h), remote);
    EXPECT_EQ(backend_.connection(connector_->handle_for(local))->kind, ConnectionKind::Local);
    EXPECT_EQ(backend_.connection(h)->params.hostname, "db.example.net");
}

TEST_F(SessionConnectorTest, StatusForwardedToRegistry)
{
    SessionId     id = orphan("db");
    SessionHandle h  = connector_->handle_for(id);

    backend_.emit_status(h, SessionStatus::Connected);
    EXPECT_EQ(registry_.session(id)->status, SessionStatus::Connected);

    backend_.emit_exit(h, 255);
    EXPECT_EQ(registry_.session(id)->status, SessionStatus::Disconnected);
}

TEST_F(SessionConnectorTest, RefusedConnectionMarksDisconnected)
{
    backend_.refuse_next_connect();
    SessionId id = orphan("db");
    EXPECT_EQ(backend_.refused_count(), 1u);
    EXPECT_EQ(connector_->handle_for(id), INVALID_SESSION_HANDLE);
    EXPECT_EQ(registry_.session(id)->status, SessionStatus::Disconnected);
}

TEST_F(SessionConnectorTest, ClosingSessionClosesConnection)
{
    SessionId     id = orphan("db");
    SessionHandle h  = connector_->handle_for(id);
    registry_.close_session(id);

    EXPECT_TRUE(backend_.connection(h)->closed);
    EXPECT_EQ(connector_->connection_count(), 0u);
    EXPECT_FALSE(connector_->session_for(h).has_value());
}

TEST_F(SessionConnectorTest, ClosingWorkspaceClosesAllMembers)
{
    SessionId   a, b;
    WorkspaceId ws = pair(a, b);
    registry_.close_workspace(ws);
    EXPECT_EQ(backend_.closed_handles().size(), 2u);
    EXPECT_EQ(connector_->connection_count(), 0u);
}

TEST_F(SessionConnectorTest, SplitCloneGetsOwnConnection)
{
    SessionId a     = orphan("db");
    auto      clone = registry_.split_session(a, SplitDirection::Vertical);
    ASSERT_TRUE(clone.has_value());
    EXPECT_NE(connector_->handle_for(*clone), INVALID_SESSION_HANDLE);
    EXPECT_NE(connector_->handle_for(*clone), connector_->handle_for(a));
}

// ─── Startup commands ────────────────────────────────────────────────────────

TEST_F(SessionConnectorTest, StartupCommandSentOnFirstConnect)
{
    auto ws = registry_.run_on_hosts(Snippet{"snip", "Disk", "df -h"}, {host_params("a"), host_params("b")});
    ASSERT_TRUE(ws.has_value());

    auto          members = collect_session_ids(registry_.workspace(*ws)->root);
    SessionHandle h       = connector_->handle_for(members[0]);
    EXPECT_TRUE(backend_.connection(h)->input.empty());

    backend_.emit_status(h, SessionStatus::Connected);
    ASSERT_EQ(backend_.connection(h)->input.size(), 1u);
    EXPECT_EQ(backend_.connection(h)->input[0], "df -h\n");

    // Flapping does not resend.
    backend_.emit_status(h, SessionStatus::Connecting);
    backend_.emit_status(h, SessionStatus::Connected);
    EXPECT_EQ(backend_.connection(h)->input.size(), 1u);

    // The other host has not connected yet.
    EXPECT_TRUE(backend_.connection(connector_->handle_for(members[1]))->input.empty());
}

TEST_F(SessionConnectorTest, ExitBeforeConnectDropsCommand)
{
    auto ws = registry_.run_on_hosts(Snippet{"snip", "Disk", "df -h"}, {host_params("a"), host_params("b")});
    ASSERT_TRUE(ws.has_value());
    SessionHandle h = connector_->handle_for(collect_session_ids(registry_.workspace(*ws)->root)[0]);

    backend_.emit_exit(h, 1);
    backend_.emit_status(h, SessionStatus::Connected);
    EXPECT_TRUE(backend_.connection(h)->input.empty());
}

// ─── Reconnect ───────────────────────────────────────────────────────────────

TEST_F(SessionConnectorTest, ReconnectOnlyWhenDisconnected)
{
    SessionId     id = orphan("db");
    SessionHandle h  = connector_->handle_for(id);
    EXPECT_FALSE(connector_->reconnect(id));

    backend_.emit_exit(h, 0);
    EXPECT_TRUE(connector_->reconnect(id));
    SessionHandle fresh = connector_->handle_for(id);
    EXPECT_NE(fresh, h);
    EXPECT_TRUE(backend_.connection(h)->closed);
    EXPECT_EQ(registry_.session(id)->status, SessionStatus::Connecting);
    EXPECT_FALSE(connector_->reconnect("session-missing"));
}

TEST_F(SessionConnectorTest, RestoredSessionsReconnectWithoutReplay)
{
    auto ws = registry_.run_on_hosts(Snippet{"snip", "Disk", "df -h"}, {host_params("a"), host_params("b")});
    ASSERT_TRUE(ws.has_value());
    Snapshot snap = registry_.snapshot();
    registry_.restore(snap);

    // Restore reports the previous sessions as removed.
    EXPECT_EQ(connector_->connection_count(), 0u);

    for (const auto& s : registry_.sessions())
    {
        ASSERT_TRUE(connector_->reconnect(s.id));
        SessionHandle h = connector_->handle_for(s.id);
        backend_.emit_status(h, SessionStatus::Connected);
        EXPECT_TRUE(backend_.connection(h)->input.empty());
    }
}

// ─── Teardown ────────────────────────────────────────────────────────────────

TEST_F(SessionConnectorTest, DestructionClosesAndDetaches)
{
    SessionId     id = orphan("db");
    SessionHandle h  = connector_->handle_for(id);
    connector_.reset();

    EXPECT_TRUE(backend_.connection(h)->closed);

    // Late backend callbacks are ignored.
    backend_.emit_status(h, SessionStatus::Connected);
    EXPECT_EQ(registry_.session(id)->status, SessionStatus::Connecting);

    // New sessions are no longer connected.
    size_t before = backend_.connect_count();
    orphan("web");
    EXPECT_EQ(backend_.connect_count(), before);
}
