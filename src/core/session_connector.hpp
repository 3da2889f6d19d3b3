#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <termdeck/fwd.hpp>
#include <termdeck/terminal_backend.hpp>
#include <unordered_map>

namespace termdeck
{

class SessionRegistry;

/**
 * SessionConnector: Binds registry sessions to live backend connections.
 *
 * Every session the registry adds is connected; every session it removes is
 * closed. Backend status and exit callbacks are forwarded to
 * SessionRegistry::update_session_status, and a session's startup command is
 * sent once, on its first transition to Connected. A refused connection
 * (INVALID_SESSION_HANDLE) leaves the session Disconnected.
 *
 * Destroying the connector closes every connection it still holds and
 * detaches it from the registry.
 */
class SessionConnector
{
   public:
    SessionConnector(SessionRegistry& registry, TerminalBackend& backend);
    ~SessionConnector();

    SessionConnector(const SessionConnector&)            = delete;
    SessionConnector& operator=(const SessionConnector&) = delete;

    // Opens a new connection for a Disconnected session (e.g. after restore).
    // The startup command is not replayed.
    bool reconnect(const SessionId& session_id);

    SessionHandle            handle_for(const SessionId& session_id) const;
    std::optional<SessionId> session_for(SessionHandle handle) const;
    size_t                   connection_count() const;

   private:
    struct Link;

    void on_session_added(const Session& session);
    void on_session_removed(const SessionId& session_id);
    bool open(const SessionId&                 session_id,
              const ConnectionParams&          params,
              const std::optional<std::string>& startup_command);

    SessionRegistry& registry_;
    TerminalBackend& backend_;

    // Shared with backend callbacks so they become no-ops once we are gone.
    std::shared_ptr<Link> link_;

    mutable std::mutex                         mutex_;
    std::unordered_map<SessionId, SessionHandle> handles_;
};

}   // namespace termdeck
