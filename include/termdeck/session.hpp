#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>

namespace termdeck
{

enum class SessionStatus
{
    Connecting,
    Connected,
    Disconnected
};

const char*                  to_string(SessionStatus status);
std::optional<SessionStatus> session_status_from_string(std::string_view s);

// What the backend needs to open (or re-open) a connection. Splitting a pane
// copies these, never the live connection.
struct ConnectionParams
{
    std::string host_id;
    std::string host_label;
    std::string hostname;
    std::string username;
    std::string protocol = "ssh";   // ssh, telnet, mosh, local, serial
    uint16_t    port     = 22;
    bool        mosh_enabled = false;

    bool is_local() const { return protocol == "local"; }

    bool operator==(const ConnectionParams&) const = default;
};

struct Session
{
    SessionId                  id;
    ConnectionParams           params;
    SessionStatus              status = SessionStatus::Connecting;
    std::optional<WorkspaceId> workspace_id;      // Unset for an orphan tab
    std::optional<std::string> startup_command;   // Sent once after connecting

    bool is_orphan() const { return !workspace_id.has_value(); }
};

}   // namespace termdeck
