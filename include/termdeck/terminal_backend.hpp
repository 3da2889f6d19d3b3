#pragma once

#include <functional>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <termdeck/session.hpp>

namespace termdeck
{

enum class ConnectionKind
{
    Local,
    Ssh,
    Telnet,
    Mosh,
    Serial
};

const char* to_string(ConnectionKind kind);

// Derives the kind from the params' protocol name (and mosh flag).
ConnectionKind connection_kind_for(const ConnectionParams& params);

// Contract with whatever actually runs terminals (pty, ssh client, serial
// port). Handles are opaque; INVALID_SESSION_HANDLE means the backend refused
// the connection outright.
//
// Callbacks may be invoked from a backend thread.
class TerminalBackend
{
   public:
    using StatusCallback = std::function<void(SessionStatus status)>;
    using ExitCallback   = std::function<void(int exit_code)>;

    virtual ~TerminalBackend() = default;

    virtual SessionHandle connect(ConnectionKind kind, const ConnectionParams& params) = 0;
    virtual void          close(SessionHandle handle)                                  = 0;

    virtual void on_status_change(SessionHandle handle, StatusCallback cb) = 0;
    virtual void on_exit(SessionHandle handle, ExitCallback cb)            = 0;

    // Optional: deliver a one-shot command once the session is connected.
    virtual bool send_input(SessionHandle /*handle*/, std::string_view /*data*/) { return false; }
};

}   // namespace termdeck
