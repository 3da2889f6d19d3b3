#include "session_connector.hpp"

#include <termdeck/logger.hpp>
#include <vector>

#include "session_registry.hpp"

namespace termdeck
{

const char* to_string(ConnectionKind kind)
{
    switch (kind)
    {
        case ConnectionKind::Local:
            return "local";
        case ConnectionKind::Ssh:
            return "ssh";
        case ConnectionKind::Telnet:
            return "telnet";
        case ConnectionKind::Mosh:
            return "mosh";
        case ConnectionKind::Serial:
            return "serial";
    }
    return "ssh";
}

ConnectionKind connection_kind_for(const ConnectionParams& params)
{
    if (params.protocol == "local")
        return ConnectionKind::Local;
    if (params.protocol == "serial")
        return ConnectionKind::Serial;
    if (params.protocol == "telnet")
        return ConnectionKind::Telnet;
    if (params.protocol == "mosh" || params.mosh_enabled)
        return ConnectionKind::Mosh;
    return ConnectionKind::Ssh;
}

struct SessionConnector::Link
{
    std::mutex       mutex;
    bool             alive = true;
    SessionRegistry* registry = nullptr;
    TerminalBackend* backend  = nullptr;

    // Startup commands waiting for their session's first Connected status.
    std::unordered_map<SessionHandle, std::string> pending_commands;
};

SessionConnector::SessionConnector(SessionRegistry& registry, TerminalBackend& backend)
    : registry_(registry), backend_(backend), link_(std::make_shared<Link>())
{
    link_->registry = &registry_;
    link_->backend  = &backend_;
    registry_.set_on_session_added([this](const Session& s) { on_session_added(s); });
    registry_.set_on_session_removed([this](const SessionId& id) { on_session_removed(id); });
}

SessionConnector::~SessionConnector()
{
    registry_.set_on_session_added(nullptr);
    registry_.set_on_session_removed(nullptr);
    {
        std::lock_guard lock(link_->mutex);
        link_->alive = false;
        link_->pending_commands.clear();
    }

    std::unordered_map<SessionId, SessionHandle> handles;
    {
        std::lock_guard lock(mutex_);
        handles.swap(handles_);
    }
    for (const auto& [id, handle] : handles)
        backend_.close(handle);
}

bool SessionConnector::open(const SessionId&                  session_id,
                            const ConnectionParams&           params,
                            const std::optional<std::string>& startup_command)
{
    const ConnectionKind kind   = connection_kind_for(params);
    const SessionHandle  handle = backend_.connect(kind, params);
    if (handle == INVALID_SESSION_HANDLE)
    {
        TERMDECK_LOG_WARN("backend", "{} connection refused for {}", to_string(kind), session_id);
        registry_.update_session_status(session_id, SessionStatus::Disconnected);
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        handles_[session_id] = handle;
    }
    if (startup_command && !startup_command->empty())
    {
        std::lock_guard lock(link_->mutex);
        link_->pending_commands[handle] = *startup_command;
    }

    std::weak_ptr<Link> weak = link_;
    backend_.on_status_change(
        handle,
        [weak, handle, session_id](SessionStatus status)
        {
            auto link = weak.lock();
            if (!link)
                return;
            std::string command;
            {
                std::lock_guard lock(link->mutex);
                if (!link->alive)
                    return;
                if (status == SessionStatus::Connected)
                {
                    auto it = link->pending_commands.find(handle);
                    if (it != link->pending_commands.end())
                    {
                        command = std::move(it->second);
                        link->pending_commands.erase(it);
                    }
                }
            }
            link->registry->update_session_status(session_id, status);
            if (!command.empty() && !link->backend->send_input(handle, command + "\n"))
                TERMDECK_LOG_WARN("backend", "startup command not delivered to {}", session_id);
        });
    backend_.on_exit(handle,
                     [weak, handle, session_id](int exit_code)
                     {
                         auto link = weak.lock();
                         if (!link)
                             return;
                         {
                             std::lock_guard lock(link->mutex);
                             if (!link->alive)
                                 return;
                             link->pending_commands.erase(handle);
                         }
                         TERMDECK_LOG_INFO("backend", "{} exited with code {}", session_id, exit_code);
                         link->registry->update_session_status(session_id, SessionStatus::Disconnected);
                     });

    TERMDECK_LOG_DEBUG("backend", "{} connecting via {} (handle {})", session_id, to_string(kind), handle);
    return true;
}

void SessionConnector::on_session_added(const Session& session)
{
    open(session.id, session.params, session.startup_command);
}

void SessionConnector::on_session_removed(const SessionId& session_id)
{
    SessionHandle handle = INVALID_SESSION_HANDLE;
    {
        std::lock_guard lock(mutex_);
        auto            it = handles_.find(session_id);
        if (it == handles_.end())
            return;
        handle = it->second;
        handles_.erase(it);
    }
    {
        std::lock_guard lock(link_->mutex);
        link_->pending_commands.erase(handle);
    }
    backend_.close(handle);
    TERMDECK_LOG_DEBUG("backend", "{} closed (handle {})", session_id, handle);
}

bool SessionConnector::reconnect(const SessionId& session_id)
{
    auto session = registry_.session(session_id);
    if (!session || session->status != SessionStatus::Disconnected)
        return false;

    SessionHandle old = INVALID_SESSION_HANDLE;
    {
        std::lock_guard lock(mutex_);
        auto            it = handles_.find(session_id);
        if (it != handles_.end())
        {
            old = it->second;
            handles_.erase(it);
        }
    }
    if (old != INVALID_SESSION_HANDLE)
        backend_.close(old);

    registry_.update_session_status(session_id, SessionStatus::Connecting);
    return open(session_id, session->params, std::nullopt);
}

SessionHandle SessionConnector::handle_for(const SessionId& session_id) const
{
    std::lock_guard lock(mutex_);
    auto            it = handles_.find(session_id);
    return it != handles_.end() ? it->second : INVALID_SESSION_HANDLE;
}

std::optional<SessionId> SessionConnector::session_for(SessionHandle handle) const
{
    std::lock_guard lock(mutex_);
    for (const auto& [id, h] : handles_)
    {
        if (h == handle)
            return id;
    }
    return std::nullopt;
}

size_t SessionConnector::connection_count() const
{
    std::lock_guard lock(mutex_);
    return handles_.size();
}

}   // namespace termdeck
