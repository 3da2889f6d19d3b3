#include "session_registry.hpp"

#include <algorithm>
#include <cctype>
#include <termdeck/logger.hpp>
#include <unordered_map>
#include <unordered_set>

#include "ids.hpp"
#include "snapshot.hpp"

namespace termdeck
{

const char* to_string(SessionStatus status)
{
    switch (status)
    {
        case SessionStatus::Connecting:
            return "connecting";
        case SessionStatus::Connected:
            return "connected";
        case SessionStatus::Disconnected:
            return "disconnected";
    }
    return "disconnected";
}

std::optional<SessionStatus> session_status_from_string(std::string_view s)
{
    if (s == "connecting")
        return SessionStatus::Connecting;
    if (s == "connected")
        return SessionStatus::Connected;
    if (s == "disconnected")
        return SessionStatus::Disconnected;
    return std::nullopt;
}

const char* to_string(ViewMode mode)
{
    return mode == ViewMode::Focus ? "focus" : "split";
}

std::optional<ViewMode> view_mode_from_string(std::string_view s)
{
    if (s == "split")
        return ViewMode::Split;
    if (s == "focus")
        return ViewMode::Focus;
    return std::nullopt;
}

static SplitPosition default_position(SplitDirection direction)
{
    return direction == SplitDirection::Horizontal ? SplitPosition::Bottom : SplitPosition::Right;
}

static std::string trimmed(std::string_view s)
{
    size_t begin = 0;
    size_t end   = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(begin, end - begin));
}

SessionRegistry::SessionRegistry(ActiveTabStore& active, RegistryOptions options)
    : active_(active), options_(std::move(options))
{
}

// ─── Lookup helpers ──────────────────────────────────────────────────────────

Session* SessionRegistry::find_session_locked(const SessionId& id)
{
    auto it = std::find_if(
        sessions_.begin(), sessions_.end(), [&](const Session& s) { return s.id == id; });
    return it != sessions_.end() ? &*it : nullptr;
}

const Session* SessionRegistry::find_session_locked(const SessionId& id) const
{
    auto it = std::find_if(
        sessions_.begin(), sessions_.end(), [&](const Session& s) { return s.id == id; });
    return it != sessions_.end() ? &*it : nullptr;
}

Workspace* SessionRegistry::find_workspace_locked(const WorkspaceId& id)
{
    auto it = std::find_if(
        workspaces_.begin(), workspaces_.end(), [&](const Workspace& w) { return w.id == id; });
    return it != workspaces_.end() ? &*it : nullptr;
}

const Workspace* SessionRegistry::find_workspace_locked(const WorkspaceId& id) const
{
    auto it = std::find_if(
        workspaces_.begin(), workspaces_.end(), [&](const Workspace& w) { return w.id == id; });
    return it != workspaces_.end() ? &*it : nullptr;
}

bool SessionRegistry::is_live_tab_locked(const TabId& id) const
{
    if (find_workspace_locked(id))
        return true;
    const Session* s = find_session_locked(id);
    return s && s->is_orphan();
}

TabId SessionRegistry::fallback_tab_locked(const std::optional<SessionId>& dissolved_survivor) const
{
    if (dissolved_survivor)
        return *dissolved_survivor;
    if (!workspaces_.empty())
        return workspaces_.back().id;
    for (auto it = sessions_.rbegin(); it != sessions_.rend(); ++it)
    {
        if (it->is_orphan())
            return it->id;
    }
    return options_.home_tab_id;
}

std::vector<TabId> SessionRegistry::live_tab_ids_locked() const
{
    std::vector<TabId> out;
    out.reserve(sessions_.size() + workspaces_.size());
    for (const auto& s : sessions_)
    {
        if (s.is_orphan())
            out.push_back(s.id);
    }
    for (const auto& w : workspaces_)
        out.push_back(w.id);
    return out;
}

Session SessionRegistry::make_session_locked(const ConnectionParams& params) const
{
    Session s;
    s.id     = ids::next(ids::SESSION_PREFIX);
    s.params = params;
    s.status = SessionStatus::Connecting;
    return s;
}

SessionId SessionRegistry::add_orphan_locked(const ConnectionParams& params, Events& events)
{
    Session s = make_session_locked(params);
    sessions_.push_back(s);
    events.added.push_back(s);
    return s.id;
}

void SessionRegistry::emit(const Events& events)
{
    SessionAddedCallback   added;
    SessionRemovedCallback removed;
    {
        std::lock_guard lock(callback_mutex_);
        added   = on_session_added_;
        removed = on_session_removed_;
    }
    if (removed)
    {
        for (const auto& id : events.removed)
            removed(id);
    }
    if (added)
    {
        for (const auto& s : events.added)
            added(s);
    }
}

// ─── Orphan sessions ─────────────────────────────────────────────────────────

SessionId SessionRegistry::create_local_terminal()
{
    Events    events;
    SessionId id;
    {
        std::lock_guard  lock(mutex_);
        ConnectionParams params;
        params.protocol   = "local";
        params.port       = 0;
        params.host_label = options_.local_host_label;
        params.hostname   = "localhost";
        params.username   = "local";
        // The host id is derived from the session id, which is not known yet.
        Session s        = make_session_locked(params);
        s.params.host_id = "local-" + s.id;
        id               = s.id;
        sessions_.push_back(s);
        events.added.push_back(std::move(s));
        active_.set(id);
    }
    TERMDECK_LOG_INFO("registry", "local terminal {} created", id);
    emit(events);
    return id;
}

SessionId SessionRegistry::connect_to_host(const ConnectionParams& params)
{
    Events    events;
    SessionId id;
    {
        std::lock_guard lock(mutex_);
        id = add_orphan_locked(params, events);
        active_.set(id);
    }
    TERMDECK_LOG_INFO("registry", "session {} created for {}", id, params.host_label);
    emit(events);
    return id;
}

bool SessionRegistry::update_session_status(const SessionId& session_id, SessionStatus status)
{
    std::lock_guard lock(mutex_);
    Session*        s = find_session_locked(session_id);
    if (!s)
    {
        TERMDECK_LOG_DEBUG("registry", "status for unknown session {} ignored", session_id);
        return false;
    }
    if (s->status == status)
        return true;
    TERMDECK_LOG_DEBUG(
        "registry", "session {}: {} -> {}", session_id, to_string(s->status), to_string(status));
    s->status = status;
    return true;
}

// ─── Workspaces ──────────────────────────────────────────────────────────────

std::optional<WorkspaceId> SessionRegistry::create_workspace(const SessionId& base_session_id,
                                                             const SessionId& joining_session_id,
                                                             const SplitHint& hint)
{
    std::lock_guard lock(mutex_);
    if (base_session_id == joining_session_id)
        return std::nullopt;

    Session* base    = find_session_locked(base_session_id);
    Session* joining = find_session_locked(joining_session_id);
    if (!base || !joining || !base->is_orphan() || !joining->is_orphan())
    {
        TERMDECK_LOG_DEBUG("registry",
                           "create_workspace({}, {}) rejected",
                           base_session_id,
                           joining_session_id);
        return std::nullopt;
    }

    SplitHint wrap = hint;
    wrap.target_session_id.reset();

    Workspace ws;
    ws.id                 = ids::next(ids::WORKSPACE_PREFIX);
    ws.root               = insert_pane(make_pane(base_session_id), joining_session_id, wrap);
    ws.title              = options_.default_workspace_title;
    ws.view_mode          = ViewMode::Split;
    ws.focused_session_id = base_session_id;

    base->workspace_id    = ws.id;
    joining->workspace_id = ws.id;
    workspaces_.push_back(ws);
    active_.set(ws.id);

    TERMDECK_LOG_INFO("registry", "workspace {} created: {}", ws.id, describe(ws.root));
    return ws.id;
}

bool SessionRegistry::add_to_workspace(const WorkspaceId& workspace_id,
                                       const SessionId&   session_id,
                                       const SplitHint&   hint)
{
    std::lock_guard lock(mutex_);
    Session*        s  = find_session_locked(session_id);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!s || !ws || !s->is_orphan())
    {
        TERMDECK_LOG_DEBUG("registry", "add_to_workspace({}, {}) rejected", workspace_id, session_id);
        return false;
    }

    NodePtr next = insert_pane(ws->root, session_id, hint);
    if (next == ws->root)
    {
        TERMDECK_LOG_DEBUG("registry", "add_to_workspace({}, {}): hint not applicable", workspace_id, session_id);
        return false;
    }

    ws->root        = std::move(next);
    s->workspace_id = workspace_id;
    active_.set(workspace_id);

    TERMDECK_LOG_DEBUG("registry", "{} joined {}: {}", session_id, workspace_id, describe(ws->root));
    return true;
}

std::optional<SessionId> SessionRegistry::split_standalone_locked(const SessionId& session_id,
                                                                  SplitDirection   direction,
                                                                  Events&          events)
{
    Session* original = find_session_locked(session_id);
    if (!original || !original->is_orphan())
        return std::nullopt;

    Session clone = make_session_locked(original->params);

    SplitHint hint;
    hint.direction = direction;
    hint.position  = default_position(direction);

    Workspace ws;
    ws.id                 = ids::next(ids::WORKSPACE_PREFIX);
    ws.root               = insert_pane(make_pane(session_id), clone.id, hint);
    ws.title              = options_.default_workspace_title;
    ws.focused_session_id = session_id;

    original->workspace_id = ws.id;
    clone.workspace_id     = ws.id;

    const SessionId clone_id = clone.id;
    sessions_.push_back(clone);
    events.added.push_back(std::move(clone));
    workspaces_.push_back(ws);
    active_.set(ws.id);

    TERMDECK_LOG_INFO("registry", "split {} into new workspace {}", session_id, ws.id);
    return clone_id;
}

std::optional<SessionId> SessionRegistry::split_within_workspace_locked(const SessionId& session_id,
                                                                        SplitDirection   direction,
                                                                        Events&          events)
{
    Session* original = find_session_locked(session_id);
    if (!original || original->is_orphan())
        return std::nullopt;
    Workspace* ws = find_workspace_locked(*original->workspace_id);
    if (!ws)
        return std::nullopt;

    Session clone      = make_session_locked(original->params);
    clone.workspace_id = ws->id;

    SplitHint hint;
    hint.direction         = direction;
    hint.position          = default_position(direction);
    hint.target_session_id = session_id;

    NodePtr next = insert_pane(ws->root, clone.id, hint);
    if (next == ws->root)
        return std::nullopt;
    ws->root = std::move(next);

    const SessionId clone_id = clone.id;
    sessions_.push_back(clone);
    events.added.push_back(std::move(clone));

    TERMDECK_LOG_DEBUG("registry", "split {} in {}: {}", session_id, ws->id, describe(ws->root));
    return clone_id;
}

std::optional<SessionId> SessionRegistry::split_standalone(const SessionId& session_id,
                                                           SplitDirection   direction)
{
    Events                   events;
    std::optional<SessionId> out;
    {
        std::lock_guard lock(mutex_);
        out = split_standalone_locked(session_id, direction, events);
    }
    if (!out)
        TERMDECK_LOG_DEBUG("registry", "split_standalone({}) rejected", session_id);
    emit(events);
    return out;
}

std::optional<SessionId> SessionRegistry::split_within_workspace(const SessionId& session_id,
                                                                 SplitDirection   direction)
{
    Events                   events;
    std::optional<SessionId> out;
    {
        std::lock_guard lock(mutex_);
        out = split_within_workspace_locked(session_id, direction, events);
    }
    if (!out)
        TERMDECK_LOG_DEBUG("registry", "split_within_workspace({}) rejected", session_id);
    emit(events);
    return out;
}

std::optional<SessionId> SessionRegistry::split_session(const SessionId& session_id,
                                                        SplitDirection   direction)
{
    Events                   events;
    std::optional<SessionId> out;
    {
        std::lock_guard lock(mutex_);
        const Session*  s = find_session_locked(session_id);
        if (!s)
            return std::nullopt;
        out = s->is_orphan() ? split_standalone_locked(session_id, direction, events)
                             : split_within_workspace_locked(session_id, direction, events);
    }
    emit(events);
    return out;
}

bool SessionRegistry::close_session(const SessionId& session_id)
{
    Events events;
    {
        std::lock_guard lock(mutex_);
        auto            it = std::find_if(sessions_.begin(),
                               sessions_.end(),
                               [&](const Session& s) { return s.id == session_id; });
        if (it == sessions_.end())
        {
            TERMDECK_LOG_DEBUG("registry", "close_session({}): unknown session", session_id);
            return false;
        }

        const std::optional<WorkspaceId> ws_id = it->workspace_id;
        sessions_.erase(it);

        std::optional<WorkspaceId> removed_ws;
        std::optional<WorkspaceId> dissolved_ws;
        std::optional<SessionId>   survivor;

        if (ws_id)
        {
            auto ws_it = std::find_if(workspaces_.begin(),
                                      workspaces_.end(),
                                      [&](const Workspace& w) { return w.id == *ws_id; });
            if (ws_it != workspaces_.end())
            {
                NodePtr pruned = prune_node(ws_it->root, session_id);
                if (!pruned)
                {
                    removed_ws = ws_it->id;
                    workspaces_.erase(ws_it);
                    TERMDECK_LOG_INFO("registry", "workspace {} removed", *removed_ws);
                }
                else
                {
                    auto remaining = collect_session_ids(pruned);
                    if (remaining.size() == 1)
                    {
                        dissolved_ws = ws_it->id;
                        survivor     = remaining.front();
                        workspaces_.erase(ws_it);
                        if (Session* lone = find_session_locked(*survivor))
                            lone->workspace_id.reset();
                        TERMDECK_LOG_INFO(
                            "registry", "workspace {} dissolved, {} is standalone", *dissolved_ws, *survivor);
                    }
                    else
                    {
                        ws_it->root = std::move(pruned);
                        if (ws_it->focused_session_id == session_id)
                            ws_it->focused_session_id.reset();
                    }
                }
            }
        }

        const TabId active      = active_.get();
        const bool  invalidated = (dissolved_ws && active == *dissolved_ws) || active == session_id
                                 || (removed_ws && active == *removed_ws)
                                 || (ws_id && active == *ws_id && !find_workspace_locked(*ws_id));
        if (invalidated)
            active_.set(fallback_tab_locked(survivor));

        events.removed.push_back(session_id);
    }
    emit(events);
    return true;
}

bool SessionRegistry::close_workspace(const WorkspaceId& workspace_id)
{
    Events events;
    {
        std::lock_guard lock(mutex_);
        auto            ws_it = std::find_if(workspaces_.begin(),
                                  workspaces_.end(),
                                  [&](const Workspace& w) { return w.id == workspace_id; });
        if (ws_it == workspaces_.end())
        {
            TERMDECK_LOG_DEBUG("registry", "close_workspace({}): unknown workspace", workspace_id);
            return false;
        }
        workspaces_.erase(ws_it);

        for (const auto& s : sessions_)
        {
            if (s.workspace_id == workspace_id)
                events.removed.push_back(s.id);
        }
        std::erase_if(sessions_, [&](const Session& s) { return s.workspace_id == workspace_id; });

        if (active_.get() == workspace_id)
            active_.set(fallback_tab_locked(std::nullopt));

        TERMDECK_LOG_INFO(
            "registry", "workspace {} closed with {} sessions", workspace_id, events.removed.size());
    }
    emit(events);
    return true;
}

std::optional<WorkspaceId> SessionRegistry::run_on_hosts(const Snippet&                       snippet,
                                                         const std::vector<ConnectionParams>& hosts)
{
    if (hosts.empty())
    {
        TERMDECK_LOG_DEBUG("registry", "run_on_hosts({}): no hosts", snippet.id);
        return std::nullopt;
    }

    Events      events;
    WorkspaceId ws_id;
    {
        std::lock_guard lock(mutex_);
        ws_id = ids::next(ids::WORKSPACE_PREFIX);

        std::vector<SessionId> session_ids;
        session_ids.reserve(hosts.size());
        for (const auto& host : hosts)
        {
            Session s         = make_session_locked(host);
            s.workspace_id    = ws_id;
            s.startup_command = snippet.command;
            session_ids.push_back(s.id);
            sessions_.push_back(s);
            events.added.push_back(std::move(s));
        }

        Workspace ws;
        ws.id         = ws_id;
        ws.root       = make_even_split(session_ids, SplitDirection::Vertical);
        ws.title      = snippet.label.empty() ? options_.default_workspace_title : snippet.label;
        ws.view_mode  = ViewMode::Focus;
        ws.snippet_id = snippet.id;
        workspaces_.push_back(ws);
        active_.set(ws_id);
    }
    TERMDECK_LOG_INFO("registry", "snippet {} running on {} hosts in {}", snippet.id, hosts.size(), ws_id);
    emit(events);
    return ws_id;
}

bool SessionRegistry::toggle_view_mode(const WorkspaceId& workspace_id)
{
    std::lock_guard lock(mutex_);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!ws)
        return false;

    if (ws->view_mode == ViewMode::Split)
    {
        ws->view_mode = ViewMode::Focus;
        if (!ws->focused_session_id)
        {
            auto members = collect_session_ids(ws->root);
            if (!members.empty())
                ws->focused_session_id = members.front();
        }
    }
    else
    {
        ws->view_mode = ViewMode::Split;
    }
    TERMDECK_LOG_DEBUG("registry", "workspace {} view mode -> {}", workspace_id, to_string(ws->view_mode));
    return true;
}

bool SessionRegistry::set_focused_session(const WorkspaceId& workspace_id, const SessionId& session_id)
{
    std::lock_guard lock(mutex_);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!ws || !contains_session(ws->root, session_id))
        return false;
    ws->focused_session_id = session_id;
    return true;
}

bool SessionRegistry::move_focus(const WorkspaceId& workspace_id, FocusDirection direction, Size area)
{
    std::lock_guard lock(mutex_);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!ws)
        return false;

    SessionId current;
    if (ws->focused_session_id && contains_session(ws->root, *ws->focused_session_id))
    {
        current = *ws->focused_session_id;
    }
    else
    {
        auto members = collect_session_ids(ws->root);
        if (members.empty())
            return false;
        current = members.front();
    }

    auto next = next_focus(ws->root, current, direction, area, options_.layout);
    if (!next)
        return false;
    ws->focused_session_id = *next;
    return true;
}

bool SessionRegistry::update_split_sizes(const WorkspaceId&        workspace_id,
                                         const SplitId&            split_id,
                                         const std::vector<float>& sizes)
{
    std::lock_guard lock(mutex_);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!ws)
        return false;
    NodePtr next = termdeck::update_split_sizes(ws->root, split_id, sizes);
    if (next == ws->root)
        return false;
    ws->root = std::move(next);
    return true;
}

bool SessionRegistry::rename_workspace(const WorkspaceId& workspace_id, std::string_view title)
{
    std::string name = trimmed(title);
    if (name.empty())
        return false;

    std::lock_guard lock(mutex_);
    Workspace*      ws = find_workspace_locked(workspace_id);
    if (!ws)
        return false;
    ws->title = std::move(name);
    return true;
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

bool SessionRegistry::select_tab(const TabId& tab_id)
{
    std::lock_guard lock(mutex_);
    if (tab_id != options_.home_tab_id && !is_live_tab_locked(tab_id))
    {
        TERMDECK_LOG_DEBUG("registry", "select_tab({}): not a live tab", tab_id);
        return false;
    }
    active_.set(tab_id);
    return true;
}

TabId SessionRegistry::active_tab() const
{
    return active_.get();
}

std::vector<TabId> SessionRegistry::live_tab_ids() const
{
    std::lock_guard lock(mutex_);
    return live_tab_ids_locked();
}

std::vector<TabId> SessionRegistry::ordered_tabs() const
{
    std::lock_guard lock(mutex_);
    return tab_order_.ordered(live_tab_ids_locked());
}

bool SessionRegistry::reorder_tabs(const TabId& dragged_id, const TabId& target_id, TabDropPosition position)
{
    std::lock_guard lock(mutex_);
    return tab_order_.reorder(live_tab_ids_locked(), dragged_id, target_id, position);
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<Session> SessionRegistry::session(const SessionId& session_id) const
{
    std::lock_guard lock(mutex_);
    const Session*  s = find_session_locked(session_id);
    if (!s)
        return std::nullopt;
    return *s;
}

std::optional<Workspace> SessionRegistry::workspace(const WorkspaceId& workspace_id) const
{
    std::lock_guard  lock(mutex_);
    const Workspace* ws = find_workspace_locked(workspace_id);
    if (!ws)
        return std::nullopt;
    return *ws;
}

std::vector<Session> SessionRegistry::sessions() const
{
    std::lock_guard lock(mutex_);
    return sessions_;
}

std::vector<Workspace> SessionRegistry::workspaces() const
{
    std::lock_guard lock(mutex_);
    return workspaces_;
}

std::vector<Session> SessionRegistry::orphan_sessions() const
{
    std::lock_guard      lock(mutex_);
    std::vector<Session> out;
    for (const auto& s : sessions_)
    {
        if (s.is_orphan())
            out.push_back(s);
    }
    return out;
}

size_t SessionRegistry::session_count() const
{
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

size_t SessionRegistry::workspace_count() const
{
    std::lock_guard lock(mutex_);
    return workspaces_.size();
}

bool SessionRegistry::check_invariants(std::string* error) const
{
    auto fail = [&](std::string msg)
    {
        if (error)
            *error = std::move(msg);
        return false;
    };

    std::lock_guard                                 lock(mutex_);
    std::unordered_map<SessionId, WorkspaceId>      owner;
    std::unordered_set<WorkspaceId>                 seen_workspaces;

    for (const auto& ws : workspaces_)
    {
        if (!seen_workspaces.insert(ws.id).second)
            return fail("duplicate workspace " + ws.id);
        std::string tree_error;
        if (!ws.root || !validate_tree(ws.root, &tree_error))
            return fail("workspace " + ws.id + ": " + (ws.root ? tree_error : "empty tree"));
        for (const auto& sid : collect_session_ids(ws.root))
        {
            if (!owner.emplace(sid, ws.id).second)
                return fail("session " + sid + " appears in two workspaces");
            const Session* s = find_session_locked(sid);
            if (!s)
                return fail("workspace " + ws.id + " references unknown session " + sid);
            if (s->workspace_id != ws.id)
                return fail("session " + sid + " is not marked as a member of " + ws.id);
        }
    }

    std::unordered_set<SessionId> seen_sessions;
    for (const auto& s : sessions_)
    {
        if (!seen_sessions.insert(s.id).second)
            return fail("duplicate session " + s.id);
        if (s.workspace_id && !owner.count(s.id))
            return fail("session " + s.id + " claims " + *s.workspace_id + " but is in no tree");
    }
    return true;
}

// ─── Persistence ─────────────────────────────────────────────────────────────

Snapshot SessionRegistry::snapshot() const
{
    std::lock_guard lock(mutex_);
    Snapshot        snap;
    snap.sessions   = sessions_;
    snap.workspaces = workspaces_;
    snap.tab_order  = tab_order_.stored_order();
    snap.active_tab = active_.get();
    return snap;
}

bool SessionRegistry::restore(const Snapshot& snapshot)
{
    Snapshot     repaired = snapshot;
    const size_t repairs  = repair_snapshot(repaired);

    for (const auto& s : repaired.sessions)
        ids::reserve(s.id);
    for (const auto& ws : repaired.workspaces)
    {
        ids::reserve(ws.id);
        std::vector<const WorkspaceNode*> stack{ws.root.get()};
        while (!stack.empty())
        {
            const WorkspaceNode* node = stack.back();
            stack.pop_back();
            if (!node || node->is_pane())
                continue;
            ids::reserve(node->id);
            for (const auto& child : node->children)
                stack.push_back(child.get());
        }
    }

    Events events;
    {
        std::lock_guard lock(mutex_);
        for (const auto& s : sessions_)
            events.removed.push_back(s.id);

        sessions_   = std::move(repaired.sessions);
        workspaces_ = std::move(repaired.workspaces);
        tab_order_.set_stored_order(std::move(repaired.tab_order));

        const TabId& wanted = repaired.active_tab;
        if (wanted == options_.home_tab_id || is_live_tab_locked(wanted))
            active_.set(wanted);
        else
            active_.set(fallback_tab_locked(std::nullopt));
    }
    TERMDECK_LOG_INFO("registry",
                      "restored {} sessions, {} workspaces ({} repairs)",
                      session_count(),
                      workspace_count(),
                      repairs);
    emit(events);
    return repairs == 0;
}

// ─── Callbacks ───────────────────────────────────────────────────────────────

void SessionRegistry::set_on_session_added(SessionAddedCallback cb)
{
    std::lock_guard lock(callback_mutex_);
    on_session_added_ = std::move(cb);
}

void SessionRegistry::set_on_session_removed(SessionRemovedCallback cb)
{
    std::lock_guard lock(callback_mutex_);
    on_session_removed_ = std::move(cb);
}

}   // namespace termdeck
