#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <termdeck/geometry.hpp>
#include <termdeck/session.hpp>
#include <vector>

#include "active_tab_store.hpp"
#include "layout_engine.hpp"
#include "tab_order.hpp"
#include "workspace_tree.hpp"

namespace termdeck
{

enum class ViewMode
{
    Split,
    Focus
};

const char*             to_string(ViewMode mode);
std::optional<ViewMode> view_mode_from_string(std::string_view s);

struct Workspace
{
    WorkspaceId                id;
    NodePtr                    root;
    std::string                title;
    ViewMode                   view_mode = ViewMode::Split;
    std::optional<SessionId>   focused_session_id;   // Focus mode pane, or last focused in split mode
    std::optional<std::string> snippet_id;           // Set when created by run_on_hosts
};

// A command to run on several hosts at once.
struct Snippet
{
    std::string id;
    std::string label;
    std::string command;
};

struct RegistryOptions
{
    TabId         home_tab_id             = DEFAULT_HOME_TAB_ID;
    std::string   default_workspace_title = "Workspace";
    std::string   local_host_label        = "Local Terminal";
    LayoutOptions layout;
};

/**
 * SessionRegistry: Owns every session and workspace and enforces membership.
 *
 * A session is either an orphan (its own top-level tab) or a pane in exactly
 * one workspace tree. All lifecycle operations (create, split, merge, close,
 * dissolve) go through here, run under one mutex, and are no-ops on unknown
 * ids or double membership. Operations that invalidate the active tab pick a
 * fallback in this order: the survivor of a dissolved workspace, the newest
 * remaining workspace, the newest remaining orphan, the home tab.
 *
 * Lifecycle callbacks run after the mutex is released, so they may call back
 * into the registry.
 */
class SessionRegistry
{
   public:
    using SessionAddedCallback   = std::function<void(const Session& session)>;
    using SessionRemovedCallback = std::function<void(const SessionId& id)>;

    explicit SessionRegistry(ActiveTabStore& active, RegistryOptions options = {});
    ~SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&)            = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // ─── Orphan sessions ─────────────────────────────────────────────────

    // New orphan session in Connecting state; it becomes the active tab.
    SessionId create_local_terminal();
    SessionId connect_to_host(const ConnectionParams& params);

    // Backend status sink. Unknown ids are ignored.
    bool update_session_status(const SessionId& session_id, SessionStatus status);

    // ─── Workspaces ──────────────────────────────────────────────────────

    // Combines two orphans into a new two-pane workspace laid out by
    // `hint.direction` / `hint.position` (the target is implied: `base`).
    std::optional<WorkspaceId> create_workspace(const SessionId& base_session_id,
                                                const SessionId& joining_session_id,
                                                const SplitHint& hint);

    // Inserts an orphan into an existing workspace at the hinted location.
    bool add_to_workspace(const WorkspaceId& workspace_id,
                          const SessionId&   session_id,
                          const SplitHint&   hint);

    // Clone the connection params of `session_id` into a new Connecting
    // session placed bottom (Horizontal) or right (Vertical) of the original.
    // Return the clone's id.
    std::optional<SessionId> split_standalone(const SessionId& session_id, SplitDirection direction);
    std::optional<SessionId> split_within_workspace(const SessionId& session_id, SplitDirection direction);
    std::optional<SessionId> split_session(const SessionId& session_id, SplitDirection direction);

    bool close_session(const SessionId& session_id);
    bool close_workspace(const WorkspaceId& workspace_id);

    // One new session per host, all carrying snippet.command as their startup
    // command, grouped in a new Focus-mode workspace with an even vertical
    // split. Empty `hosts` is a no-op.
    std::optional<WorkspaceId> run_on_hosts(const Snippet&                       snippet,
                                            const std::vector<ConnectionParams>& hosts);

    bool toggle_view_mode(const WorkspaceId& workspace_id);
    bool set_focused_session(const WorkspaceId& workspace_id, const SessionId& session_id);

    // Moves focused_session_id to the geometric neighbour in `direction`.
    // `area` only matters for its aspect ratio. Returns whether focus moved.
    bool move_focus(const WorkspaceId& workspace_id, FocusDirection direction, Size area = {1.0f, 1.0f});

    bool update_split_sizes(const WorkspaceId&        workspace_id,
                            const SplitId&            split_id,
                            const std::vector<float>& sizes);

    // Trims surrounding whitespace; empty titles are rejected.
    bool rename_workspace(const WorkspaceId& workspace_id, std::string_view title);

    // ─── Tabs ────────────────────────────────────────────────────────────

    // Explicit user selection. Accepts live tab ids and the home tab.
    bool  select_tab(const TabId& tab_id);
    TabId active_tab() const;

    // Orphan session ids then workspace ids, each in creation order.
    std::vector<TabId> live_tab_ids() const;
    std::vector<TabId> ordered_tabs() const;
    bool reorder_tabs(const TabId& dragged_id, const TabId& target_id, TabDropPosition position);

    // ─── Queries ─────────────────────────────────────────────────────────

    std::optional<Session>   session(const SessionId& session_id) const;
    std::optional<Workspace> workspace(const WorkspaceId& workspace_id) const;
    std::vector<Session>     sessions() const;
    std::vector<Workspace>   workspaces() const;
    std::vector<Session>     orphan_sessions() const;
    size_t                   session_count() const;
    size_t                   workspace_count() const;

    // Checks cross-structure membership: every pane names an existing
    // session whose workspace_id matches, no session appears in two trees,
    // every workspace has a non-empty valid tree. A one-pane workspace (from
    // run_on_hosts with one host) is valid.
    bool check_invariants(std::string* error = nullptr) const;

    const RegistryOptions& options() const { return options_; }
    ActiveTabStore&        active_store() { return active_; }

    // ─── Persistence ─────────────────────────────────────────────────────

    Snapshot snapshot() const;

    // Replaces all state. Inconsistent records are repaired rather than
    // rejected (see repair_snapshot). Restored sessions start Disconnected and
    // no session-added callbacks fire; sessions that existed before are
    // reported as removed. Returns true when nothing needed repair.
    bool restore(const Snapshot& snapshot);

    // ─── Callbacks ───────────────────────────────────────────────────────

    void set_on_session_added(SessionAddedCallback cb);
    void set_on_session_removed(SessionRemovedCallback cb);

   private:
    struct Events
    {
        std::vector<Session>   added;
        std::vector<SessionId> removed;
    };

    Session*       find_session_locked(const SessionId& id);
    const Session* find_session_locked(const SessionId& id) const;
    Workspace*     find_workspace_locked(const WorkspaceId& id);
    const Workspace* find_workspace_locked(const WorkspaceId& id) const;

    bool  is_live_tab_locked(const TabId& id) const;
    TabId fallback_tab_locked(const std::optional<SessionId>& dissolved_survivor) const;
    std::vector<TabId> live_tab_ids_locked() const;

    Session make_session_locked(const ConnectionParams& params) const;
    SessionId add_orphan_locked(const ConnectionParams& params, Events& events);
    std::optional<SessionId> split_standalone_locked(const SessionId& session_id,
                                                     SplitDirection   direction,
                                                     Events&          events);
    std::optional<SessionId> split_within_workspace_locked(const SessionId& session_id,
                                                           SplitDirection   direction,
                                                           Events&          events);

    void emit(const Events& events);

    ActiveTabStore& active_;
    RegistryOptions options_;

    mutable std::mutex     mutex_;
    std::vector<Session>   sessions_;     // Creation order
    std::vector<Workspace> workspaces_;   // Creation order
    TabOrderManager        tab_order_;

    std::mutex             callback_mutex_;
    SessionAddedCallback   on_session_added_;
    SessionRemovedCallback on_session_removed_;
};

}   // namespace termdeck
