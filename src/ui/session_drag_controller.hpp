#pragma once

#include <functional>
#include <optional>
#include <termdeck/fwd.hpp>
#include <termdeck/geometry.hpp>

#include "core/layout_engine.hpp"

namespace termdeck
{

class SessionRegistry;

// ─── SessionDragController ───────────────────────────────────────────────────
// Drag-to-split gesture: an orphan session tab is dragged over the terminal
// area of the active tab and dropped onto one half of a pane.
//
//   Idle ──begin──► Dragging ──drag_over × N──► Dragging
//                      │  │
//                    drop cancel / drag over nothing
//                      │  │
//                      ▼  ▼
//                     Idle
//
// Only drop() mutates the registry, and at most once:
//   - active tab is a workspace      → add_to_workspace(workspace, dragged, hint)
//   - active tab is an orphan session → create_workspace(active, dragged, hint)
// drag_over() only refreshes the transient hint; cancel() drops it. Both
// leave sessions, workspaces and tab order untouched.

class SessionDragController
{
   public:
    enum class State
    {
        Idle,
        Dragging,
    };

    using HintChangedCallback = std::function<void(const std::optional<DropHint>& hint)>;
    using DropCallback        = std::function<void(const SessionId& dragged, bool committed)>;
    using CancelCallback      = std::function<void(const SessionId& dragged)>;

    explicit SessionDragController(SessionRegistry& registry);
    ~SessionDragController() = default;

    SessionDragController(const SessionDragController&)            = delete;
    SessionDragController& operator=(const SessionDragController&) = delete;

    void set_on_hint_changed(HintChangedCallback cb) { on_hint_changed_ = std::move(cb); }
    void set_on_drop(DropCallback cb) { on_drop_ = std::move(cb); }
    void set_on_cancel(CancelCallback cb) { on_cancel_ = std::move(cb); }

    // ── Gesture events ──────────────────────────────────────────────────

    // Starts dragging an orphan session. False when a drag is already active
    // or the session is unknown or already a workspace member.
    bool begin(const SessionId& dragged_session_id);

    // Pointer moved over the terminal area (container-local pixels).
    // Returns the hint a drop at this point would commit.
    std::optional<DropHint> drag_over(Size container, float x, float y);

    // Pointer left the terminal area; the drag itself stays active.
    void drag_leave();

    // Commits against the active tab and returns to Idle. False when nothing
    // was committed (no hint, home tab active, or the registry rejected it).
    bool drop(Size container, float x, float y);

    void cancel();

    // ── Queries ─────────────────────────────────────────────────────────

    State                          state() const { return state_; }
    bool                           is_dragging() const { return state_ == State::Dragging; }
    const SessionId&               dragged_session() const { return dragged_; }
    const std::optional<DropHint>& hint() const { return hint_; }

   private:
    std::optional<DropHint> compute_hint(Size container, float x, float y) const;
    void                    set_hint(std::optional<DropHint> hint);
    void                    transition_to_idle();

    SessionRegistry& registry_;

    State                   state_ = State::Idle;
    SessionId               dragged_;
    std::optional<DropHint> hint_;

    HintChangedCallback on_hint_changed_;
    DropCallback        on_drop_;
    CancelCallback      on_cancel_;
};

}   // namespace termdeck
