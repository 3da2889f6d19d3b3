#include "session_drag_controller.hpp"

#include <termdeck/logger.hpp>

#include "core/session_registry.hpp"

namespace termdeck
{

SessionDragController::SessionDragController(SessionRegistry& registry) : registry_(registry) {}

bool SessionDragController::begin(const SessionId& dragged_session_id)
{
    if (state_ != State::Idle)
        return false;

    auto session = registry_.session(dragged_session_id);
    if (!session || !session->is_orphan())
    {
        TERMDECK_LOG_DEBUG("drag", "cannot drag {}: not a standalone session", dragged_session_id);
        return false;
    }

    state_   = State::Dragging;
    dragged_ = dragged_session_id;
    hint_.reset();
    TERMDECK_LOG_DEBUG("drag", "drag started: {}", dragged_);
    return true;
}

// The active tab decides what the pointer is measured against: a workspace's
// tree, or the single pane of a standalone session.
std::optional<DropHint> SessionDragController::compute_hint(Size container, float x, float y) const
{
    const TabId active = registry_.active_tab();
    if (auto ws = registry_.workspace(active))
        return compute_drop_hint(ws->root, container, x, y);
    if (auto s = registry_.session(active); s && s->is_orphan())
        return compute_drop_hint(make_pane(s->id), container, x, y);
    return std::nullopt;
}

void SessionDragController::set_hint(std::optional<DropHint> hint)
{
    bool changed = hint.has_value() != hint_.has_value()
                   || (hint && (hint->hint != hint_->hint || !(hint->preview == hint_->preview)));
    hint_ = std::move(hint);
    if (changed && on_hint_changed_)
        on_hint_changed_(hint_);
}

std::optional<DropHint> SessionDragController::drag_over(Size container, float x, float y)
{
    if (state_ != State::Dragging)
        return std::nullopt;
    set_hint(compute_hint(container, x, y));
    return hint_;
}

void SessionDragController::drag_leave()
{
    if (state_ == State::Dragging)
        set_hint(std::nullopt);
}

bool SessionDragController::drop(Size container, float x, float y)
{
    if (state_ != State::Dragging)
        return false;

    const SessionId dragged = dragged_;
    auto            hint    = compute_hint(container, x, y);
    transition_to_idle();

    bool committed = false;
    if (hint)
    {
        const TabId active = registry_.active_tab();
        if (registry_.workspace(active))
            committed = registry_.add_to_workspace(active, dragged, hint->hint);
        else if (auto s = registry_.session(active); s && s->is_orphan())
            committed = registry_.create_workspace(active, dragged, hint->hint).has_value();
    }

    TERMDECK_LOG_DEBUG("drag", "drop of {}: {}", dragged, committed ? "committed" : "ignored");
    if (on_drop_)
        on_drop_(dragged, committed);
    return committed;
}

void SessionDragController::cancel()
{
    if (state_ == State::Idle)
        return;
    const SessionId dragged = dragged_;
    transition_to_idle();
    TERMDECK_LOG_DEBUG("drag", "drag of {} cancelled", dragged);
    if (on_cancel_)
        on_cancel_(dragged);
}

void SessionDragController::transition_to_idle()
{
    state_ = State::Idle;
    dragged_.clear();
    set_hint(std::nullopt);
}

}   // namespace termdeck
