#include "split_resize_controller.hpp"

#include <termdeck/logger.hpp>

#include "core/session_registry.hpp"

namespace termdeck
{

SplitResizeController::SplitResizeController(SessionRegistry& registry, float min_pane_px)
    : registry_(registry), min_pane_px_(min_pane_px)
{
}

std::optional<ResizerHandle> SplitResizeController::hit_test(const std::vector<ResizerHandle>& handles,
                                                             float                             x,
                                                             float                             y)
{
    // Nested handles come after their ancestors, so search from the back.
    for (auto it = handles.rbegin(); it != handles.rend(); ++it)
    {
        if (it->rect.contains(x, y))
            return *it;
    }
    return std::nullopt;
}

bool SplitResizeController::begin(const WorkspaceId&   workspace_id,
                                  const ResizerHandle& handle,
                                  float                pointer_x,
                                  float                pointer_y)
{
    if (active_)
        return false;

    auto ws = registry_.workspace(workspace_id);
    if (!ws)
        return false;
    const WorkspaceNode* split = find_split(ws->root, handle.split_id);
    if (!split || split->direction != handle.direction || handle.index + 1 >= split->children.size())
    {
        TERMDECK_LOG_DEBUG("resize", "stale handle {} ignored", handle.id);
        return false;
    }

    active_       = true;
    workspace_id_ = workspace_id;
    handle_       = handle;
    start_sizes_  = effective_sizes(*split);
    start_x_      = pointer_x;
    start_y_      = pointer_y;
    TERMDECK_LOG_TRACE("resize", "begin {} in {}", handle.id, workspace_id);
    return true;
}

std::optional<std::vector<float>> SplitResizeController::update(float pointer_x, float pointer_y)
{
    if (!active_)
        return std::nullopt;

    const bool  along_x = handle_.direction == SplitDirection::Vertical;
    const float extent  = along_x ? handle_.split_area.w : handle_.split_area.h;
    const float delta   = along_x ? pointer_x - start_x_ : pointer_y - start_y_;
    if (extent <= 0.0f)
        return std::nullopt;

    std::vector<float> sizes = apply_resize_delta(start_sizes_, handle_.index, extent, delta, min_pane_px_);
    if (!registry_.update_split_sizes(workspace_id_, handle_.split_id, sizes))
    {
        // The split went away under the pointer (e.g. a pane was closed).
        TERMDECK_LOG_DEBUG("resize", "split {} vanished during resize", handle_.split_id);
        reset();
        return std::nullopt;
    }
    if (on_sizes_changed_)
        on_sizes_changed_(handle_.split_id, sizes);
    return sizes;
}

void SplitResizeController::end()
{
    if (active_)
        TERMDECK_LOG_TRACE("resize", "end {}", handle_.id);
    reset();
}

void SplitResizeController::cancel()
{
    if (!active_)
        return;
    if (registry_.update_split_sizes(workspace_id_, handle_.split_id, start_sizes_) && on_sizes_changed_)
        on_sizes_changed_(handle_.split_id, start_sizes_);
    reset();
}

void SplitResizeController::reset()
{
    active_ = false;
    workspace_id_.clear();
    handle_ = ResizerHandle{};
    start_sizes_.clear();
}

}   // namespace termdeck
