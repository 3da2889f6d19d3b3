#pragma once

#include <functional>
#include <optional>
#include <termdeck/fwd.hpp>
#include <vector>

#include "core/layout_engine.hpp"

namespace termdeck
{

class SessionRegistry;

// ─── SplitResizeController ───────────────────────────────────────────────────
// Resizer drag: translates pointer movement on a ResizerHandle into weight
// updates for the two children it separates.
//
// Every update() recomputes the weights from the sizes captured at begin()
// plus the total pointer delta, so rounding never accumulates across events.
// The registry is updated live; end() keeps the result, cancel() writes the
// captured sizes back.

class SplitResizeController
{
   public:
    using SizesChangedCallback = std::function<void(const SplitId& split_id, const std::vector<float>& sizes)>;

    explicit SplitResizeController(SessionRegistry& registry, float min_pane_px = 120.0f);
    ~SplitResizeController() = default;

    SplitResizeController(const SplitResizeController&)            = delete;
    SplitResizeController& operator=(const SplitResizeController&) = delete;

    void set_on_sizes_changed(SizesChangedCallback cb) { on_sizes_changed_ = std::move(cb); }

    // Topmost handle whose rect contains the point, if any.
    static std::optional<ResizerHandle> hit_test(const std::vector<ResizerHandle>& handles, float x, float y);

    // Pointer pressed on `handle` of `workspace_id`. False when already
    // resizing or the split no longer matches the handle.
    bool begin(const WorkspaceId& workspace_id, const ResizerHandle& handle, float pointer_x, float pointer_y);

    // Pointer moved. Returns the weights written to the registry.
    std::optional<std::vector<float>> update(float pointer_x, float pointer_y);

    void end();
    void cancel();

    bool                      is_resizing() const { return active_; }
    const std::vector<float>& start_sizes() const { return start_sizes_; }
    const SplitId&            split_id() const { return handle_.split_id; }

   private:
    void reset();

    SessionRegistry& registry_;
    float            min_pane_px_;

    bool               active_ = false;
    WorkspaceId        workspace_id_;
    ResizerHandle      handle_;
    std::vector<float> start_sizes_;
    float              start_x_ = 0.0f;
    float              start_y_ = 0.0f;

    SizesChangedCallback on_sizes_changed_;
};

}   // namespace termdeck
