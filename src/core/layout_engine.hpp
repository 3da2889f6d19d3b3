#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <termdeck/geometry.hpp>
#include <unordered_map>
#include <vector>

#include "workspace_tree.hpp"

namespace termdeck
{

// ─── LayoutEngine ────────────────────────────────────────────────────────────
// Stateless geometry over a workspace tree: pane rects, resizer handles,
// resize gesture math, directional focus search and drop-target hints.
// Nothing here mutates its inputs; results depend only on (tree, area).

struct LayoutOptions
{
    float min_pane_px        = 120.0f;   // Resize clamp (capped at half of the two neighbours' extent)
    float resizer_thickness  = 4.0f;     // Hit-test strip centred on each boundary
    float focus_edge_epsilon = 0.001f;   // Fraction of the larger container side
};

using RectMap = std::unordered_map<SessionId, Rect>;

struct ResizerHandle
{
    std::string    id;         // "<split id>-<index>"
    SplitId        split_id;
    size_t         index = 0;  // Governs weights [index] and [index + 1]
    SplitDirection direction = SplitDirection::Vertical;
    Rect           rect;       // Thin strip at the boundary between the two children
    Rect           split_area; // Full area of the owning split
};

enum class FocusDirection
{
    Up,
    Down,
    Left,
    Right
};

const char* to_string(FocusDirection direction);
std::optional<FocusDirection> focus_direction_from_string(std::string_view s);

// Transient drag-to-split indicator. `hint` is what a drop would commit;
// `preview` is the half of the target rect the new pane would occupy.
struct DropHint
{
    SplitHint hint;
    Rect      preview;
};

// ─── Rects ───────────────────────────────────────────────────────────────────

// Partitions `area` by normalized weights. The last child of every split ends
// exactly on the parent's far edge, so the pane rects tile the area.
RectMap compute_rects(const NodePtr& root, const Rect& area);
RectMap compute_rects(const NodePtr& root, Size size);

// ─── Resizers ────────────────────────────────────────────────────────────────

// One handle between every adjacent pair of children, in pre-order.
// Empty when the area is degenerate.
std::vector<ResizerHandle> compute_resizers(const NodePtr&       root,
                                            Size                 size,
                                            const LayoutOptions& options = {});

// Resize gesture: converts the weights to pixels over `extent`, moves the
// boundary after child `index` by `delta` pixels, clamps both neighbours to
// min(min_pane_px, half of their combined pixels) by moving the shortfall to
// the other side and converts back to weights with the same total as
// `start_sizes`. Children outside the pair keep their weights. For a
// two-child split the cap is extent / 2.
// Returns `start_sizes` unchanged for an out-of-range index or zero extent.
std::vector<float> apply_resize_delta(const std::vector<float>& start_sizes,
                                      size_t                    index,
                                      float                     extent,
                                      float                     delta,
                                      float                     min_pane_px = 120.0f);

// ─── Directional focus ───────────────────────────────────────────────────────

// Geometric neighbour of `current` in `direction`. Wraps to the opposite edge
// when nothing lies that way. nullopt when `current` is not in the tree or is
// the only pane.
std::optional<SessionId> next_focus(const NodePtr&       root,
                                    const SessionId&     current,
                                    FocusDirection       direction,
                                    Size                 area    = {1.0f, 1.0f},
                                    const LayoutOptions& options = {});

// ─── Drop hints ──────────────────────────────────────────────────────────────

// Classifies a pointer (container-local pixels) into a left/right/top/bottom
// half of the pane under it, or of the whole container when no pane is hit.
// nullopt when the pointer is outside the container or the container is empty.
std::optional<DropHint> compute_drop_hint(const NodePtr& root, Size container, float x, float y);

}   // namespace termdeck
