#include "layout_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <termdeck/logger.hpp>

namespace termdeck
{

const char* to_string(FocusDirection direction)
{
    switch (direction)
    {
        case FocusDirection::Up:
            return "up";
        case FocusDirection::Down:
            return "down";
        case FocusDirection::Left:
            return "left";
        case FocusDirection::Right:
            return "right";
    }
    return "right";
}

std::optional<FocusDirection> focus_direction_from_string(std::string_view s)
{
    if (s == "up")
        return FocusDirection::Up;
    if (s == "down")
        return FocusDirection::Down;
    if (s == "left")
        return FocusDirection::Left;
    if (s == "right")
        return FocusDirection::Right;
    return std::nullopt;
}

// ─── Partitioning ────────────────────────────────────────────────────────────

static std::vector<float> shares_of(const WorkspaceNode& split)
{
    std::vector<float> weights = effective_sizes(split);
    float              total   = std::accumulate(weights.begin(), weights.end(), 0.0f);
    if (total <= 0.0f)
        total = 1.0f;
    for (float& w : weights)
        w /= total;
    return weights;
}

// Calls fn(i, child_area) for each child of `split` laid out inside `area`.
template <typename Fn>
static void for_each_child_area(const WorkspaceNode& split, const Rect& area, Fn&& fn)
{
    const bool  along_x = split.direction == SplitDirection::Vertical;
    const float origin  = along_x ? area.x : area.y;
    const float extent  = along_x ? area.w : area.h;
    const auto  shares  = shares_of(split);
    const size_t n      = split.children.size();

    float cumulative = 0.0f;
    float start      = origin;
    for (size_t i = 0; i < n; ++i)
    {
        cumulative += shares[i];
        float end = (i + 1 == n) ? origin + extent : origin + extent * cumulative;
        Rect  child_area =
            along_x ? Rect{start, area.y, end - start, area.h} : Rect{area.x, start, area.w, end - start};
        fn(i, child_area);
        start = end;
    }
}

static void layout_recursive(const WorkspaceNode& node, const Rect& area, RectMap& out)
{
    if (node.is_pane())
    {
        out[node.session_id] = area;
        return;
    }
    for_each_child_area(node,
                        area,
                        [&](size_t i, const Rect& child_area)
                        { layout_recursive(*node.children[i], child_area, out); });
}

RectMap compute_rects(const NodePtr& root, const Rect& area)
{
    RectMap out;
    if (root)
        layout_recursive(*root, area, out);
    return out;
}

RectMap compute_rects(const NodePtr& root, Size size)
{
    return compute_rects(root, Rect{0.0f, 0.0f, size.width, size.height});
}

// ─── Resizers ────────────────────────────────────────────────────────────────

static void resizers_recursive(const WorkspaceNode&        node,
                               const Rect&                 area,
                               float                       thickness,
                               std::vector<ResizerHandle>& out)
{
    if (node.is_pane())
        return;

    const bool   along_x = node.direction == SplitDirection::Vertical;
    const size_t n       = node.children.size();
    const float  half    = thickness * 0.5f;

    for_each_child_area(node,
                        area,
                        [&](size_t i, const Rect& child_area)
                        {
                            if (i + 1 < n)
                            {
                                ResizerHandle handle;
                                handle.id         = node.id + "-" + std::to_string(i);
                                handle.split_id   = node.id;
                                handle.index      = i;
                                handle.direction  = node.direction;
                                handle.split_area = area;
                                if (along_x)
                                {
                                    float boundary = child_area.right();
                                    handle.rect    = Rect{boundary - half, area.y, thickness, area.h};
                                }
                                else
                                {
                                    float boundary = child_area.bottom();
                                    handle.rect    = Rect{area.x, boundary - half, area.w, thickness};
                                }
                                out.push_back(std::move(handle));
                            }
                            resizers_recursive(*node.children[i], child_area, thickness, out);
                        });
}

std::vector<ResizerHandle> compute_resizers(const NodePtr&       root,
                                            Size                 size,
                                            const LayoutOptions& options)
{
    std::vector<ResizerHandle> out;
    if (!root || size.width <= 0.0f || size.height <= 0.0f)
        return out;
    resizers_recursive(*root, Rect{0.0f, 0.0f, size.width, size.height}, options.resizer_thickness, out);
    return out;
}

// ─── Resize gesture ──────────────────────────────────────────────────────────

std::vector<float> apply_resize_delta(const std::vector<float>& start_sizes,
                                      size_t                    index,
                                      float                     extent,
                                      float                     delta,
                                      float                     min_pane_px)
{
    if (index + 1 >= start_sizes.size() || !(extent > 0.0f) || !std::isfinite(delta))
        return start_sizes;

    const float weight_total = std::accumulate(start_sizes.begin(), start_sizes.end(), 0.0f);
    if (weight_total <= 0.0f)
        return start_sizes;

    std::vector<float> px;
    px.reserve(start_sizes.size());
    for (float s : start_sizes)
        px.push_back(s / weight_total * extent);

    // Capped at half of what the two neighbours share, so the pair never
    // needs more room than it has and the other children keep their pixels.
    const float min_px = std::min(min_pane_px, (px[index] + px[index + 1]) * 0.5f);

    float a = px[index] + delta;
    float b = px[index + 1] - delta;
    if (a < min_px)
    {
        b -= min_px - a;
        a = min_px;
    }
    if (b < min_px)
    {
        a -= min_px - b;
        b = min_px;
    }
    px[index]     = std::max(min_px, a);
    px[index + 1] = std::max(min_px, b);

    float total_px = std::accumulate(px.begin(), px.end(), 0.0f);
    if (total_px <= 0.0f)
        return start_sizes;

    std::vector<float> out;
    out.reserve(px.size());
    for (float p : px)
        out.push_back(p / total_px * weight_total);
    return out;
}

// ─── Directional focus ───────────────────────────────────────────────────────

namespace
{

struct Candidate
{
    const SessionId* id;
    Rect             rect;
};

bool overlaps(float a0, float a1, float b0, float b1)
{
    return std::min(a1, b1) > std::max(a0, b0);
}

}   // namespace

std::optional<SessionId> next_focus(const NodePtr&       root,
                                    const SessionId&     current,
                                    FocusDirection       direction,
                                    Size                 area,
                                    const LayoutOptions& options)
{
    if (!root || area.width <= 0.0f || area.height <= 0.0f)
        return std::nullopt;

    const RectMap rects = compute_rects(root, area);
    auto          it    = rects.find(current);
    if (it == rects.end())
        return std::nullopt;
    const Rect cur = it->second;

    // Document order keeps tie-breaking deterministic.
    std::vector<Candidate> others;
    for (const auto& sid : collect_session_ids(root))
    {
        if (sid == current)
            continue;
        auto found = rects.find(sid);
        if (found != rects.end())
            others.push_back(Candidate{&found->first, found->second});
    }
    if (others.empty())
        return std::nullopt;

    const float eps = options.focus_edge_epsilon * std::max(area.width, area.height);

    std::vector<Candidate> candidates;
    auto                   keep_if = [&](auto&& pred)
    {
        for (const auto& c : others)
            if (pred(c.rect))
                candidates.push_back(c);
    };

    switch (direction)
    {
        case FocusDirection::Left:
            keep_if([&](const Rect& r) { return r.right() <= cur.x + eps; });
            if (candidates.empty())
            {
                float max_x = -std::numeric_limits<float>::infinity();
                for (const auto& c : others)
                    max_x = std::max(max_x, c.rect.x);
                keep_if([&](const Rect& r) { return r.x >= max_x - eps; });
            }
            break;
        case FocusDirection::Right:
            keep_if([&](const Rect& r) { return r.x >= cur.right() - eps; });
            if (candidates.empty())
            {
                float min_x = std::numeric_limits<float>::infinity();
                for (const auto& c : others)
                    min_x = std::min(min_x, c.rect.x);
                keep_if([&](const Rect& r) { return r.x <= min_x + eps; });
            }
            break;
        case FocusDirection::Up:
            keep_if([&](const Rect& r) { return r.bottom() <= cur.y + eps; });
            if (candidates.empty())
            {
                float max_y = -std::numeric_limits<float>::infinity();
                for (const auto& c : others)
                    max_y = std::max(max_y, c.rect.y);
                keep_if([&](const Rect& r) { return r.y >= max_y - eps; });
            }
            break;
        case FocusDirection::Down:
            keep_if([&](const Rect& r) { return r.y >= cur.bottom() - eps; });
            if (candidates.empty())
            {
                float min_y = std::numeric_limits<float>::infinity();
                for (const auto& c : others)
                    min_y = std::min(min_y, c.rect.y);
                keep_if([&](const Rect& r) { return r.y <= min_y + eps; });
            }
            break;
    }

    if (candidates.empty())
        return std::nullopt;

    // Distance along the travel axis, plus twice the perpendicular centre
    // distance when the two panes do not overlap on the perpendicular axis.
    const bool       horizontal = direction == FocusDirection::Left || direction == FocusDirection::Right;
    const Candidate* best       = nullptr;
    float            best_score = std::numeric_limits<float>::infinity();

    for (const auto& c : candidates)
    {
        float score;
        if (horizontal)
        {
            bool  overlap = overlaps(cur.y, cur.bottom(), c.rect.y, c.rect.bottom());
            float penalty = overlap ? 0.0f : std::fabs(c.rect.center_y() - cur.center_y()) * 2.0f;
            score         = std::fabs(c.rect.center_x() - cur.center_x()) + penalty;
        }
        else
        {
            bool  overlap = overlaps(cur.x, cur.right(), c.rect.x, c.rect.right());
            float penalty = overlap ? 0.0f : std::fabs(c.rect.center_x() - cur.center_x()) * 2.0f;
            score         = std::fabs(c.rect.center_y() - cur.center_y()) + penalty;
        }
        if (score < best_score)
        {
            best_score = score;
            best       = &c;
        }
    }

    if (!best)
        return std::nullopt;
    TERMDECK_LOG_TRACE("layout", "next_focus {} {} -> {}", current, to_string(direction), *best->id);
    return *best->id;
}

// ─── Drop hints ──────────────────────────────────────────────────────────────

std::optional<DropHint> compute_drop_hint(const NodePtr& root, Size container, float x, float y)
{
    if (container.width <= 0.0f || container.height <= 0.0f)
        return std::nullopt;
    if (x < 0.0f || x > container.width || y < 0.0f || y > container.height)
        return std::nullopt;

    std::optional<SessionId> target;
    Rect                     base{0.0f, 0.0f, container.width, container.height};

    if (root)
    {
        const RectMap rects = compute_rects(root, container);
        for (const auto& sid : collect_session_ids(root))
        {
            auto it = rects.find(sid);
            if (it != rects.end() && it->second.contains(x, y) && it->second.w > 0.0f
                && it->second.h > 0.0f)
            {
                target = sid;
                base   = it->second;
                break;
            }
        }
    }

    const float rel_x = (x - base.x) / base.w;
    const float rel_y = (y - base.y) / base.h;

    const bool prefers_vertical = std::fabs(rel_x - 0.5f) > std::fabs(rel_y - 0.5f);

    DropHint out;
    out.hint.target_session_id = target;
    out.preview                = base;
    if (prefers_vertical)
    {
        out.hint.direction = SplitDirection::Vertical;
        out.hint.position  = rel_x < 0.5f ? SplitPosition::Left : SplitPosition::Right;
        out.preview.w      = base.w * 0.5f;
        if (out.hint.position == SplitPosition::Right)
            out.preview.x = base.x + base.w * 0.5f;
    }
    else
    {
        out.hint.direction = SplitDirection::Horizontal;
        out.hint.position  = rel_y < 0.5f ? SplitPosition::Top : SplitPosition::Bottom;
        out.preview.h      = base.h * 0.5f;
        if (out.hint.position == SplitPosition::Bottom)
            out.preview.y = base.y + base.h * 0.5f;
    }
    return out;
}

}   // namespace termdeck
