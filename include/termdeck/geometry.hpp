#pragma once

namespace termdeck
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float bottom() const { return y + h; }
    float center_x() const { return x + w * 0.5f; }
    float center_y() const { return y + h * 0.5f; }

    // Closed on all four edges: a point on a shared boundary hits both panes,
    // callers resolve that by taking the first match in document order.
    bool contains(float px, float py) const
    {
        return px >= x && px <= x + w && py >= y && py <= y + h;
    }

    bool operator==(const Rect&) const = default;
};

struct Size
{
    float width  = 0.0f;
    float height = 0.0f;
};

}   // namespace termdeck
