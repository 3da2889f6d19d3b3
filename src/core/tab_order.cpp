#include "tab_order.hpp"

#include <algorithm>
#include <termdeck/logger.hpp>
#include <unordered_set>

namespace termdeck
{

const char* to_string(TabDropPosition position)
{
    return position == TabDropPosition::After ? "after" : "before";
}

std::optional<TabDropPosition> tab_drop_position_from_string(std::string_view s)
{
    if (s == "before")
        return TabDropPosition::Before;
    if (s == "after")
        return TabDropPosition::After;
    return std::nullopt;
}

std::vector<TabId> TabOrderManager::effective_order(const std::vector<TabId>& stored,
                                                    const std::vector<TabId>& live)
{
    std::unordered_set<TabId> live_set(live.begin(), live.end());
    std::unordered_set<TabId> seen;
    std::vector<TabId>        out;
    out.reserve(live.size());

    for (const auto& id : stored)
    {
        if (live_set.count(id) && seen.insert(id).second)
            out.push_back(id);
    }
    for (const auto& id : live)
    {
        if (seen.insert(id).second)
            out.push_back(id);
    }
    return out;
}

bool TabOrderManager::reorder(const std::vector<TabId>& live,
                              const TabId&              dragged,
                              const TabId&              target,
                              TabDropPosition           position)
{
    if (dragged == target)
        return false;

    std::vector<TabId> order = effective_order(stored_, live);

    auto dragged_it = std::find(order.begin(), order.end(), dragged);
    auto target_it  = std::find(order.begin(), order.end(), target);
    if (dragged_it == order.end() || target_it == order.end())
    {
        TERMDECK_LOG_DEBUG("tabs", "reorder ignored: {} or {} is not a live tab", dragged, target);
        return false;
    }

    size_t dragged_index = static_cast<size_t>(dragged_it - order.begin());
    size_t target_index  = static_cast<size_t>(target_it - order.begin());

    order.erase(order.begin() + static_cast<std::ptrdiff_t>(dragged_index));
    if (dragged_index < target_index)
        --target_index;
    if (position == TabDropPosition::After)
        ++target_index;

    order.insert(order.begin() + static_cast<std::ptrdiff_t>(target_index), dragged);
    stored_ = std::move(order);

    TERMDECK_LOG_DEBUG("tabs", "moved {} {} {}", dragged, to_string(position), target);
    return true;
}

}   // namespace termdeck
