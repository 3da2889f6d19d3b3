#pragma once

#include <optional>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <utility>
#include <vector>

namespace termdeck
{

enum class TabDropPosition
{
    Before,
    After
};

const char*                    to_string(TabDropPosition position);
std::optional<TabDropPosition> tab_drop_position_from_string(std::string_view s);

/**
 * TabOrderManager: Persisted, user-reorderable order of top-level tabs.
 *
 * The stored order is never trusted verbatim: every read reconciles it
 * against the live set of tab ids (orphan sessions and workspaces), dropping
 * dead ids and appending new ones in discovery order. Reading never writes
 * the reconciled order back; only reorder() and set_stored_order() do.
 */
class TabOrderManager
{
   public:
    TabOrderManager() = default;

    // Stored ids still live, in stored order, followed by the remaining live
    // ids in their given order. Duplicates are dropped. Idempotent.
    static std::vector<TabId> effective_order(const std::vector<TabId>& stored,
                                              const std::vector<TabId>& live);

    std::vector<TabId> ordered(const std::vector<TabId>& live) const
    {
        return effective_order(stored_, live);
    }

    // Moves `dragged` immediately before or after `target` in the effective
    // order and stores the result. No-op (returns false) when the ids are equal
    // or either one is not live.
    bool reorder(const std::vector<TabId>& live,
                 const TabId&              dragged,
                 const TabId&              target,
                 TabDropPosition           position);

    const std::vector<TabId>& stored_order() const { return stored_; }
    void set_stored_order(std::vector<TabId> order) { stored_ = std::move(order); }

   private:
    std::vector<TabId> stored_;
};

}   // namespace termdeck
