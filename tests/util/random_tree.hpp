#pragma once

// Seeded generators for workspace trees built through the public edit
// operations, so every tree a test sees is one a user could produce.

#include <random>
#include <string>
#include <vector>

#include "core/workspace_tree.hpp"

namespace termdeck::test
{

// A hint whose position agrees with its direction, aimed at a random live
// pane (or at the whole root roughly one time in four).
inline SplitHint random_hint(std::mt19937& rng, const std::vector<SessionId>& live)
{
    std::uniform_int_distribution<int> coin(0, 1);
    std::uniform_int_distribution<int> quarter(0, 3);

    SplitHint h;
    if (coin(rng) == 0)
    {
        h.direction = SplitDirection::Vertical;
        h.position  = coin(rng) == 0 ? SplitPosition::Left : SplitPosition::Right;
    }
    else
    {
        h.direction = SplitDirection::Horizontal;
        h.position  = coin(rng) == 0 ? SplitPosition::Top : SplitPosition::Bottom;
    }
    if (!live.empty() && quarter(rng) != 0)
    {
        std::uniform_int_distribution<size_t> pick(0, live.size() - 1);
        h.target_session_id = live[pick(rng)];
    }
    return h;
}

// Grows a tree to `panes` panes named "p0".."pN" by random insert_pane calls.
inline NodePtr random_tree(std::mt19937& rng, size_t panes)
{
    NodePtr                root;
    std::vector<SessionId> live;
    for (size_t i = 0; i < panes; ++i)
    {
        SessionId id = "p" + std::to_string(i);
        root         = insert_pane(root, id, random_hint(rng, live));
        live.push_back(id);
    }
    return root;
}

// Gives every split random positive weights through update_split_sizes.
inline NodePtr randomize_weights(std::mt19937& rng, NodePtr root)
{
    std::vector<SplitId>                  split_ids;
    std::vector<const WorkspaceNode*>     stack{root.get()};
    std::uniform_real_distribution<float> weight(0.2f, 3.0f);
    while (!stack.empty())
    {
        const WorkspaceNode* node = stack.back();
        stack.pop_back();
        if (!node || node->is_pane())
            continue;
        split_ids.push_back(node->id);
        for (const auto& child : node->children)
            stack.push_back(child.get());
    }
    for (const auto& id : split_ids)
    {
        const WorkspaceNode* split = find_split(root, id);
        std::vector<float>   sizes;
        for (size_t i = 0; i < split->children.size(); ++i)
            sizes.push_back(weight(rng));
        root = update_split_sizes(root, id, sizes);
    }
    return root;
}

}   // namespace termdeck::test
