#include "workspace_tree.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <termdeck/logger.hpp>
#include <unordered_set>

#include "ids.hpp"

namespace termdeck
{

// ─── Enum helpers ────────────────────────────────────────────────────────────

const char* to_string(SplitDirection direction)
{
    return direction == SplitDirection::Horizontal ? "horizontal" : "vertical";
}

const char* to_string(SplitPosition position)
{
    switch (position)
    {
        case SplitPosition::Left:
            return "left";
        case SplitPosition::Right:
            return "right";
        case SplitPosition::Top:
            return "top";
        case SplitPosition::Bottom:
            return "bottom";
    }
    return "right";
}

std::optional<SplitDirection> split_direction_from_string(std::string_view s)
{
    if (s == "horizontal")
        return SplitDirection::Horizontal;
    if (s == "vertical")
        return SplitDirection::Vertical;
    return std::nullopt;
}

// ─── Construction ────────────────────────────────────────────────────────────

static std::vector<float> equal_weights(size_t n)
{
    if (n == 0)
        return {};
    return std::vector<float>(n, 1.0f / static_cast<float>(n));
}

static bool weights_usable(const std::vector<float>& sizes, size_t child_count)
{
    if (sizes.size() != child_count)
        return false;
    return std::all_of(sizes.begin(),
                       sizes.end(),
                       [](float s) { return std::isfinite(s) && s > 0.0f; });
}

static std::vector<float> normalized(const std::vector<float>& sizes)
{
    float total = std::accumulate(sizes.begin(), sizes.end(), 0.0f);
    if (total <= 0.0f)
        return equal_weights(sizes.size());
    std::vector<float> out;
    out.reserve(sizes.size());
    for (float s : sizes)
        out.push_back(s / total);
    return out;
}

NodePtr make_pane(const SessionId& session_id)
{
    auto node        = std::make_shared<WorkspaceNode>();
    node->kind       = WorkspaceNode::Kind::Pane;
    node->session_id = session_id;
    return node;
}

NodePtr make_split_with_id(SplitId              id,
                           SplitDirection       direction,
                           std::vector<NodePtr> children,
                           std::vector<float>   sizes)
{
    auto node       = std::make_shared<WorkspaceNode>();
    node->kind      = WorkspaceNode::Kind::Split;
    node->id        = std::move(id);
    node->direction = direction;
    if (!weights_usable(sizes, children.size()))
        sizes = equal_weights(children.size());
    node->sizes    = std::move(sizes);
    node->children = std::move(children);
    return node;
}

NodePtr make_split(SplitDirection direction, std::vector<NodePtr> children, std::vector<float> sizes)
{
    return make_split_with_id(
        ids::next(ids::SPLIT_PREFIX), direction, std::move(children), std::move(sizes));
}

NodePtr make_even_split(const std::vector<SessionId>& session_ids, SplitDirection direction)
{
    if (session_ids.empty())
        return nullptr;
    if (session_ids.size() == 1)
        return make_pane(session_ids.front());

    std::vector<NodePtr> children;
    children.reserve(session_ids.size());
    for (const auto& sid : session_ids)
        children.push_back(make_pane(sid));
    return make_split(direction, std::move(children));
}

// Copy of a split with new children and sizes, keeping its id.
static NodePtr rebuild_split(const WorkspaceNode& split,
                             std::vector<NodePtr> children,
                             std::vector<float>   sizes)
{
    return make_split_with_id(split.id, split.direction, std::move(children), std::move(sizes));
}

// ─── insert_pane ─────────────────────────────────────────────────────────────

static NodePtr wrap_with_new_pane(const NodePtr& existing, const SessionId& new_session_id,
                                  const SplitHint& hint)
{
    NodePtr              pane = make_pane(new_session_id);
    std::vector<NodePtr> children;
    if (inserts_before(hint.position))
        children = {pane, existing};
    else
        children = {existing, pane};
    return make_split(hint.direction, std::move(children), {0.5f, 0.5f});
}

static NodePtr insert_at_target(const NodePtr&   node,
                                 const SessionId& target,
                                 const SessionId& new_session_id,
                                 const SplitHint& hint)
{
    if (node->is_pane())
    {
        if (node->session_id == target)
            return wrap_with_new_pane(node, new_session_id, hint);
        return node;
    }

    std::vector<NodePtr> children;
    children.reserve(node->children.size());
    bool changed = false;
    for (const auto& child : node->children)
    {
        NodePtr next = changed ? child : insert_at_target(child, target, new_session_id, hint);
        changed      = changed || next != child;
        children.push_back(std::move(next));
    }
    if (!changed)
        return node;
    return rebuild_split(*node, std::move(children), node->sizes);
}

NodePtr insert_pane(const NodePtr& root, const SessionId& new_session_id, const SplitHint& hint)
{
    if (new_session_id.empty())
        return root;

    if (!root)
    {
        if (hint.target_session_id)
            return root;
        return make_pane(new_session_id);
    }

    if (contains_session(root, new_session_id))
    {
        TERMDECK_LOG_DEBUG("tree", "insert_pane: {} already in tree, ignored", new_session_id);
        return root;
    }

    if (!hint.target_session_id)
        return wrap_with_new_pane(root, new_session_id, hint);

    const SessionId& target = *hint.target_session_id;
    if (target == new_session_id || !contains_session(root, target))
    {
        TERMDECK_LOG_DEBUG("tree", "insert_pane: target {} not usable, ignored", target);
        return root;
    }

    return insert_at_target(root, target, new_session_id, hint);
}

// ─── prune_node ──────────────────────────────────────────────────────────────

static NodePtr prune_recursive(const NodePtr& node, const std::function<bool(const SessionId&)>& drop)
{
    if (node->is_pane())
        return drop(node->session_id) ? nullptr : node;

    std::vector<float>   weights = effective_sizes(*node);
    std::vector<NodePtr> kept_children;
    std::vector<float>   kept_sizes;
    bool                 changed = false;

    for (size_t i = 0; i < node->children.size(); ++i)
    {
        const NodePtr& child  = node->children[i];
        NodePtr        pruned = prune_recursive(child, drop);
        if (pruned != child)
            changed = true;
        if (pruned)
        {
            kept_children.push_back(std::move(pruned));
            kept_sizes.push_back(weights[i]);
        }
    }

    if (!changed)
        return node;
    if (kept_children.empty())
        return nullptr;
    if (kept_children.size() == 1)
        return kept_children.front();

    if (kept_children.size() < node->children.size())
        kept_sizes = normalized(kept_sizes);
    else
        kept_sizes = node->sizes;
    return rebuild_split(*node, std::move(kept_children), std::move(kept_sizes));
}

NodePtr prune_node(const NodePtr& root, const SessionId& session_id)
{
    return prune_panes_if(root, [&](const SessionId& id) { return id == session_id; });
}

NodePtr prune_panes_if(const NodePtr& root, const std::function<bool(const SessionId&)>& drop)
{
    if (!root)
        return nullptr;
    return prune_recursive(root, drop);
}

// ─── Traversal ───────────────────────────────────────────────────────────────

static void collect_recursive(const WorkspaceNode& node, std::vector<SessionId>& out)
{
    if (node.is_pane())
    {
        out.push_back(node.session_id);
        return;
    }
    for (const auto& child : node.children)
        collect_recursive(*child, out);
}

std::vector<SessionId> collect_session_ids(const NodePtr& root)
{
    std::vector<SessionId> out;
    if (root)
        collect_recursive(*root, out);
    return out;
}

static NodePtr patch_sizes(const NodePtr&            node,
                           const SplitId&            split_id,
                           const std::vector<float>& sizes)
{
    if (node->is_pane())
        return node;

    if (node->id == split_id)
        return rebuild_split(*node, node->children, sizes);

    std::vector<NodePtr> children;
    children.reserve(node->children.size());
    bool changed = false;
    for (const auto& child : node->children)
    {
        NodePtr next = changed ? child : patch_sizes(child, split_id, sizes);
        changed      = changed || next != child;
        children.push_back(std::move(next));
    }
    if (!changed)
        return node;
    return rebuild_split(*node, std::move(children), node->sizes);
}

NodePtr update_split_sizes(const NodePtr& root, const SplitId& split_id, const std::vector<float>& sizes)
{
    const WorkspaceNode* split = find_split(root, split_id);
    if (!split)
    {
        TERMDECK_LOG_DEBUG("tree", "update_split_sizes: unknown split {}", split_id);
        return root;
    }
    if (!weights_usable(sizes, split->children.size()))
    {
        TERMDECK_LOG_WARN("tree",
                          "update_split_sizes: {} weights for {} children of {}, ignored",
                          sizes.size(),
                          split->children.size(),
                          split_id);
        return root;
    }
    return patch_sizes(root, split_id, sizes);
}

static const WorkspaceNode* find_split_recursive(const WorkspaceNode& node, const SplitId& split_id)
{
    if (node.is_pane())
        return nullptr;
    if (node.id == split_id)
        return &node;
    for (const auto& child : node.children)
    {
        if (auto* found = find_split_recursive(*child, split_id))
            return found;
    }
    return nullptr;
}

const WorkspaceNode* find_split(const NodePtr& root, const SplitId& split_id)
{
    if (!root)
        return nullptr;
    return find_split_recursive(*root, split_id);
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool contains_session(const NodePtr& root, const SessionId& session_id)
{
    if (!root)
        return false;
    if (root->is_pane())
        return root->session_id == session_id;
    return std::any_of(root->children.begin(),
                       root->children.end(),
                       [&](const NodePtr& c) { return contains_session(c, session_id); });
}

size_t count_panes(const NodePtr& root)
{
    if (!root)
        return 0;
    if (root->is_pane())
        return 1;
    size_t count = 0;
    for (const auto& child : root->children)
        count += count_panes(child);
    return count;
}

size_t count_splits(const NodePtr& root)
{
    if (!root || root->is_pane())
        return 0;
    size_t count = 1;
    for (const auto& child : root->children)
        count += count_splits(child);
    return count;
}

std::vector<float> effective_sizes(const WorkspaceNode& split)
{
    if (weights_usable(split.sizes, split.children.size()))
        return split.sizes;
    return equal_weights(split.children.size());
}

bool equivalent(const NodePtr& a, const NodePtr& b)
{
    if (!a || !b)
        return !a && !b;
    if (a->kind != b->kind)
        return false;
    if (a->is_pane())
        return a->session_id == b->session_id;

    if (a->direction != b->direction || a->children.size() != b->children.size())
        return false;

    auto wa = normalized(effective_sizes(*a));
    auto wb = normalized(effective_sizes(*b));
    for (size_t i = 0; i < wa.size(); ++i)
    {
        if (std::fabs(wa[i] - wb[i]) > 1e-4f)
            return false;
    }
    for (size_t i = 0; i < a->children.size(); ++i)
    {
        if (!equivalent(a->children[i], b->children[i]))
            return false;
    }
    return true;
}

static bool validate_recursive(const WorkspaceNode&           node,
                               std::unordered_set<SessionId>& seen,
                               std::string*                   error)
{
    auto fail = [&](const std::string& msg)
    {
        if (error)
            *error = msg;
        return false;
    };

    if (node.is_pane())
    {
        if (node.session_id.empty())
            return fail("pane without session id");
        if (!seen.insert(node.session_id).second)
            return fail("session " + node.session_id + " appears twice");
        return true;
    }

    if (node.children.size() < 2)
        return fail("split " + node.id + " has fewer than 2 children");
    if (!node.sizes.empty() && !weights_usable(node.sizes, node.children.size()))
        return fail("split " + node.id + " has mismatched or non-positive sizes");

    for (const auto& child : node.children)
    {
        if (!child)
            return fail("split " + node.id + " has a null child");
        if (!validate_recursive(*child, seen, error))
            return false;
    }
    return true;
}

bool validate_tree(const NodePtr& root, std::string* error)
{
    if (!root)
        return true;
    std::unordered_set<SessionId> seen;
    return validate_recursive(*root, seen, error);
}

static void describe_recursive(const WorkspaceNode& node, std::ostringstream& os)
{
    if (node.is_pane())
    {
        os << node.session_id;
        return;
    }
    os << (node.direction == SplitDirection::Vertical ? "V[" : "H[");
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        describe_recursive(*node.children[i], os);
    }
    os << "]";
}

std::string describe(const NodePtr& root)
{
    if (!root)
        return "(empty)";
    std::ostringstream os;
    describe_recursive(*root, os);
    return os.str();
}

}   // namespace termdeck
