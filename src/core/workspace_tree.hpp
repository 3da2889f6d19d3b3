#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <vector>

namespace termdeck
{

// ─── Split direction / position ──────────────────────────────────────────────

enum class SplitDirection
{
    Horizontal,   // Top / Bottom  (children stacked along y)
    Vertical      // Left | Right  (children side by side along x)
};

enum class SplitPosition
{
    Left,
    Right,
    Top,
    Bottom
};

// Where a new pane goes relative to an existing one. Without a target the
// whole root is wrapped.
struct SplitHint
{
    SplitDirection           direction = SplitDirection::Vertical;
    SplitPosition            position  = SplitPosition::Right;
    std::optional<SessionId> target_session_id;

    bool operator==(const SplitHint&) const = default;
};

// True for Left/Top: the new pane becomes the first child.
inline bool inserts_before(SplitPosition position)
{
    return position == SplitPosition::Left || position == SplitPosition::Top;
}

const char* to_string(SplitDirection direction);
const char* to_string(SplitPosition position);
std::optional<SplitDirection> split_direction_from_string(std::string_view s);

// ─── WorkspaceNode ───────────────────────────────────────────────────────────
// Immutable node of a workspace tree. A Pane references one session; a Split
// divides its area among >= 2 ordered children along one axis.
//
// Nodes are shared through NodePtr (shared_ptr<const>). Every mutation
// rebuilds the path from the root to the edited node and reuses all other
// subtrees, so an old root stays valid and unchanged after an edit.

struct WorkspaceNode
{
    enum class Kind
    {
        Pane,
        Split
    };

    Kind kind = Kind::Pane;

    // Pane
    SessionId session_id;

    // Split
    SplitId              id;
    SplitDirection       direction = SplitDirection::Vertical;
    std::vector<NodePtr> children;
    std::vector<float>   sizes;   // Empty means equal weights

    bool is_pane() const { return kind == Kind::Pane; }
    bool is_split() const { return kind == Kind::Split; }
};

// ─── Construction ────────────────────────────────────────────────────────────

NodePtr make_pane(const SessionId& session_id);

// Builds a split with a fresh id. Sizes that are empty, length-mismatched or
// contain a non-positive weight are replaced by equal weights summing to 1.
// Callers must pass >= 2 children.
NodePtr make_split(SplitDirection       direction,
                   std::vector<NodePtr> children,
                   std::vector<float>   sizes = {});

// Same, keeping a known id (used when decoding persisted trees).
NodePtr make_split_with_id(SplitId              id,
                           SplitDirection       direction,
                           std::vector<NodePtr> children,
                           std::vector<float>   sizes = {});

// One split over all given sessions with equal weights. A single session
// yields a bare pane, an empty list yields nullptr.
NodePtr make_even_split(const std::vector<SessionId>& session_ids, SplitDirection direction);

// ─── Structural operations ───────────────────────────────────────────────────
// Total functions: invalid input returns the tree unchanged.

NodePtr insert_pane(const NodePtr& root, const SessionId& new_session_id, const SplitHint& hint);

// Removes the pane for session_id, collapsing any split left with one child.
// Surviving sibling weights are renormalized to sum to 1. Returns nullptr
// when the whole tree was that one pane.
NodePtr prune_node(const NodePtr& root, const SessionId& session_id);

// Removes every pane for which `drop` returns true, with the same collapse
// and renormalization as prune_node. `drop` is called exactly once per pane,
// in document order, so it may keep state (e.g. to drop repeated ids).
NodePtr prune_panes_if(const NodePtr& root, const std::function<bool(const SessionId&)>& drop);

// Pre-order, document order (left-to-right / top-to-bottom).
std::vector<SessionId> collect_session_ids(const NodePtr& root);

NodePtr update_split_sizes(const NodePtr& root, const SplitId& split_id, const std::vector<float>& sizes);

const WorkspaceNode* find_split(const NodePtr& root, const SplitId& split_id);

// ─── Queries ─────────────────────────────────────────────────────────────────

bool   contains_session(const NodePtr& root, const SessionId& session_id);
size_t count_panes(const NodePtr& root);
size_t count_splits(const NodePtr& root);

// Length-matched weights of a split (equal weights when sizes are absent).
std::vector<float> effective_sizes(const WorkspaceNode& split);

// Structural equality that ignores generated split ids and compares weights
// after normalization with a small tolerance.
bool equivalent(const NodePtr& a, const NodePtr& b);

// Checks every split has >= 2 children, sizes empty or length-matched and
// positive, and no session id appears twice. `error` receives the first
// violation found.
bool validate_tree(const NodePtr& root, std::string* error = nullptr);

// Compact single-line form, e.g. "V[session-1, H[session-2, session-3]]".
std::string describe(const NodePtr& root);

}   // namespace termdeck
