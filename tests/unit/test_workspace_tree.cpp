#include <gtest/gtest.h>

#include <random>
#include <set>

#include "core/ids.hpp"
#include "core/workspace_tree.hpp"
#include "util/random_tree.hpp"

using namespace termdeck;

namespace
{

SplitHint hint(SplitDirection d, SplitPosition p)
{
    SplitHint h;
    h.direction = d;
    h.position  = p;
    return h;
}

SplitHint hint(SplitDirection d, SplitPosition p, const SessionId& target)
{
    SplitHint h         = hint(d, p);
    h.target_session_id = target;
    return h;
}

// V[a, H[b, c]]
NodePtr three_pane_tree()
{
    auto inner = make_split(SplitDirection::Horizontal, {make_pane("b"), make_pane("c")});
    return make_split(SplitDirection::Vertical, {make_pane("a"), inner});
}

}   // namespace

// ─── Construction ────────────────────────────────────────────────────────────

TEST(WorkspaceTreeConstruction, PaneHoldsSession)
{
    auto pane = make_pane("a");
    ASSERT_NE(pane, nullptr);
    EXPECT_TRUE(pane->is_pane());
    EXPECT_EQ(pane->session_id, "a");
    EXPECT_EQ(count_panes(pane), 1u);
    EXPECT_EQ(count_splits(pane), 0u);
}

TEST(WorkspaceTreeConstruction, SplitIdsAreUnique)
{
    auto a = make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("b")});
    auto b = make_split(SplitDirection::Vertical, {make_pane("c"), make_pane("d")});
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(a->id.rfind("split-", 0), 0u);
}

TEST(WorkspaceTreeConstruction, BadSizesFallBackToEqualWeights)
{
    auto mismatched = make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("b")}, {1.0f});
    ASSERT_EQ(mismatched->sizes.size(), 2u);
    EXPECT_FLOAT_EQ(mismatched->sizes[0], 0.5f);
    EXPECT_FLOAT_EQ(mismatched->sizes[1], 0.5f);

    auto negative =
        make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("b")}, {0.7f, -0.1f});
    EXPECT_FLOAT_EQ(negative->sizes[0], 0.5f);
}

TEST(WorkspaceTreeConstruction, EvenSplit)
{
    auto root = make_even_split({"a", "b", "c"}, SplitDirection::Vertical);
    ASSERT_TRUE(root->is_split());
    EXPECT_EQ(root->children.size(), 3u);
    for (float s : root->sizes)
        EXPECT_NEAR(s, 1.0f / 3.0f, 1e-6f);

    EXPECT_TRUE(make_even_split({"a"}, SplitDirection::Vertical)->is_pane());
    EXPECT_EQ(make_even_split({}, SplitDirection::Vertical), nullptr);
}

TEST(WorkspaceTreeConstruction, EnumStrings)
{
    EXPECT_STREQ(to_string(SplitDirection::Horizontal), "horizontal");
    EXPECT_STREQ(to_string(SplitPosition::Bottom), "bottom");
    EXPECT_EQ(split_direction_from_string("vertical"), SplitDirection::Vertical);
    EXPECT_FALSE(split_direction_from_string("diagonal").has_value());
}

// ─── insert_pane ─────────────────────────────────────────────────────────────

TEST(InsertPane, IntoEmptyTree)
{
    auto root = insert_pane(nullptr, "a", hint(SplitDirection::Vertical, SplitPosition::Right));
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(root->is_pane());
    EXPECT_EQ(root->session_id, "a");
}

TEST(InsertPane, EmptyTreeWithTargetIsNoOp)
{
    auto root = insert_pane(nullptr, "a", hint(SplitDirection::Vertical, SplitPosition::Right, "x"));
    EXPECT_EQ(root, nullptr);
}

TEST(InsertPane, WrapsRootRight)
{
    auto root = insert_pane(make_pane("a"), "b", hint(SplitDirection::Vertical, SplitPosition::Right));
    EXPECT_EQ(describe(root), "V[a, b]");
    EXPECT_FLOAT_EQ(root->sizes[0], 0.5f);
    EXPECT_FLOAT_EQ(root->sizes[1], 0.5f);
}

TEST(InsertPane, WrapsRootTop)
{
    auto root = insert_pane(make_pane("a"), "b", hint(SplitDirection::Horizontal, SplitPosition::Top));
    EXPECT_EQ(describe(root), "H[b, a]");
}

TEST(InsertPane, AtTargetReplacesOnlyThatPane)
{
    auto root = three_pane_tree();
    auto next = insert_pane(root, "d", hint(SplitDirection::Vertical, SplitPosition::Left, "c"));

    EXPECT_EQ(describe(next), "V[a, H[b, V[d, c]]]");
    // Untouched subtrees are shared and the old root is unchanged.
    EXPECT_EQ(next->children[0], root->children[0]);
    EXPECT_EQ(next->id, root->id);
    EXPECT_EQ(describe(root), "V[a, H[b, c]]");
}

TEST(InsertPane, DuplicateSessionIsNoOp)
{
    auto root = three_pane_tree();
    EXPECT_EQ(insert_pane(root, "b", hint(SplitDirection::Vertical, SplitPosition::Right)), root);
}

TEST(InsertPane, UnknownTargetIsNoOp)
{
    auto root = three_pane_tree();
    EXPECT_EQ(insert_pane(root, "d", hint(SplitDirection::Vertical, SplitPosition::Right, "zz")), root);
}

TEST(InsertPane, EmptySessionIdIsNoOp)
{
    auto root = three_pane_tree();
    EXPECT_EQ(insert_pane(root, "", hint(SplitDirection::Vertical, SplitPosition::Right)), root);
}

TEST(InsertPane, TargetEqualToNewSessionIsNoOp)
{
    auto root = make_pane("a");
    EXPECT_EQ(insert_pane(root, "a", hint(SplitDirection::Vertical, SplitPosition::Right, "a")), root);
}

// ─── prune_node ──────────────────────────────────────────────────────────────

TEST(PruneNode, LastPaneYieldsNull)
{
    EXPECT_EQ(prune_node(make_pane("a"), "a"), nullptr);
}

TEST(PruneNode, CollapsesSingleChildSplit)
{
    auto root = three_pane_tree();
    auto next = prune_node(root, "c");
    EXPECT_EQ(describe(next), "V[a, b]");
    // Outer split keeps its id; the collapsed inner split is gone.
    EXPECT_EQ(next->id, root->id);
    EXPECT_EQ(count_splits(next), 1u);
}

TEST(PruneNode, RenormalizesSurvivors)
{
    auto root = make_split(SplitDirection::Vertical,
                           {make_pane("a"), make_pane("b"), make_pane("c")},
                           {0.2f, 0.3f, 0.5f});
    auto next = prune_node(root, "c");
    ASSERT_EQ(next->sizes.size(), 2u);
    EXPECT_NEAR(next->sizes[0], 0.4f, 1e-6f);
    EXPECT_NEAR(next->sizes[1], 0.6f, 1e-6f);
}

TEST(PruneNode, UnknownSessionReturnsSameRoot)
{
    auto root = three_pane_tree();
    EXPECT_EQ(prune_node(root, "zz"), root);
    EXPECT_EQ(prune_node(nullptr, "a"), nullptr);
}

TEST(PruneNode, InsertThenPruneIsEquivalent)
{
    auto root = three_pane_tree();
    auto grown = insert_pane(root, "d", hint(SplitDirection::Horizontal, SplitPosition::Bottom, "a"));
    auto back  = prune_node(grown, "d");
    EXPECT_TRUE(equivalent(root, back)) << describe(back);
}

// ─── Traversal and sizes ─────────────────────────────────────────────────────

TEST(WorkspaceTreeTraversal, CollectInDocumentOrder)
{
    auto ids = collect_session_ids(three_pane_tree());
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "a");
    EXPECT_EQ(ids[1], "b");
    EXPECT_EQ(ids[2], "c");
    EXPECT_TRUE(collect_session_ids(nullptr).empty());
}

TEST(WorkspaceTreeTraversal, UpdateSplitSizes)
{
    auto root  = three_pane_tree();
    auto inner = root->children[1]->id;
    auto next  = update_split_sizes(root, inner, {0.25f, 0.75f});
    ASSERT_NE(next, root);
    const WorkspaceNode* split = find_split(next, inner);
    ASSERT_NE(split, nullptr);
    EXPECT_FLOAT_EQ(split->sizes[0], 0.25f);
    EXPECT_FLOAT_EQ(split->sizes[1], 0.75f);
    EXPECT_EQ(next->children[0], root->children[0]);
}

TEST(WorkspaceTreeTraversal, UpdateSplitSizesRejectsBadInput)
{
    auto root = three_pane_tree();
    EXPECT_EQ(update_split_sizes(root, "split-nope", {0.5f, 0.5f}), root);
    EXPECT_EQ(update_split_sizes(root, root->id, {1.0f}), root);
    EXPECT_EQ(update_split_sizes(root, root->id, {1.0f, 0.0f}), root);
}

TEST(WorkspaceTreeTraversal, EquivalentIgnoresIdsAndScale)
{
    auto a = make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("b")}, {1.0f, 3.0f});
    auto b = make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("b")}, {0.25f, 0.75f});
    auto c = make_split(SplitDirection::Horizontal, {make_pane("a"), make_pane("b")}, {0.25f, 0.75f});
    EXPECT_TRUE(equivalent(a, b));
    EXPECT_FALSE(equivalent(a, c));
    EXPECT_TRUE(equivalent(nullptr, nullptr));
    EXPECT_FALSE(equivalent(a, nullptr));
}

// ─── Validation ──────────────────────────────────────────────────────────────

TEST(WorkspaceTreeValidation, ValidTree)
{
    std::string error;
    EXPECT_TRUE(validate_tree(three_pane_tree(), &error)) << error;
    EXPECT_TRUE(validate_tree(nullptr));
}

TEST(WorkspaceTreeValidation, DuplicateSessionRejected)
{
    auto        root = make_split(SplitDirection::Vertical, {make_pane("a"), make_pane("a")});
    std::string error;
    EXPECT_FALSE(validate_tree(root, &error));
    EXPECT_NE(error.find("twice"), std::string::npos);
}

TEST(WorkspaceTreeValidation, SingleChildSplitRejected)
{
    auto node      = std::make_shared<WorkspaceNode>();
    node->kind     = WorkspaceNode::Kind::Split;
    node->id       = "split-x";
    node->children = {make_pane("a")};
    EXPECT_FALSE(validate_tree(node));
}

TEST(WorkspaceTreeValidation, DescribeEmpty)
{
    EXPECT_EQ(describe(nullptr), "(empty)");
}

// ─── Edit sequences ──────────────────────────────────────────────────────────

TEST(WorkspaceTreeSequences, RandomInsertPruneKeepsTreeValid)
{
    std::mt19937                       rng(20240611);
    std::uniform_int_distribution<int> action(0, 2);

    for (int round = 0; round < 40; ++round)
    {
        NodePtr                root;
        std::vector<SessionId> live;
        int                    next_id = 0;

        for (int step = 0; step < 60; ++step)
        {
            if (live.size() < 2 || action(rng) != 0)
            {
                SessionId id = "s" + std::to_string(next_id++);
                root         = insert_pane(root, id, test::random_hint(rng, live));
                live.push_back(id);
            }
            else
            {
                std::uniform_int_distribution<size_t> pick(0, live.size() - 1);
                const size_t                          i = pick(rng);

                root = prune_node(root, live[i]);
                live.erase(live.begin() + static_cast<std::ptrdiff_t>(i));
            }

            std::string error;
            ASSERT_TRUE(validate_tree(root, &error)) << error << " in " << describe(root);
            auto ids = collect_session_ids(root);
            ASSERT_EQ(std::set<SessionId>(ids.begin(), ids.end()),
                      std::set<SessionId>(live.begin(), live.end()));
        }
    }
}

TEST(WorkspaceTreeSequences, InsertThenPruneRoundTripsForEveryHint)
{
    std::mt19937 rng(77);
    auto         root = test::randomize_weights(rng, test::random_tree(rng, 7));

    std::vector<std::optional<SessionId>> targets{std::nullopt};
    for (const auto& sid : collect_session_ids(root))
        targets.push_back(sid);

    const SplitPosition positions[] = {
        SplitPosition::Left, SplitPosition::Right, SplitPosition::Top, SplitPosition::Bottom};

    for (const auto& target : targets)
    {
        for (SplitPosition position : positions)
        {
            SplitHint h;
            h.direction = (position == SplitPosition::Left || position == SplitPosition::Right)
                              ? SplitDirection::Vertical
                              : SplitDirection::Horizontal;
            h.position          = position;
            h.target_session_id = target;

            auto grown = insert_pane(root, "fresh", h);
            ASSERT_EQ(count_panes(grown), count_panes(root) + 1);
            auto back = prune_node(grown, "fresh");
            EXPECT_TRUE(equivalent(root, back))
                << "target " << target.value_or("(root)") << " position " << to_string(position)
                << ": " << describe(back);
        }
    }
}

// ─── Ids ─────────────────────────────────────────────────────────────────────

TEST(Ids, ReserveSkipsRestoredSuffix)
{
    uint64_t n = ids::peek_counter() + 100;
    ids::reserve("session-" + std::to_string(n));
    EXPECT_EQ(ids::next(ids::SESSION_PREFIX), "session-" + std::to_string(n + 1));
}

TEST(Ids, ReserveIgnoresLowerAndMalformedIds)
{
    uint64_t before = ids::peek_counter();
    ids::reserve("ws-1");
    ids::reserve("vault");
    ids::reserve("split-12x");
    EXPECT_EQ(ids::peek_counter(), before);
}
