#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <termdeck/session.hpp>
#include <vector>

#include "session_registry.hpp"

namespace termdeck
{

// Plain persisted state. The registry produces one with snapshot() and
// accepts one with restore(); an external store decides where it lives.
struct Snapshot
{
    static constexpr int CURRENT_VERSION = 1;

    int                    version = CURRENT_VERSION;
    std::vector<Session>   sessions;
    std::vector<Workspace> workspaces;
    std::vector<TabId>     tab_order;
    TabId                  active_tab;
};

std::string serialize_snapshot(const Snapshot& snapshot);

// nullopt for text that is not a snapshot (bad JSON, wrong top-level shape,
// newer version). Individual malformed records are skipped with a warning.
std::optional<Snapshot> deserialize_snapshot(std::string_view text);

// Makes a snapshot satisfy the registry's membership rules:
//   - sessions with empty or duplicate ids are dropped
//   - panes naming unknown sessions, sessions already placed in an earlier
//     workspace, or later repeats within one tree are pruned; a workspace
//     left with no panes is dropped (a single pane is a valid workspace)
//   - every session's workspace_id is set from the tree that holds it
//   - focused_session_id must name a member
//   - restored sessions are Disconnected
// The active tab and tab order are left to the registry. Returns the number
// of repairs made (status changes are not counted).
size_t repair_snapshot(Snapshot& snapshot);

}   // namespace termdeck
