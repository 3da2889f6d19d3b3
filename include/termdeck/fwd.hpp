#pragma once

#include <memory>
#include <string>

namespace termdeck
{

// Identifiers are opaque strings of the form "<prefix>-<n>". Session ids and
// workspace ids share one namespace because both appear as top-level tabs.
using SessionId   = std::string;
using WorkspaceId = std::string;
using SplitId     = std::string;
using TabId       = std::string;

// Opaque handle issued by the terminal backend. 0 means "no connection".
using SessionHandle = unsigned long long;

inline constexpr SessionHandle INVALID_SESSION_HANDLE = 0;

struct Rect;
struct Size;

struct WorkspaceNode;
using NodePtr = std::shared_ptr<const WorkspaceNode>;

struct SplitHint;
struct DropHint;
struct ResizerHandle;
struct LayoutOptions;

struct ConnectionParams;
struct Session;
struct Workspace;
struct Snippet;
struct Snapshot;
struct EngineConfig;

class SessionRegistry;
class TabOrderManager;
class ActiveTabStore;
class DeferredQueue;
class TerminalBackend;
class SessionConnector;
class SessionDragController;
class SplitResizeController;

}   // namespace termdeck
