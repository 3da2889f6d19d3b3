#include "snapshot.hpp"

#include <cmath>
#include <sstream>
#include <termdeck/logger.hpp>
#include <unordered_map>
#include <unordered_set>

#include "json.hpp"

namespace termdeck
{

// ─── JSON writer ─────────────────────────────────────────────────────────────

static void write_indent(std::ostringstream& os, int depth)
{
    for (int i = 0; i < depth; ++i)
        os << "  ";
}

static void write_node(std::ostringstream& os, const WorkspaceNode& node, int depth)
{
    if (node.is_pane())
    {
        os << "{\"type\": \"pane\", \"session_id\": " << json::quote(node.session_id) << "}";
        return;
    }

    os << "{\n";
    write_indent(os, depth + 1);
    os << "\"type\": \"split\",\n";
    write_indent(os, depth + 1);
    os << "\"id\": " << json::quote(node.id) << ",\n";
    write_indent(os, depth + 1);
    os << "\"direction\": \"" << to_string(node.direction) << "\",\n";
    write_indent(os, depth + 1);
    os << "\"sizes\": [";
    for (size_t i = 0; i < node.sizes.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << node.sizes[i];
    }
    os << "],\n";
    write_indent(os, depth + 1);
    os << "\"children\": [\n";
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        write_indent(os, depth + 2);
        write_node(os, *node.children[i], depth + 2);
        if (i + 1 < node.children.size())
            os << ",";
        os << "\n";
    }
    write_indent(os, depth + 1);
    os << "]\n";
    write_indent(os, depth);
    os << "}";
}

std::string serialize_snapshot(const Snapshot& snapshot)
{
    std::ostringstream os;
    os.precision(9);

    os << "{\n";
    os << "  \"version\": " << snapshot.version << ",\n";
    os << "  \"active_tab\": " << json::quote(snapshot.active_tab) << ",\n";

    os << "  \"tab_order\": [";
    for (size_t i = 0; i < snapshot.tab_order.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << json::quote(snapshot.tab_order[i]);
    }
    os << "],\n";

    os << "  \"sessions\": [\n";
    for (size_t i = 0; i < snapshot.sessions.size(); ++i)
    {
        const auto& s = snapshot.sessions[i];
        const auto& p = s.params;
        os << "    {\n";
        os << "      \"id\": " << json::quote(s.id) << ",\n";
        os << "      \"status\": \"" << to_string(s.status) << "\",\n";
        if (s.workspace_id)
            os << "      \"workspace_id\": " << json::quote(*s.workspace_id) << ",\n";
        if (s.startup_command)
            os << "      \"startup_command\": " << json::quote(*s.startup_command) << ",\n";
        os << "      \"params\": {\n";
        os << "        \"host_id\": " << json::quote(p.host_id) << ",\n";
        os << "        \"host_label\": " << json::quote(p.host_label) << ",\n";
        os << "        \"hostname\": " << json::quote(p.hostname) << ",\n";
        os << "        \"username\": " << json::quote(p.username) << ",\n";
        os << "        \"protocol\": " << json::quote(p.protocol) << ",\n";
        os << "        \"port\": " << p.port << ",\n";
        os << "        \"mosh_enabled\": " << (p.mosh_enabled ? "true" : "false") << "\n";
        os << "      }\n";
        os << "    }";
        if (i + 1 < snapshot.sessions.size())
            os << ",";
        os << "\n";
    }
    os << "  ],\n";

    os << "  \"workspaces\": [\n";
    for (size_t i = 0; i < snapshot.workspaces.size(); ++i)
    {
        const auto& ws = snapshot.workspaces[i];
        os << "    {\n";
        os << "      \"id\": " << json::quote(ws.id) << ",\n";
        os << "      \"title\": " << json::quote(ws.title) << ",\n";
        os << "      \"view_mode\": \"" << to_string(ws.view_mode) << "\",\n";
        if (ws.focused_session_id)
            os << "      \"focused_session_id\": " << json::quote(*ws.focused_session_id) << ",\n";
        if (ws.snippet_id)
            os << "      \"snippet_id\": " << json::quote(*ws.snippet_id) << ",\n";
        os << "      \"root\": ";
        if (ws.root)
            write_node(os, *ws.root, 3);
        else
            os << "null";
        os << "\n";
        os << "    }";
        if (i + 1 < snapshot.workspaces.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// ─── JSON reader ─────────────────────────────────────────────────────────────

// Split nodes with one child collapse into that child and empty ones vanish,
// so a decoded tree always satisfies the >= 2 children rule.
static NodePtr read_node(const json::Value& v)
{
    if (!v.is_object())
        return nullptr;

    const std::string type = v.string_or("type", "");
    if (type == "pane")
    {
        std::string sid = v.string_or("session_id", "");
        return sid.empty() ? nullptr : make_pane(sid);
    }
    if (type != "split")
        return nullptr;

    auto direction = split_direction_from_string(v.string_or("direction", ""));
    if (!direction)
        return nullptr;

    const json::Value* children_json = v.find("children");
    if (!children_json || !children_json->is_array())
        return nullptr;

    const json::Value*   sizes_json = v.find("sizes");
    std::vector<NodePtr> children;
    std::vector<float>   sizes;
    bool                 sizes_ok = sizes_json && sizes_json->is_array()
                    && sizes_json->array.size() == children_json->array.size();

    for (size_t i = 0; i < children_json->array.size(); ++i)
    {
        NodePtr child = read_node(children_json->array[i]);
        if (!child)
            continue;
        children.push_back(std::move(child));
        if (sizes_ok)
        {
            const auto& w = sizes_json->array[i];
            sizes.push_back(w.is_number() ? static_cast<float>(w.number) : 0.0f);
        }
    }

    if (children.empty())
        return nullptr;
    if (children.size() == 1)
        return children.front();

    std::string id = v.string_or("id", "");
    if (id.empty())
        return make_split(*direction, std::move(children), std::move(sizes));
    return make_split_with_id(std::move(id), *direction, std::move(children), std::move(sizes));
}

static std::optional<Session> read_session(const json::Value& v)
{
    if (!v.is_object())
        return std::nullopt;

    Session s;
    s.id = v.string_or("id", "");
    if (s.id.empty())
        return std::nullopt;

    s.status          = session_status_from_string(v.string_or("status", "")).value_or(SessionStatus::Disconnected);
    s.workspace_id    = v.optional_string("workspace_id");
    s.startup_command = v.optional_string("startup_command");

    if (const json::Value* p = v.find("params"); p && p->is_object())
    {
        s.params.host_id      = p->string_or("host_id", "");
        s.params.host_label   = p->string_or("host_label", "");
        s.params.hostname     = p->string_or("hostname", "");
        s.params.username     = p->string_or("username", "");
        s.params.protocol     = p->string_or("protocol", "ssh");
        double port           = p->number_or("port", 22.0);
        s.params.port         = (port >= 0.0 && port <= 65535.0) ? static_cast<uint16_t>(port) : 22;
        s.params.mosh_enabled = p->bool_or("mosh_enabled", false);
    }
    return s;
}

static std::optional<Workspace> read_workspace(const json::Value& v)
{
    if (!v.is_object())
        return std::nullopt;

    Workspace ws;
    ws.id = v.string_or("id", "");
    if (ws.id.empty())
        return std::nullopt;

    ws.title              = v.string_or("title", "Workspace");
    ws.view_mode          = view_mode_from_string(v.string_or("view_mode", "split")).value_or(ViewMode::Split);
    ws.focused_session_id = v.optional_string("focused_session_id");
    ws.snippet_id         = v.optional_string("snippet_id");
    if (const json::Value* root = v.find("root"))
        ws.root = read_node(*root);
    return ws;
}

std::optional<Snapshot> deserialize_snapshot(std::string_view text)
{
    std::string error;
    auto        doc = json::parse(text, &error);
    if (!doc)
    {
        TERMDECK_LOG_WARN("snapshot", "parse failed: {}", error);
        return std::nullopt;
    }
    if (!doc->is_object())
    {
        TERMDECK_LOG_WARN("snapshot", "top-level value is not an object");
        return std::nullopt;
    }

    Snapshot snap;
    double   version = doc->number_or("version", 1.0);
    if (version > Snapshot::CURRENT_VERSION || version < 1.0)
    {
        TERMDECK_LOG_WARN("snapshot", "unsupported version {}", version);
        return std::nullopt;
    }
    snap.version    = static_cast<int>(version);
    snap.active_tab = doc->string_or("active_tab", "");

    if (const json::Value* order = doc->find("tab_order"); order && order->is_array())
    {
        for (const auto& id : order->array)
        {
            if (id.is_string())
                snap.tab_order.push_back(id.string);
        }
    }

    if (const json::Value* list = doc->find("sessions"); list && list->is_array())
    {
        for (const auto& item : list->array)
        {
            if (auto s = read_session(item))
                snap.sessions.push_back(std::move(*s));
            else
                TERMDECK_LOG_WARN("snapshot", "skipping malformed session record");
        }
    }

    if (const json::Value* list = doc->find("workspaces"); list && list->is_array())
    {
        for (const auto& item : list->array)
        {
            if (auto ws = read_workspace(item))
                snap.workspaces.push_back(std::move(*ws));
            else
                TERMDECK_LOG_WARN("snapshot", "skipping malformed workspace record");
        }
    }
    return snap;
}

// ─── Repair ──────────────────────────────────────────────────────────────────

size_t repair_snapshot(Snapshot& snapshot)
{
    size_t repairs = 0;

    std::unordered_set<SessionId> known;
    {
        std::vector<Session> kept;
        kept.reserve(snapshot.sessions.size());
        for (auto& s : snapshot.sessions)
        {
            if (s.id.empty() || !known.insert(s.id).second)
            {
                ++repairs;
                continue;
            }
            kept.push_back(std::move(s));
        }
        snapshot.sessions = std::move(kept);
    }

    std::unordered_map<SessionId, WorkspaceId> owner;
    std::unordered_set<WorkspaceId>            seen_workspaces;
    std::vector<Workspace>                     kept_workspaces;

    for (auto& ws : snapshot.workspaces)
    {
        if (ws.id.empty() || !seen_workspaces.insert(ws.id).second || !ws.root)
        {
            TERMDECK_LOG_WARN("snapshot", "dropping workspace '{}': no usable tree", ws.id);
            ++repairs;
            continue;
        }

        // A pane is kept only the first time its session shows up, and only
        // for known sessions.
        std::unordered_set<SessionId> in_this_tree;
        ws.root = prune_panes_if(ws.root,
                                 [&](const SessionId& sid)
                                 {
                                     bool drop = !known.count(sid) || owner.count(sid)
                                                 || !in_this_tree.insert(sid).second;
                                     if (drop)
                                         ++repairs;
                                     return drop;
                                 });

        if (!ws.root)
        {
            TERMDECK_LOG_WARN("snapshot", "dropping workspace '{}': no panes left", ws.id);
            ++repairs;
            continue;
        }

        for (const auto& sid : collect_session_ids(ws.root))
            owner.emplace(sid, ws.id);
        if (ws.focused_session_id && !contains_session(ws.root, *ws.focused_session_id))
        {
            ws.focused_session_id.reset();
            ++repairs;
        }
        kept_workspaces.push_back(std::move(ws));
    }
    snapshot.workspaces = std::move(kept_workspaces);

    for (auto& s : snapshot.sessions)
    {
        auto it = owner.find(s.id);
        std::optional<WorkspaceId> actual;
        if (it != owner.end())
            actual = it->second;
        if (s.workspace_id != actual)
        {
            s.workspace_id = actual;
            ++repairs;
        }
        s.status = SessionStatus::Disconnected;
    }

    if (repairs > 0)
        TERMDECK_LOG_INFO("snapshot", "{} repairs applied", repairs);
    return repairs;
}

}   // namespace termdeck
