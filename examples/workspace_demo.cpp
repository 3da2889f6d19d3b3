// Walks through the session/workspace lifecycle against a backend that only
// logs what it is asked to do.

#include <iostream>
#include <termdeck/logger.hpp>
#include <termdeck/terminal_backend.hpp>
#include <unordered_map>

#include "core/active_tab_store.hpp"
#include "core/config.hpp"
#include "core/deferred_queue.hpp"
#include "core/session_connector.hpp"
#include "core/session_registry.hpp"
#include "core/snapshot.hpp"
#include "ui/session_drag_controller.hpp"
#include "ui/split_resize_controller.hpp"

using namespace termdeck;

class LoggingBackend : public TerminalBackend
{
   public:
    SessionHandle connect(ConnectionKind kind, const ConnectionParams& params) override
    {
        SessionHandle h = next_++;
        TERMDECK_LOG_INFO("demo", "connect #{} {} {}@{}", h, to_string(kind), params.username, params.hostname);
        return h;
    }

    void close(SessionHandle handle) override { TERMDECK_LOG_INFO("demo", "close #{}", handle); }

    void on_status_change(SessionHandle handle, StatusCallback cb) override { status_[handle] = std::move(cb); }

    void on_exit(SessionHandle, ExitCallback) override {}

    bool send_input(SessionHandle handle, std::string_view data) override
    {
        TERMDECK_LOG_INFO("demo", "input #{}: {}", handle, std::string(data.substr(0, data.size() - 1)));
        return true;
    }

    // Pretends every connection came up.
    void connect_all()
    {
        for (auto& [handle, cb] : status_)
        {
            if (cb)
                cb(SessionStatus::Connected);
        }
    }

   private:
    SessionHandle                                     next_ = 1;
    std::unordered_map<SessionHandle, StatusCallback> status_;
};

static ConnectionParams host(const std::string& name)
{
    ConnectionParams p;
    p.host_id    = "host-" + name;
    p.host_label = name;
    p.hostname   = name + ".internal";
    p.username   = "ops";
    return p;
}

static void print_tabs(const SessionRegistry& registry)
{
    std::cout << "tabs:";
    for (const auto& tab : registry.ordered_tabs())
        std::cout << " " << tab << (tab == registry.active_tab() ? "*" : "");
    std::cout << "\n";
    for (const auto& ws : registry.workspaces())
        std::cout << "  " << ws.id << " \"" << ws.title << "\" " << describe(ws.root) << "\n";
}

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    EngineConfig config;
    if (!config.load(EngineConfig::default_path()))
        TERMDECK_LOG_INFO("demo", "no engine config at {}, using defaults", EngineConfig::default_path());
    if (!config.apply_log_level())
        TERMDECK_LOG_WARN("demo", "unknown log level {}", config.log_level);

    DeferredQueue    queue;
    ActiveTabStore   active(queue, config.home_tab_id);
    SessionRegistry  registry(active, config.to_registry_options());
    LoggingBackend   backend;
    SessionConnector connector(registry, backend);

    auto sub = active.subscribe([](const TabId& tab) { std::cout << "active tab -> " << tab << "\n"; });

    // Two standalone sessions, merged by dragging one onto the other.
    SessionId web = registry.connect_to_host(host("web"));
    SessionId db  = registry.connect_to_host(host("db"));
    registry.select_tab(web);
    queue.drain();

    SessionDragController drag(registry);
    Size                  area{1200.0f, 800.0f};
    drag.begin(db);
    drag.drag_over(area, 1100.0f, 400.0f);
    drag.drop(area, 1100.0f, 400.0f);
    queue.drain();
    print_tabs(registry);

    // Split the db pane downwards and widen the left column.
    registry.split_session(db, SplitDirection::Horizontal);
    WorkspaceId           ws = registry.active_tab();
    SplitResizeController resize(registry, config.min_pane_px);
    auto                  handles = compute_resizers(registry.workspace(ws)->root, area, config.to_layout_options());
    if (auto h = SplitResizeController::hit_test(handles, 600.0f, 100.0f))
    {
        resize.begin(ws, *h, 600.0f, 100.0f);
        resize.update(720.0f, 100.0f);
        resize.end();
    }
    registry.move_focus(ws, FocusDirection::Right, area);
    print_tabs(registry);

    // Fan a command out to three hosts.
    registry.run_on_hosts(Snippet{"snippet-uptime", "Uptime", "uptime"}, {host("a"), host("b"), host("c")});
    backend.connect_all();
    queue.drain();
    print_tabs(registry);

    // Persist, close everything, restore.
    std::string saved = serialize_snapshot(registry.snapshot());
    registry.close_workspace(ws);
    queue.drain();
    print_tabs(registry);

    if (auto snap = deserialize_snapshot(saved))
    {
        registry.restore(*snap);
        for (const auto& s : registry.sessions())
            connector.reconnect(s.id);
    }
    queue.drain();
    print_tabs(registry);

    std::string error;
    if (!registry.check_invariants(&error))
    {
        TERMDECK_LOG_ERROR("demo", "invariant violated: {}", error);
        return 1;
    }
    return 0;
}
