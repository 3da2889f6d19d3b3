#pragma once

#include <string>
#include <string_view>
#include <termdeck/fwd.hpp>

#include "layout_engine.hpp"
#include "session_registry.hpp"

namespace termdeck
{

// Tunables for the engine, persisted as JSON:
//
//   {
//     "version": 1,
//     "min_pane_px": 120,
//     "resizer_thickness": 4,
//     "focus_edge_epsilon": 0.001,
//     "home_tab_id": "vault",
//     "default_workspace_title": "Workspace",
//     "local_host_label": "Local Terminal",
//     "log_level": "info"
//   }
//
// Missing keys keep their defaults; out-of-range values are ignored with a
// warning.
struct EngineConfig
{
    float       min_pane_px             = 120.0f;
    float       resizer_thickness       = 4.0f;
    float       focus_edge_epsilon      = 0.001f;
    std::string home_tab_id             = DEFAULT_HOME_TAB_ID;
    std::string default_workspace_title = "Workspace";
    std::string local_host_label        = "Local Terminal";
    std::string log_level               = "info";

    std::string serialize() const;
    bool        deserialize(std::string_view text);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/termdeck/engine.json, else ~/.config/termdeck/engine.json.
    static std::string default_path();

    LayoutOptions   to_layout_options() const;
    RegistryOptions to_registry_options() const;

    // Sets the global logger level from log_level. False for unknown names.
    bool apply_log_level() const;
};

}   // namespace termdeck
