#include "config.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <termdeck/logger.hpp>

#include "json.hpp"

namespace termdeck
{

std::string EngineConfig::serialize() const
{
    std::ostringstream os;
    os.precision(9);
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"min_pane_px\": " << min_pane_px << ",\n";
    os << "  \"resizer_thickness\": " << resizer_thickness << ",\n";
    os << "  \"focus_edge_epsilon\": " << focus_edge_epsilon << ",\n";
    os << "  \"home_tab_id\": " << json::quote(home_tab_id) << ",\n";
    os << "  \"default_workspace_title\": " << json::quote(default_workspace_title) << ",\n";
    os << "  \"local_host_label\": " << json::quote(local_host_label) << ",\n";
    os << "  \"log_level\": " << json::quote(log_level) << "\n";
    os << "}\n";
    return os.str();
}

static void read_positive(const json::Value& doc, const char* key, float& out)
{
    const json::Value* v = doc.find(key);
    if (!v)
        return;
    if (!v->is_number() || !std::isfinite(v->number) || v->number <= 0.0)
    {
        TERMDECK_LOG_WARN("config", "ignoring invalid value for '{}'", key);
        return;
    }
    out = static_cast<float>(v->number);
}

static void read_non_empty(const json::Value& doc, const char* key, std::string& out)
{
    const json::Value* v = doc.find(key);
    if (!v)
        return;
    if (!v->is_string() || v->string.empty())
    {
        TERMDECK_LOG_WARN("config", "ignoring invalid value for '{}'", key);
        return;
    }
    out = v->string;
}

bool EngineConfig::deserialize(std::string_view text)
{
    if (text.empty())
        return false;

    std::string error;
    auto        doc = json::parse(text, &error);
    if (!doc || !doc->is_object())
    {
        TERMDECK_LOG_WARN("config", "cannot parse engine config: {}", error.empty() ? "not an object" : error);
        return false;
    }

    read_positive(*doc, "min_pane_px", min_pane_px);
    read_positive(*doc, "resizer_thickness", resizer_thickness);
    read_positive(*doc, "focus_edge_epsilon", focus_edge_epsilon);
    read_non_empty(*doc, "home_tab_id", home_tab_id);
    read_non_empty(*doc, "default_workspace_title", default_workspace_title);
    read_non_empty(*doc, "local_host_label", local_host_label);

    std::string level = log_level;
    read_non_empty(*doc, "log_level", level);
    LogLevel parsed;
    if (Logger::parse_level(level, parsed))
        log_level = level;
    else
        TERMDECK_LOG_WARN("config", "unknown log level '{}'", level);
    return true;
}

bool EngineConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path);
    if (!f.is_open())
    {
        TERMDECK_LOG_WARN("config", "cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool EngineConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(text);
}

std::string EngineConfig::default_path()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return (std::filesystem::path(xdg) / "termdeck" / "engine.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "engine.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "termdeck";
    return (dir / "engine.json").string();
}

LayoutOptions EngineConfig::to_layout_options() const
{
    LayoutOptions opts;
    opts.min_pane_px        = min_pane_px;
    opts.resizer_thickness  = resizer_thickness;
    opts.focus_edge_epsilon = focus_edge_epsilon;
    return opts;
}

RegistryOptions EngineConfig::to_registry_options() const
{
    RegistryOptions opts;
    opts.home_tab_id             = home_tab_id;
    opts.default_workspace_title = default_workspace_title;
    opts.local_host_label        = local_host_label;
    opts.layout                  = to_layout_options();
    return opts;
}

bool EngineConfig::apply_log_level() const
{
    LogLevel level;
    if (!Logger::parse_level(log_level, level))
        return false;
    Logger::instance().set_level(level);
    return true;
}

}   // namespace termdeck
