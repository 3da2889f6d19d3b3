#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <termdeck/logger.hpp>

#include "core/config.hpp"

using namespace termdeck;

TEST(EngineConfig, Defaults)
{
    EngineConfig cfg;
    EXPECT_FLOAT_EQ(cfg.min_pane_px, 120.0f);
    EXPECT_FLOAT_EQ(cfg.resizer_thickness, 4.0f);
    EXPECT_EQ(cfg.home_tab_id, "vault");
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(EngineConfig, SerializeRoundTrip)
{
    EngineConfig cfg;
    cfg.min_pane_px             = 80.0f;
    cfg.focus_edge_epsilon      = 0.01f;
    cfg.default_workspace_title = "Group";
    cfg.log_level               = "debug";

    EngineConfig loaded;
    ASSERT_TRUE(loaded.deserialize(cfg.serialize()));
    EXPECT_FLOAT_EQ(loaded.min_pane_px, 80.0f);
    EXPECT_FLOAT_EQ(loaded.focus_edge_epsilon, 0.01f);
    EXPECT_EQ(loaded.default_workspace_title, "Group");
    EXPECT_EQ(loaded.log_level, "debug");
}

TEST(EngineConfig, MissingKeysKeepDefaults)
{
    EngineConfig cfg;
    ASSERT_TRUE(cfg.deserialize(R"({"resizer_thickness": 8})"));
    EXPECT_FLOAT_EQ(cfg.resizer_thickness, 8.0f);
    EXPECT_FLOAT_EQ(cfg.min_pane_px, 120.0f);
    EXPECT_EQ(cfg.local_host_label, "Local Terminal");
}

TEST(EngineConfig, InvalidValuesIgnored)
{
    EngineConfig cfg;
    ASSERT_TRUE(cfg.deserialize(
        R"({"min_pane_px": -5, "resizer_thickness": "wide", "home_tab_id": "", "log_level": "loud"})"));
    EXPECT_FLOAT_EQ(cfg.min_pane_px, 120.0f);
    EXPECT_FLOAT_EQ(cfg.resizer_thickness, 4.0f);
    EXPECT_EQ(cfg.home_tab_id, "vault");
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(EngineConfig, RejectsBadDocuments)
{
    EngineConfig cfg;
    EXPECT_FALSE(cfg.deserialize(""));
    EXPECT_FALSE(cfg.deserialize("{"));
    EXPECT_FALSE(cfg.deserialize("[]"));
}

TEST(EngineConfig, SaveAndLoad)
{
    auto dir  = std::filesystem::temp_directory_path() / "termdeck_config_test";
    auto path = (dir / "nested" / "engine.json").string();
    std::filesystem::remove_all(dir);

    EngineConfig cfg;
    cfg.home_tab_id = "home";
    ASSERT_TRUE(cfg.save(path));

    EngineConfig loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.home_tab_id, "home");

    std::filesystem::remove_all(dir);
    EXPECT_FALSE(loaded.load(path));
}

TEST(EngineConfig, DefaultPathUsesXdg)
{
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(EngineConfig::default_path(), "/tmp/xdg/termdeck/engine.json");

    if (old)
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}

TEST(EngineConfig, ConvertsToOptions)
{
    EngineConfig cfg;
    cfg.min_pane_px      = 64.0f;
    cfg.local_host_label = "This machine";

    RegistryOptions opts = cfg.to_registry_options();
    EXPECT_FLOAT_EQ(opts.layout.min_pane_px, 64.0f);
    EXPECT_EQ(opts.local_host_label, "This machine");
    EXPECT_EQ(opts.home_tab_id, "vault");
}

TEST(EngineConfig, AppliesLogLevel)
{
    auto&    logger   = Logger::instance();
    LogLevel previous = logger.get_level();

    EngineConfig cfg;
    cfg.log_level = "warning";
    EXPECT_TRUE(cfg.apply_log_level());
    EXPECT_EQ(logger.get_level(), LogLevel::Warning);

    cfg.log_level = "chatty";
    EXPECT_FALSE(cfg.apply_log_level());
    EXPECT_EQ(logger.get_level(), LogLevel::Warning);

    logger.set_level(previous);
}
