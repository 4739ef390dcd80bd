#include <gtest/gtest.h>
#include <config/ConfigManager.hpp>
#include <core/Args.hpp>
#include <core/WorkingArea.hpp>
#include <helpers/Uuid.hpp>
#include <helpers/fs/FsUtils.hpp>

#include <limits>

using namespace Hyprview;
using namespace Hyprview::Cli;

class CliConfig : public ::testing::Test {
  protected:
    void SetUp() override {
        auto a = CWorkingArea::create(Uuid::generate());
        ASSERT_TRUE(a.has_value()) << a.error().toString();
        m_area = std::move(*a);
    }

    std::string writeConfig(const std::string& content) {
        const auto PATH = m_area->path() / "hyprview.conf";
        EXPECT_TRUE(FsUtils::writeToFile(PATH, content).has_value());
        return PATH.string();
    }

    UP<CWorkingArea> m_area;
};

TEST_F(CliConfig, ReadsEveryKey) {
    CConfigManager manager(writeConfig(R"#(
general {
    viewer_path = /opt/hyprview/hyprview-viewer
    timeout = 15
}

window {
    width = 640
    height = 480
    title = Notes
    decorations = 0
    transparent = 1
    always_on_top = 1
}

behaviour {
    devtools = 1
    allow_navigation = 1
}
)#"));

    ASSERT_TRUE(manager.load().has_value());

    const auto CONFIG = manager.values();
    EXPECT_EQ(CONFIG.viewerPath, "/opt/hyprview/hyprview-viewer");
    EXPECT_EQ(CONFIG.timeout, 15u);
    EXPECT_EQ(CONFIG.width, 640u);
    EXPECT_EQ(CONFIG.height, 480u);
    EXPECT_EQ(CONFIG.title, "Notes");
    EXPECT_FALSE(CONFIG.decorations);
    EXPECT_TRUE(CONFIG.transparent);
    EXPECT_TRUE(CONFIG.alwaysOnTop);
    EXPECT_TRUE(CONFIG.devtools);
    EXPECT_TRUE(CONFIG.allowNavigation);
}

TEST_F(CliConfig, MissingFileGivesDefaults) {
    CConfigManager manager((m_area->path() / "nope.conf").string());
    ASSERT_TRUE(manager.load().has_value());

    const auto CONFIG = manager.values();
    const auto DEFAULTS = SCliConfig{};
    EXPECT_EQ(CONFIG.viewerPath, DEFAULTS.viewerPath);
    EXPECT_EQ(CONFIG.timeout, DEFAULTS.timeout);
    EXPECT_EQ(CONFIG.width, DEFAULTS.width);
    EXPECT_EQ(CONFIG.height, DEFAULTS.height);
    EXPECT_EQ(CONFIG.title, DEFAULTS.title);
    EXPECT_TRUE(CONFIG.decorations);
}

TEST_F(CliConfig, UnknownKeyIsAnError) {
    CConfigManager manager(writeConfig("window {\n    depth = 3\n}\n"));

    const auto RET = manager.load();
    ASSERT_FALSE(RET.has_value());
    EXPECT_NE(RET.error().find(manager.path()), std::string::npos);
}

TEST_F(CliConfig, OversizedWindowIsClamped) {
    CConfigManager manager(writeConfig("window {\n    width = 99999999999\n    height = -5\n}\n"));
    ASSERT_TRUE(manager.load().has_value());

    const auto CONFIG = manager.values();
    EXPECT_EQ(CONFIG.width, std::numeric_limits<uint32_t>::max());
    EXPECT_EQ(CONFIG.height, 1u);
}

TEST_F(CliConfig, FlagsOverrideConfig) {
    CConfigManager manager(writeConfig(R"#(
general {
    timeout = 15
}

window {
    width = 640
    height = 480
    title = Notes
}
)#"));
    ASSERT_TRUE(manager.load().has_value());

    const auto ARGS = parseArgs({"file", "/tmp/page.html", "--width", "1280", "--title", "Override", "--timeout", "3", "--devtools"});
    ASSERT_TRUE(ARGS.has_value()) << ARGS.error();

    const auto OPTIONS = buildOptions(*ARGS, manager.values());
    ASSERT_TRUE(OPTIONS.has_value()) << OPTIONS.error();

    EXPECT_EQ(OPTIONS->window.width, 1280u);
    // not on the command line, so the file decides
    EXPECT_EQ(OPTIONS->window.height, 480u);
    EXPECT_EQ(OPTIONS->window.title, "Override");
    EXPECT_EQ(OPTIONS->environment.timeoutSeconds, 3u);
    EXPECT_TRUE(OPTIONS->behaviour.enableDevtools);
    EXPECT_EQ(std::get<Protocol::SLocalFile>(OPTIONS->content).path, "/tmp/page.html");
}

TEST_F(CliConfig, ConfigFillsInWhenNoFlags) {
    CConfigManager manager(writeConfig("general {\n    timeout = 15\n}\nwindow {\n    decorations = 0\n}\n"));
    ASSERT_TRUE(manager.load().has_value());

    const auto ARGS = parseArgs({"html", "<p/>"});
    ASSERT_TRUE(ARGS.has_value()) << ARGS.error();

    const auto OPTIONS = buildOptions(*ARGS, manager.values());
    ASSERT_TRUE(OPTIONS.has_value()) << OPTIONS.error();

    EXPECT_EQ(OPTIONS->environment.timeoutSeconds, 15u);
    EXPECT_FALSE(OPTIONS->window.decorations);
    EXPECT_EQ(OPTIONS->window.width, 1024u);
}
