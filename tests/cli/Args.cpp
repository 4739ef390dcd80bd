#include <gtest/gtest.h>
#include <core/Args.hpp>

#include <limits>

using namespace Hyprview;
using namespace Hyprview::Cli;

TEST(CliArgs, ParsesFlagsAndCommand) {
    const auto ARGS = parseArgs({"dir", "/srv/app", "--entry", "main.html", "--no-decorations", "--show-toolbar", "--toolbar-title", "App", "-v"});
    ASSERT_TRUE(ARGS.has_value()) << ARGS.error();

    EXPECT_EQ(ARGS->command, (std::vector<std::string>{"dir", "/srv/app"}));
    EXPECT_EQ(ARGS->entry, "main.html");
    EXPECT_TRUE(ARGS->noDecorations);
    EXPECT_TRUE(ARGS->showToolbar);
    EXPECT_TRUE(ARGS->verbose);

    const auto OPTIONS = buildOptions(*ARGS, SCliConfig{});
    ASSERT_TRUE(OPTIONS.has_value()) << OPTIONS.error();
    EXPECT_EQ(std::get<Protocol::SAppDir>(OPTIONS->content).entry, "main.html");
    EXPECT_FALSE(OPTIONS->window.decorations);
    EXPECT_TRUE(OPTIONS->window.toolbar.show);
    EXPECT_EQ(OPTIONS->window.toolbar.titleText, "App");
}

TEST(CliArgs, NumbersMustFitInThirtyTwoBits) {
    EXPECT_EQ(parseNumber("4294967295", std::numeric_limits<uint32_t>::max()), 4294967295u);
    EXPECT_FALSE(parseNumber("4294967296", std::numeric_limits<uint32_t>::max()).has_value());
    EXPECT_FALSE(parseNumber("-1", std::numeric_limits<uint32_t>::max()).has_value());
    EXPECT_FALSE(parseNumber("12px", std::numeric_limits<uint32_t>::max()).has_value());

    const auto WIDE = parseArgs({"html", "<p/>", "--width", "4294967297"});
    ASSERT_FALSE(WIDE.has_value());
    EXPECT_NE(WIDE.error().find("--width"), std::string::npos);

    EXPECT_FALSE(parseArgs({"html", "<p/>", "--timeout", "99999999999999999999"}).has_value());
}

TEST(CliArgs, RejectsBadInput) {
    EXPECT_FALSE(parseArgs({"html", "<p/>", "--frobnicate"}).has_value());
    EXPECT_FALSE(parseArgs({"html", "<p/>", "--title"}).has_value());

    const auto UNKNOWN = parseArgs({"pdf", "/tmp/a.pdf"});
    ASSERT_TRUE(UNKNOWN.has_value());
    EXPECT_FALSE(buildOptions(*UNKNOWN, SCliConfig{}).has_value());

    const auto WATCHURL = parseArgs({"url", "https://example.org", "--watch"});
    ASSERT_TRUE(WATCHURL.has_value());
    EXPECT_FALSE(buildOptions(*WATCHURL, SCliConfig{}).has_value());
}
