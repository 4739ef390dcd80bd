#include "config/ConfigManager.hpp"
#include "core/Args.hpp"
#include "helpers/FileWatcher.hpp"

#include "../../src/Hyprview.hpp"
#include "../../src/debug/log/Logger.hpp"

#include <cstdio>
#include <optional>
#include <print>
#include <string>
#include <vector>

using namespace Hyprview;

constexpr std::string_view HELP = R"#(┏ hyprview, show web content in a separate viewer window
┃
┣ html [markup]          → Show inline html.
┣ file [path]            → Show a local html file.
┣ dir [root]             → Show an app directory, entry defaults to index.html.
┣ url [url]              → Show a remote url.
┃
┣ Flags:
┃
┣ --width [px]           → Window width.
┣ --height [px]          → Window height.
┣ --title [title]        → Window title.
┣ --devtools             → Enable the web inspector.
┣ --timeout [s]          → Close the viewer after this many seconds.
┣ --no-decorations       → Borderless window.
┣ --transparent          → Transparent window background.
┣ --always-on-top        → Keep the window above others.
┣ --show-toolbar         → Show the toolbar.
┣ --toolbar-title [text] → Toolbar title text.
┣ --entry [file]         → Entry file for dir.
┣ --watch                → Refresh the viewer when the file changes (file only).
┣ --config [path]        → Use a config file other than ~/.config/hypr/hyprview.conf.
┣ --verbose | -v         → Enable logging.
┣ --help    | -h         → Show this menu.
┗
)#";

static int printStatus(const Protocol::SViewerExitStatus& status) {
    std::println("{}", Protocol::exitReasonToString(status.reason));
    return Protocol::isErrorReason(status.reason) ? 1 : 0;
}

static int watchFile(SViewerOptions options, SP<IAppLocator> locator, const std::string& path) {
    options.wait           = WAIT_NON_BLOCKING;
    options.enableCommands = true;

    auto result = locator ? Hyprview::open(options, locator) : Hyprview::open(options);
    if (!result) {
        std::println(stderr, "{}", result.error().toString());
        return 1;
    }

    auto&              handle = std::get<UP<CViewerHandle>>(*result);

    Cli::CFileWatcher watcher;
    if (auto ret = watcher.watch(path); !ret) {
        std::println(stderr, "{}", ret.error());
        if (auto term = handle->terminate(); !term)
            std::println(stderr, "{}", term.error().toString());
        return 1;
    }

    while (true) {
        auto status = handle->tryWait();
        if (!status) {
            std::println(stderr, "{}", status.error().toString());
            return 1;
        }

        if (status->has_value())
            return printStatus(**status);

        auto changed = watcher.waitForChange(250);
        if (!changed) {
            std::println(stderr, "{}", changed.error());
            return 1;
        }

        if (!*changed)
            continue;

        Log::logger->log(Log::DEBUG, "{} changed, refreshing", path);

        if (auto ret = handle->refresh(Protocol::SLocalFile{.path = path}); !ret)
            std::println(stderr, "refresh failed: {}", ret.error().toString());
    }
}

int main(int argc, char** argv) {
    std::vector<std::string> ARGS;
    for (int i = 1; i < argc; ++i) {
        ARGS.emplace_back(argv[i]);
    }

    if (ARGS.empty()) {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    const auto PARSED = Cli::parseArgs(ARGS);
    if (!PARSED) {
        std::println(stderr, "{}", PARSED.error());
        return 1;
    }

    if (PARSED->help) {
        std::println("{}", HELP);
        return 0;
    }

    if (PARSED->command.size() != 2) {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    if (PARSED->verbose)
        Log::logger->setEnableStdout(true);

    Cli::SCliConfig config;
    const auto      CONFIGPATH = PARSED->configPath ? PARSED->configPath : Cli::CConfigManager::defaultPath();

    if (CONFIGPATH) {
        Cli::CConfigManager configManager(*CONFIGPATH);
        if (auto ret = configManager.load(); !ret) {
            std::println(stderr, "Failed to load config: {}", ret.error());
            return 1;
        }
        config = configManager.values();
    }

    const auto OPTIONS = Cli::buildOptions(*PARSED, config);
    if (!OPTIONS) {
        std::println(stderr, "{}", OPTIONS.error());
        return 1;
    }

    SP<IAppLocator> locator;
    if (!config.viewerPath.empty())
        locator = makeShared<CStaticAppLocator>(config.viewerPath);

    if (PARSED->watch)
        return watchFile(*OPTIONS, locator, PARSED->command[1]);

    auto result = locator ? Hyprview::open(*OPTIONS, locator) : Hyprview::open(*OPTIONS);
    if (!result) {
        std::println(stderr, "{}", result.error().toString());
        return 1;
    }

    return printStatus(std::get<Protocol::SViewerExitStatus>(*result));
}
