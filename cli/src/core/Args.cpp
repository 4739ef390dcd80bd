#include "Args.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <limits>

#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::Memory;

using namespace Hyprview;
using namespace Hyprview::Cli;

std::optional<uint64_t> Cli::parseNumber(const std::string& str, uint64_t max) {
    uint64_t   value = 0;
    const auto END   = str.data() + str.size();
    const auto RES   = std::from_chars(str.data(), END, value);
    if (RES.ec != std::errc{} || RES.ptr != END || value > max)
        return std::nullopt;
    return value;
}

std::expected<SCliArgs, std::string> Cli::parseArgs(const std::vector<std::string>& args) {
    SCliArgs parsed;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& ARG = args[i];

        // flags taking a value
        if (ARG == "--width" || ARG == "--height" || ARG == "--timeout" || ARG == "--title" || ARG == "--toolbar-title" || ARG == "--entry" || ARG == "--config") {
            if (i + 1 >= args.size())
                return std::unexpected(std::format("Missing argument for {}", ARG));

            const auto& VALUE = args[++i];

            if (ARG == "--title")
                parsed.title = VALUE;
            else if (ARG == "--toolbar-title")
                parsed.toolbarTitle = VALUE;
            else if (ARG == "--entry")
                parsed.entry = VALUE;
            else if (ARG == "--config")
                parsed.configPath = VALUE;
            else {
                constexpr uint64_t MAX = std::numeric_limits<uint32_t>::max();

                const auto         NUM = parseNumber(VALUE, MAX);
                if (!NUM)
                    return std::unexpected(std::format("{} expects a number between 0 and {}, got {}", ARG, MAX, VALUE));

                if (ARG == "--width")
                    parsed.width = sc<uint32_t>(*NUM);
                else if (ARG == "--height")
                    parsed.height = sc<uint32_t>(*NUM);
                else
                    parsed.timeout = sc<uint32_t>(*NUM);
            }
        } else if (ARG == "--help" || ARG == "-h")
            parsed.help = true;
        else if (ARG == "--verbose" || ARG == "-v")
            parsed.verbose = true;
        else if (ARG == "--watch")
            parsed.watch = true;
        else if (ARG == "--devtools")
            parsed.devtools = true;
        else if (ARG == "--no-decorations")
            parsed.noDecorations = true;
        else if (ARG == "--transparent")
            parsed.transparent = true;
        else if (ARG == "--always-on-top")
            parsed.alwaysOnTop = true;
        else if (ARG == "--show-toolbar")
            parsed.showToolbar = true;
        else if (ARG.starts_with("--"))
            return std::unexpected(std::format("Unrecognized option {}", ARG));
        else
            parsed.command.push_back(ARG);
    }

    return parsed;
}

std::expected<SViewerOptions, std::string> Cli::buildOptions(const SCliArgs& args, const SCliConfig& config) {
    if (args.command.size() != 2)
        return std::unexpected("Expected a content type and one argument");

    SViewerOptions options;
    const auto&    TYPE = args.command[0];
    const auto&    ARG  = args.command[1];

    if (TYPE == "html")
        options = SViewerOptions::inlineHtml(ARG);
    else if (TYPE == "file")
        options = SViewerOptions::localFile(ARG);
    else if (TYPE == "dir")
        options = SViewerOptions::appDir(ARG, args.entry.value_or(""));
    else if (TYPE == "url")
        options = SViewerOptions::remoteUrl(ARG);
    else
        return std::unexpected(std::format("Unknown content type {}, expected html, file, dir or url", TYPE));

    if (args.watch && TYPE != "file")
        return std::unexpected("--watch only works with file");

    CViewerOptionsBuilder builder(options);
    builder.title(args.title.value_or(config.title))
        .size(args.width.value_or(config.width), args.height.value_or(config.height))
        .transparent(args.transparent || config.transparent)
        .alwaysOnTop(args.alwaysOnTop || config.alwaysOnTop)
        .devtools(args.devtools || config.devtools)
        .allowNavigation(config.allowNavigation);

    if (args.noDecorations || !config.decorations)
        builder.noDecorations();

    if (const uint64_t SECS = args.timeout ? *args.timeout : config.timeout; SECS > 0)
        builder.timeout(std::chrono::seconds{SECS});

    if (args.showToolbar || args.toolbarTitle)
        builder.toolbar(Protocol::SToolbarOptions{.show = true, .titleText = args.toolbarTitle});

    return builder.build();
}
