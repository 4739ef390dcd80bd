#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "../config/ConfigManager.hpp"
#include "../../../src/core/Options.hpp"

namespace Hyprview::Cli {
    struct SCliArgs {
        // content type and its argument
        std::vector<std::string>   command;
        bool                       help = false, verbose = false, watch = false, devtools = false, noDecorations = false, transparent = false, alwaysOnTop = false,
             showToolbar = false;
        std::optional<uint32_t>    width, height, timeout;
        std::optional<std::string> title, toolbarTitle, entry, configPath;
    };

    // args without argv[0]
    std::expected<SCliArgs, std::string>       parseArgs(const std::vector<std::string>& args);

    // decimal only, rejects anything that doesn't fit in max
    std::optional<uint64_t>                    parseNumber(const std::string& str, uint64_t max);

    // the config fills in, flags win
    std::expected<SViewerOptions, std::string> buildOptions(const SCliArgs& args, const SCliConfig& config);
};
