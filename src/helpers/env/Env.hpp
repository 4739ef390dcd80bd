#pragma once

#include <optional>
#include <string>

namespace Hyprview::Env {
    // set, non-empty and not "0"
    bool                       envEnabled(const std::string& env);
    std::optional<std::string> envValue(const std::string& env);

    bool                       isTrace();
    bool                       isLogEnabled();
    bool                       keepWorkdir();

    inline constexpr const char* APP_PATH     = "HYPRVIEW_APP_PATH";
    inline constexpr const char* LOG          = "HYPRVIEW_LOG";
    inline constexpr const char* TRACE        = "HYPRVIEW_TRACE";
    inline constexpr const char* KEEP_WORKDIR = "HYPRVIEW_KEEP_WORKDIR";
};
