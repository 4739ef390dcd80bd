#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

#include <hyprlang.hpp>

#include "../../../src/helpers/memory/Memory.hpp"

namespace Hyprview::Cli {
    struct SCliConfig {
        std::string viewerPath;
        // 0 means the viewer never closes on its own
        uint64_t    timeout         = 0;
        uint32_t    width           = 1024;
        uint32_t    height          = 768;
        std::string title           = "Hyprview";
        bool        decorations     = true;
        bool        transparent     = false;
        bool        alwaysOnTop     = false;
        bool        devtools        = false;
        bool        allowNavigation = false;
    };

    class CConfigManager {
      public:
        explicit CConfigManager(const std::string& path);

        // a missing file is fine, a broken one is not
        std::expected<void, std::string> load();
        SCliConfig                        values() const;
        const std::string&                path() const;

        // $XDG_CONFIG_HOME/hypr/hyprview.conf or ~/.config/hypr/hyprview.conf
        static std::optional<std::string> defaultPath();

      private:
        Hyprlang::INT    getInt(const char* name) const;
        std::string      getString(const char* name) const;

        std::string           m_path;
        UP<Hyprlang::CConfig> m_config;
    };
};
