#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "Error.hpp"
#include "../helpers/memory/Memory.hpp"

namespace Hyprview {
    // Owns a per-request directory and removes it when it goes out of scope,
    // unless cleanup was disabled. Exactly one owner at a time: move the UP around.
    class CWorkingArea {
      public:
        explicit CWorkingArea(const std::filesystem::path& path);
        ~CWorkingArea();

        CWorkingArea(const CWorkingArea&)            = delete;
        CWorkingArea(CWorkingArea&&)                 = delete;
        CWorkingArea& operator=(const CWorkingArea&) = delete;

        // creates $TMPDIR/hyprview_<id> with 0700
        static std::expected<UP<CWorkingArea>, SViewerError> create(const std::string& id);
        static std::filesystem::path                         pathForId(const std::string& id);

        void                                                 disableCleanup();
        bool                                                 cleanupEnabled() const;

        const std::filesystem::path&                         path() const;
        std::filesystem::path                                requestPath() const;
        std::filesystem::path                                resultPath() const;
        std::filesystem::path                                commandPath() const;
        std::filesystem::path                                responsePath() const;

      private:
        std::filesystem::path m_path;
        bool                  m_cleanup = true;
    };
};
