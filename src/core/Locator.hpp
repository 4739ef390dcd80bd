#pragma once

#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>

#include "Error.hpp"

namespace Hyprview {
    class IAppLocator {
      public:
        virtual ~IAppLocator() = default;

        // must return an executable path or VIEWER_ERROR_BINARY_NOT_FOUND
        virtual std::expected<std::filesystem::path, SViewerError> locateAppBinary() = 0;
    };

    // $HYPRVIEW_APP_PATH, then a memoized lookup next to our own executable and in $PATH
    class CDefaultAppLocator : public IAppLocator {
      public:
        std::expected<std::filesystem::path, SViewerError> locateAppBinary() override;

        // drops the process-wide cache
        static void clearCache();

      private:
        static std::optional<std::filesystem::path> discover();

        static std::optional<std::filesystem::path> fromEnv();
        static std::optional<std::filesystem::path> nextToSelf();
        static std::optional<std::filesystem::path> inPath();

        struct SCache {
            std::mutex                           mutex;
            std::optional<std::filesystem::path> path;
        };

        static SCache& cache();
    };

    class CStaticAppLocator : public IAppLocator {
      public:
        explicit CStaticAppLocator(const std::filesystem::path& path);

        // still checks that the file is there, a typo in a config should be a clear error
        std::expected<std::filesystem::path, SViewerError> locateAppBinary() override;

      private:
        std::filesystem::path m_path;
    };
};
