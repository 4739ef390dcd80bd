#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include <hyprutils/os/FileDescriptor.hpp>

namespace Hyprview::Cli {
    // Watches a single file through its parent directory, so editors that
    // replace the file on save are still caught.
    class CFileWatcher {
      public:
        CFileWatcher() = default;
        ~CFileWatcher();

        CFileWatcher(const CFileWatcher&)            = delete;
        CFileWatcher& operator=(const CFileWatcher&) = delete;

        std::expected<void, std::string> watch(const std::filesystem::path& file);

        // Wait for events with timeout (returns true if the watched file changed)
        std::expected<bool, std::string> waitForChange(int timeoutMs);

      private:
        Hyprutils::OS::CFileDescriptor m_fd;
        int                            m_wd = -1;
        std::string                    m_filename;
    };
};
