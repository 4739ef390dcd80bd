#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace Hyprview::FsUtils {
    // error carries the underlying cause
    std::expected<std::string, std::string> readFileAsString(const std::filesystem::path& path);

    // overwrites the file if exists
    std::expected<void, std::string>        writeToFile(const std::filesystem::path& path, const std::string& content);

    // writes a sibling temp file and renames it over path, readers never see a partial file
    std::expected<void, std::string>        writeAtomically(const std::filesystem::path& path, const std::string& content, const std::string& tempName);

    bool                                    isExecutableFile(const std::filesystem::path& path);
};
