#include "FsUtils.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

#include <hyprutils/os/File.hpp>

using namespace Hyprview;

std::expected<std::string, std::string> FsUtils::readFileAsString(const std::filesystem::path& path) {
    return Hyprutils::File::readFileAsString(path.string());
}

std::expected<void, std::string> FsUtils::writeToFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream of(path, std::ios::trunc | std::ios::binary);
    if (!of.good())
        return std::unexpected(std::format("couldn't open {} for writing: {}", path.string(), strerror(errno)));

    of << content;
    of.close();

    if (of.fail())
        return std::unexpected(std::format("couldn't write {}: {}", path.string(), strerror(errno)));

    return {};
}

std::expected<void, std::string> FsUtils::writeAtomically(const std::filesystem::path& path, const std::string& content, const std::string& tempName) {
    const auto TEMP = path.parent_path() / tempName;

    if (auto ret = writeToFile(TEMP, content); !ret)
        return ret;

    std::error_code ec;
    std::filesystem::rename(TEMP, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(TEMP, ignored);
        return std::unexpected(std::format("couldn't move {} onto {}: {}", TEMP.string(), path.string(), ec.message()));
    }

    return {};
}

bool FsUtils::isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec)
        return false;

    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return false;

    auto perms = std::filesystem::status(path, ec).permissions();
    if (ec)
        return false;

    return std::filesystem::perms::none != (perms & (std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec));
}
