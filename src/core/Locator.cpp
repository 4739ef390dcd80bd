#include "Locator.hpp"
#include "../protocol/Protocol.hpp"
#include "../helpers/env/Env.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <hyprutils/string/VarList.hpp>
using namespace Hyprutils::String;

using namespace Hyprview;

static SViewerError notFound() {
    return SViewerError{
        .type    = VIEWER_ERROR_BINARY_NOT_FOUND,
        .message = std::format("Could not find the {} binary.\nInstall it next to this program or in your $PATH, or point ${} at it", Protocol::VIEWER_BINARY_NAME, Env::APP_PATH),
    };
}

CDefaultAppLocator::SCache& CDefaultAppLocator::cache() {
    static SCache c;
    return c;
}

void CDefaultAppLocator::clearCache() {
    auto&            c = cache();
    std::lock_guard lg(c.mutex);
    c.path.reset();
}

std::optional<std::filesystem::path> CDefaultAppLocator::fromEnv() {
    const auto ENV = Env::envValue(Env::APP_PATH);
    if (!ENV)
        return std::nullopt;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*ENV, ec) || ec) {
        Log::logger->log(Log::WARN, "${} is set to {}, but that is not a file. Ignoring it.", Env::APP_PATH, *ENV);
        return std::nullopt;
    }

    return std::filesystem::path{*ENV};
}

std::optional<std::filesystem::path> CDefaultAppLocator::nextToSelf() {
    std::error_code ec;
    const auto      SELF = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
        return std::nullopt;

    const auto CANDIDATE = SELF.parent_path() / Protocol::VIEWER_BINARY_NAME;
    if (!FsUtils::isExecutableFile(CANDIDATE))
        return std::nullopt;

    return CANDIDATE;
}

std::optional<std::filesystem::path> CDefaultAppLocator::inPath() {
    const auto PATHENV = Env::envValue("PATH");
    if (!PATHENV)
        return std::nullopt;

    CVarList paths(*PATHENV, 0, ':', true);

    for (const auto& PATH : paths) {
        if (PATH.empty())
            continue;

        const auto CANDIDATE = std::filesystem::path(PATH) / Protocol::VIEWER_BINARY_NAME;
        if (FsUtils::isExecutableFile(CANDIDATE))
            return CANDIDATE;
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> CDefaultAppLocator::discover() {
    if (auto path = nextToSelf(); path)
        return path;

    return inPath();
}

std::expected<std::filesystem::path, SViewerError> CDefaultAppLocator::locateAppBinary() {
    // the override wins and is never cached, so tests can flip it freely
    if (const auto ENV = fromEnv(); ENV) {
        Log::logger->log(Log::TRACE, "CDefaultAppLocator: using ${}: {}", Env::APP_PATH, ENV->string());
        return *ENV;
    }

    auto&            c = cache();
    std::lock_guard lg(c.mutex);

    if (c.path) {
        std::error_code ec;
        if (std::filesystem::exists(*c.path, ec) && !ec) {
            Log::logger->log(Log::TRACE, "CDefaultAppLocator: cached {}", c.path->string());
            return *c.path;
        }

        Log::logger->log(Log::DEBUG, "CDefaultAppLocator: cached binary {} is gone, searching again", c.path->string());
        c.path.reset();
    }

    c.path = discover();
    if (!c.path)
        return std::unexpected(notFound());

    Log::logger->log(Log::DEBUG, "CDefaultAppLocator: found viewer at {}", c.path->string());
    return *c.path;
}

CStaticAppLocator::CStaticAppLocator(const std::filesystem::path& path) : m_path(path) {
    ;
}

std::expected<std::filesystem::path, SViewerError> CStaticAppLocator::locateAppBinary() {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec) || ec)
        return viewerError(VIEWER_ERROR_BINARY_NOT_FOUND, "{} does not exist", m_path.string());

    return m_path;
}
