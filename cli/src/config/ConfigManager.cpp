#include "ConfigManager.hpp"
#include "../../../src/helpers/env/Env.hpp"
#include "../../../src/debug/log/Logger.hpp"

#include <algorithm>
#include <any>
#include <format>
#include <limits>

#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::Memory;

using namespace Hyprview;
using namespace Hyprview::Cli;

CConfigManager::CConfigManager(const std::string& path) : m_path(path) {
    m_config = makeUnique<Hyprlang::CConfig>(m_path.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = false, .allowMissingConfig = true});

    m_config->addConfigValue("general:viewer_path", Hyprlang::STRING{""});
    m_config->addConfigValue("general:timeout", Hyprlang::INT{0});

    m_config->addConfigValue("window:width", Hyprlang::INT{1024});
    m_config->addConfigValue("window:height", Hyprlang::INT{768});
    m_config->addConfigValue("window:title", Hyprlang::STRING{"Hyprview"});
    m_config->addConfigValue("window:decorations", Hyprlang::INT{1});
    m_config->addConfigValue("window:transparent", Hyprlang::INT{0});
    m_config->addConfigValue("window:always_on_top", Hyprlang::INT{0});

    m_config->addConfigValue("behaviour:devtools", Hyprlang::INT{0});
    m_config->addConfigValue("behaviour:allow_navigation", Hyprlang::INT{0});

    m_config->commence();
}

std::optional<std::string> CConfigManager::defaultPath() {
    if (const auto XDG = Env::envValue("XDG_CONFIG_HOME"); XDG)
        return *XDG + "/hypr/hyprview.conf";

    if (const auto HOME = Env::envValue("HOME"); HOME)
        return *HOME + "/.config/hypr/hyprview.conf";

    return std::nullopt;
}

std::expected<void, std::string> CConfigManager::load() {
    const auto RESULT = m_config->parse();
    if (RESULT.error)
        return std::unexpected(std::format("{}: {}", m_path, RESULT.getError()));

    Log::logger->log(Log::DEBUG, "CConfigManager: loaded {}", m_path);
    return {};
}

const std::string& CConfigManager::path() const {
    return m_path;
}

Hyprlang::INT CConfigManager::getInt(const char* name) const {
    return std::any_cast<Hyprlang::INT>(m_config->getConfigValue(name));
}

std::string CConfigManager::getString(const char* name) const {
    return std::any_cast<Hyprlang::STRING>(m_config->getConfigValue(name));
}

SCliConfig CConfigManager::values() const {
    constexpr Hyprlang::INT MAXSIZE = std::numeric_limits<uint32_t>::max();

    return SCliConfig{
        .viewerPath      = getString("general:viewer_path"),
        .timeout         = sc<uint64_t>(std::clamp<Hyprlang::INT>(getInt("general:timeout"), 0, MAXSIZE)),
        .width           = sc<uint32_t>(std::clamp<Hyprlang::INT>(getInt("window:width"), 1, MAXSIZE)),
        .height          = sc<uint32_t>(std::clamp<Hyprlang::INT>(getInt("window:height"), 1, MAXSIZE)),
        .title           = getString("window:title"),
        .decorations     = !!getInt("window:decorations"),
        .transparent     = !!getInt("window:transparent"),
        .alwaysOnTop     = !!getInt("window:always_on_top"),
        .devtools        = !!getInt("behaviour:devtools"),
        .allowNavigation = !!getInt("behaviour:allow_navigation"),
    };
}
