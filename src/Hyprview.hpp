#pragma once

#include <expected>
#include <string>

#include "core/Error.hpp"
#include "core/Launcher.hpp"
#include "core/Locator.hpp"
#include "core/Options.hpp"
#include "core/ViewerHandle.hpp"
#include "protocol/Protocol.hpp"

namespace Hyprview {
    // shows html and blocks until the window is gone
    std::expected<Protocol::SViewerExitStatus, SViewerError> show(const std::string& html);
    std::expected<Protocol::SViewerExitStatus, SViewerError> showWithOptions(const std::string& html, const Protocol::SWindowOptions& window);

    std::expected<LaunchResult, SViewerError>                open(const SViewerOptions& options);
    std::expected<LaunchResult, SViewerError>                open(const SViewerOptions& options, SP<IAppLocator> locator);
};
