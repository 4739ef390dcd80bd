#include "Hyprview.hpp"

using namespace Hyprview;

static std::expected<Protocol::SViewerExitStatus, SViewerError> blocking(const SViewerOptions& options) {
    auto opts = options;
    opts.wait = WAIT_BLOCKING;

    auto result = Hyprview::open(opts);
    if (!result)
        return std::unexpected(result.error());

    return std::get<Protocol::SViewerExitStatus>(std::move(*result));
}

std::expected<Protocol::SViewerExitStatus, SViewerError> Hyprview::show(const std::string& html) {
    return blocking(SViewerOptions::inlineHtml(html));
}

std::expected<Protocol::SViewerExitStatus, SViewerError> Hyprview::showWithOptions(const std::string& html, const Protocol::SWindowOptions& window) {
    auto options   = SViewerOptions::inlineHtml(html);
    options.window = window;
    return blocking(options);
}

std::expected<LaunchResult, SViewerError> Hyprview::open(const SViewerOptions& options) {
    CViewerLauncher launcher;
    return launcher.launch(options);
}

std::expected<LaunchResult, SViewerError> Hyprview::open(const SViewerOptions& options, SP<IAppLocator> locator) {
    CViewerLauncher launcher(locator);
    return launcher.launch(options);
}
