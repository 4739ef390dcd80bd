#include "Options.hpp"

using namespace Hyprview;

SViewerOptions SViewerOptions::inlineHtml(const std::string& html) {
    return SViewerOptions{.content = Protocol::SInlineHtml{.html = html}};
}

SViewerOptions SViewerOptions::localFile(const std::string& path) {
    return SViewerOptions{.content = Protocol::SLocalFile{.path = path}};
}

SViewerOptions SViewerOptions::appDir(const std::string& root, const std::string& entry) {
    Protocol::SAppDir dir{.root = root};
    if (!entry.empty())
        dir.entry = entry;

    return SViewerOptions{.content = dir};
}

SViewerOptions SViewerOptions::remoteUrl(const std::string& url) {
    SViewerOptions options{.content = Protocol::SRemoteUrl{.url = url}};
    options.behaviour.allowRemoteContent = true;
    return options;
}

CViewerOptionsBuilder::CViewerOptionsBuilder(const SViewerOptions& base) : m_options(base) {
    ;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::content(const Protocol::ViewerContent& content) {
    m_options.content = content;
    if (std::holds_alternative<Protocol::SRemoteUrl>(content))
        m_options.behaviour.allowRemoteContent = true;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::title(const std::string& title) {
    m_options.window.title = title;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::size(uint32_t width, uint32_t height) {
    m_options.window.width  = width;
    m_options.window.height = height;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::position(int32_t x, int32_t y) {
    m_options.window.x = x;
    m_options.window.y = y;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::noDecorations() {
    m_options.window.decorations = false;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::transparent(bool enabled) {
    m_options.window.transparent = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::alwaysOnTop(bool enabled) {
    m_options.window.alwaysOnTop = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::devtools(bool enabled) {
    m_options.behaviour.enableDevtools = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::allowNavigation(bool enabled) {
    m_options.behaviour.allowExternalNavigation = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::timeout(std::chrono::seconds timeout) {
    m_options.environment.timeoutSeconds = timeout.count();
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::notifications(bool enabled) {
    m_options.behaviour.allowNotifications = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::dialogs(bool enabled) {
    m_options.dialog.allowFileDialogs    = enabled;
    m_options.dialog.allowMessageDialogs = enabled;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::toolbar(const Protocol::SToolbarOptions& toolbar) {
    m_options.window.toolbar = toolbar;
    return *this;
}

CViewerOptionsBuilder& CViewerOptionsBuilder::nonBlocking(bool enableCommands) {
    m_options.wait           = WAIT_NON_BLOCKING;
    m_options.enableCommands = enableCommands;
    return *this;
}

SViewerOptions CViewerOptionsBuilder::build() const {
    return m_options;
}
