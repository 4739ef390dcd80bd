#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "../protocol/Protocol.hpp"

namespace Hyprview {
    enum eWaitMode : uint8_t {
        WAIT_BLOCKING = 0,
        WAIT_NON_BLOCKING,
    };

    struct SViewerOptions {
        Protocol::ViewerContent       content = Protocol::SInlineHtml{};
        Protocol::SWindowOptions      window;
        Protocol::SBehaviourOptions   behaviour;
        Protocol::SEnvironmentOptions environment;
        Protocol::SDialogOptions      dialog;
        eWaitMode                     wait = WAIT_BLOCKING;
        // only meaningful for WAIT_NON_BLOCKING
        bool                          enableCommands = true;

        static SViewerOptions         inlineHtml(const std::string& html);
        static SViewerOptions         localFile(const std::string& path);
        static SViewerOptions         appDir(const std::string& root, const std::string& entry = "");
        // also flips allowRemoteContent, otherwise the viewer would refuse it
        static SViewerOptions         remoteUrl(const std::string& url);
    };

    class CViewerOptionsBuilder {
      public:
        CViewerOptionsBuilder() = default;
        explicit CViewerOptionsBuilder(const SViewerOptions& base);

        CViewerOptionsBuilder& content(const Protocol::ViewerContent& content);
        CViewerOptionsBuilder& title(const std::string& title);
        CViewerOptionsBuilder& size(uint32_t width, uint32_t height);
        CViewerOptionsBuilder& position(int32_t x, int32_t y);
        CViewerOptionsBuilder& noDecorations();
        CViewerOptionsBuilder& transparent(bool enabled = true);
        CViewerOptionsBuilder& alwaysOnTop(bool enabled = true);
        CViewerOptionsBuilder& devtools(bool enabled = true);
        CViewerOptionsBuilder& allowNavigation(bool enabled = true);
        CViewerOptionsBuilder& timeout(std::chrono::seconds timeout);
        CViewerOptionsBuilder& notifications(bool enabled = true);
        CViewerOptionsBuilder& dialogs(bool enabled = true);
        CViewerOptionsBuilder& toolbar(const Protocol::SToolbarOptions& toolbar);
        CViewerOptionsBuilder& nonBlocking(bool enableCommands = true);

        SViewerOptions         build() const;

      private:
        SViewerOptions m_options;
    };
};
