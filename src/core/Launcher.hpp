#pragma once

#include <expected>
#include <variant>

#include "CommandChannel.hpp"
#include "Error.hpp"
#include "Locator.hpp"
#include "Options.hpp"
#include "ResultReader.hpp"
#include "ViewerHandle.hpp"
#include "../protocol/Protocol.hpp"
#include "../helpers/memory/Memory.hpp"

namespace Hyprview {
    // blocking launches finish with a status, non-blocking ones hand back the running viewer
    using LaunchResult = std::variant<Protocol::SViewerExitStatus, UP<CViewerHandle>>;

    class CViewerLauncher {
      public:
        explicit CViewerLauncher(SP<IAppLocator> locator);
        CViewerLauncher();

        void                                        setRetryPolicy(const SRetryPolicy& policy);
        void                                        setCommandPolicy(const SCommandPolicy& policy);

        std::expected<LaunchResult, SViewerError>   launch(const SViewerOptions& options);

      private:
        Protocol::SViewerRequest                    buildRequest(const std::string& id, const SViewerOptions& options, const CWorkingArea& area) const;

        SP<IAppLocator>                             m_locator;
        SRetryPolicy                                m_retryPolicy;
        SCommandPolicy                              m_commandPolicy;
    };
};
