#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

#include "ChildProcess.hpp"
#include "CommandChannel.hpp"
#include "Error.hpp"
#include "ResultReader.hpp"
#include "WorkingArea.hpp"
#include "../protocol/Protocol.hpp"
#include "../helpers/memory/Memory.hpp"

namespace Hyprview {
    // A running viewer. Owns the working area, dropping the handle removes it
    // but leaves the viewer process alone; use terminate() to stop it.
    class CViewerHandle {
      public:
        CViewerHandle(const std::string& id, UP<CChildProcess>&& child, UP<CWorkingArea>&& area, UP<CCommandChannel>&& channel, const SRetryPolicy& retry = {});
        ~CViewerHandle() = default;

        CViewerHandle(const CViewerHandle&)            = delete;
        CViewerHandle& operator=(const CViewerHandle&) = delete;

        const std::string&                                                     id() const;
        pid_t                                                                  pid() const;
        const std::filesystem::path&                                           workingDir() const;

        // nullopt while the viewer runs
        std::expected<std::optional<Protocol::SViewerExitStatus>, SViewerError> tryWait();
        std::expected<Protocol::SViewerExitStatus, SViewerError>                wait();
        // VIEWER_ERROR_TIMEOUT if still running after timeout, the viewer is not stopped
        std::expected<Protocol::SViewerExitStatus, SViewerError>                waitFor(std::chrono::milliseconds timeout);

        // SIGKILL and reap
        std::expected<void, SViewerError>                                      terminate();

        std::expected<void, SViewerError>                                      refresh(const Protocol::ViewerContent& content);
        bool                                                                   supportsRefresh() const;

      private:
        std::expected<Protocol::SViewerExitStatus, SViewerError> onExited(int exitCode);

        std::string                                                             m_id;
        UP<CChildProcess>                                                       m_child;
        UP<CWorkingArea>                                                        m_area;
        UP<CCommandChannel>                                                     m_channel;
        SRetryPolicy                                                            m_retry;

        // the result file is read once, later calls get the same answer
        std::optional<std::expected<Protocol::SViewerExitStatus, SViewerError>> m_result;
    };
};
