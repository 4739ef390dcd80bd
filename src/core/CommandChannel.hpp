#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "Error.hpp"
#include "../protocol/Protocol.hpp"

namespace Hyprview {
    struct SCommandPolicy {
        std::chrono::milliseconds initialDelay = std::chrono::milliseconds{10};
        std::chrono::milliseconds maxDelay     = std::chrono::milliseconds{100};
        std::chrono::milliseconds timeout      = std::chrono::milliseconds{5000};
    };

    // Writer side of the commands.json / command_responses.json pair. The viewer
    // only ever sees complete command files, responses are matched by seq.
    class CCommandChannel {
      public:
        CCommandChannel(const std::filesystem::path& commandPath, const std::filesystem::path& responsePath, const SCommandPolicy& policy = {});

        CCommandChannel(const CCommandChannel&)            = delete;
        CCommandChannel& operator=(const CCommandChannel&) = delete;

        std::expected<void, SViewerError> refresh(const Protocol::ViewerContent& content);

        // the seq the next command will carry
        uint64_t                          peekSequence() const;

        const std::filesystem::path&      commandPath() const;
        const std::filesystem::path&      responsePath() const;

      private:
        std::expected<void, SViewerError>                             send(const Protocol::ViewerCommand& command, uint64_t seq);
        std::expected<Protocol::SViewerCommandResponse, SViewerError> awaitResponse(uint64_t seq);

        std::filesystem::path m_commandPath;
        std::filesystem::path m_responsePath;
        SCommandPolicy        m_policy;
        std::atomic<uint64_t> m_nextSeq = 1;
    };
};
