#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

#include "Error.hpp"
#include "../protocol/Protocol.hpp"

namespace Hyprview {
    struct SRetryPolicy {
        size_t                    maxAttempts  = 10;
        std::chrono::milliseconds initialDelay = std::chrono::milliseconds{10};
        std::chrono::milliseconds maxDelay     = std::chrono::milliseconds{1000};
    };

    // The viewer may still be flushing when it exits, so missing / unreadable files are retried.
    // A file that parses wrong is final.
    std::expected<Protocol::SViewerExitStatus, SViewerError> readExitStatus(const std::filesystem::path& path, const std::string& expectedId, const SRetryPolicy& policy = {});

    // readExitStatus, reconciled with how the process actually exited
    std::expected<Protocol::SViewerExitStatus, SViewerError> collectExitStatus(int exitCode, const std::filesystem::path& path, const std::string& expectedId,
                                                                               const SRetryPolicy& policy = {});
};
