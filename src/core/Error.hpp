#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

namespace Hyprview {
    enum eViewerError : uint8_t {
        VIEWER_ERROR_BINARY_NOT_FOUND = 0,
        VIEWER_ERROR_SPAWN_FAILED,
        VIEWER_ERROR_CONFIG_WRITE_FAILED,
        VIEWER_ERROR_RESULT_READ_FAILED,
        VIEWER_ERROR_INVALID_RESPONSE,
        VIEWER_ERROR_VERSION_MISMATCH,
        VIEWER_ERROR_TIMEOUT,
        VIEWER_ERROR_PROCESS_FAILED,
        VIEWER_ERROR_IO,
        VIEWER_ERROR_SERIALIZATION,
        VIEWER_ERROR_COMMAND_TIMEOUT,
        VIEWER_ERROR_COMMAND_FAILED,
        VIEWER_ERROR_REFRESH_NOT_SUPPORTED,
    };

    struct SViewerError {
        eViewerError type = VIEWER_ERROR_IO;
        std::string  message;

        std::string  toString() const;
    };

    const char* errorTypeToString(eViewerError type);

    template <typename... Args>
    std::unexpected<SViewerError> viewerError(eViewerError type, std::format_string<Args...> fmt, Args&&... args) {
        return std::unexpected(SViewerError{.type = type, .message = std::vformat(fmt.get(), std::make_format_args(args...))});
    }
};
