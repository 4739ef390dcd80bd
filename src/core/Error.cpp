#include "Error.hpp"

using namespace Hyprview;

const char* Hyprview::errorTypeToString(eViewerError type) {
    switch (type) {
        case VIEWER_ERROR_BINARY_NOT_FOUND: return "viewer binary not found";
        case VIEWER_ERROR_SPAWN_FAILED: return "failed to spawn viewer";
        case VIEWER_ERROR_CONFIG_WRITE_FAILED: return "failed to write configuration file";
        case VIEWER_ERROR_RESULT_READ_FAILED: return "failed to read result file";
        case VIEWER_ERROR_INVALID_RESPONSE: return "invalid response from viewer";
        case VIEWER_ERROR_VERSION_MISMATCH: return "viewer version mismatch";
        case VIEWER_ERROR_TIMEOUT: return "viewer timed out";
        case VIEWER_ERROR_PROCESS_FAILED: return "viewer process failed";
        case VIEWER_ERROR_IO: return "I/O error";
        case VIEWER_ERROR_SERIALIZATION: return "serialization error";
        case VIEWER_ERROR_COMMAND_TIMEOUT: return "viewer command timed out";
        case VIEWER_ERROR_COMMAND_FAILED: return "viewer command failed";
        case VIEWER_ERROR_REFRESH_NOT_SUPPORTED: return "refresh not supported";
    }

    return "unknown error";
}

std::string SViewerError::toString() const {
    if (message.empty())
        return errorTypeToString(type);

    return std::format("{}: {}", errorTypeToString(type), message);
}
