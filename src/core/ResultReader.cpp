#include "ResultReader.hpp"
#include "../protocol/Version.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../helpers/time/Backoff.hpp"
#include "../debug/log/Logger.hpp"

using namespace Hyprview;

constexpr size_t PREVIEW_LEN = 200;

static std::string preview(const std::string& content) {
    if (content.size() <= PREVIEW_LEN)
        return content;

    return content.substr(0, PREVIEW_LEN) + "...";
}

std::expected<Protocol::SViewerExitStatus, SViewerError> Hyprview::readExitStatus(const std::filesystem::path& path, const std::string& expectedId, const SRetryPolicy& policy) {
    CBackoff    backoff(policy.initialDelay, policy.maxDelay);
    std::string lastError = "no attempt made";

    for (size_t attempt = 0; attempt < policy.maxAttempts; ++attempt) {
        if (attempt > 0)
            backoff.sleep();

        auto content = FsUtils::readFileAsString(path);
        if (!content) {
            lastError = content.error();
            Log::logger->log(Log::TRACE, "readExitStatus: attempt {}/{} failed: {}", attempt + 1, policy.maxAttempts, lastError);
            continue;
        }

        // truncated but not yet written, the viewer is mid-flush
        if (content->find_first_not_of(" \t\r\n") == std::string::npos) {
            lastError = "file is empty";
            continue;
        }

        auto status = Protocol::decodeExitStatus(*content);
        if (!status)
            return viewerError(VIEWER_ERROR_INVALID_RESPONSE, "Failed to parse result file {}: {}\nContent: {}", path.string(), status.error(), preview(*content));

        if (status->id != expectedId)
            return viewerError(VIEWER_ERROR_INVALID_RESPONSE, "Response ID mismatch: expected {}, got {}", expectedId, status->id);

        if (auto ret = Version::checkCompatibility(Protocol::PROTOCOL_VERSION, status->viewerVersion); !ret)
            return std::unexpected(ret.error());

        Log::logger->log(Log::DEBUG, "readExitStatus: {} after {} attempt(s): {}", expectedId, attempt + 1, Protocol::exitReasonToString(status->reason));

        return std::move(*status);
    }

    return viewerError(VIEWER_ERROR_RESULT_READ_FAILED, "Failed to read result file {} after {} attempts: {}", path.string(), policy.maxAttempts, lastError);
}

std::expected<Protocol::SViewerExitStatus, SViewerError> Hyprview::collectExitStatus(int exitCode, const std::filesystem::path& path, const std::string& expectedId,
                                                                                     const SRetryPolicy& policy) {
    auto status = readExitStatus(path, expectedId, policy);

    if (!status) {
        if (exitCode != 0 && status.error().type == VIEWER_ERROR_RESULT_READ_FAILED)
            return viewerError(VIEWER_ERROR_RESULT_READ_FAILED, "viewer exited with code {}: {}", exitCode, status.error().message);

        return std::unexpected(status.error());
    }

    // a viewer that reports an error is allowed to exit non-zero, anything else is a crash after writing
    if (exitCode != 0 && !Protocol::isErrorReason(status->reason))
        return viewerError(VIEWER_ERROR_PROCESS_FAILED, "viewer exited with code {} after reporting {}", exitCode, Protocol::exitReasonToString(status->reason));

    return status;
}
