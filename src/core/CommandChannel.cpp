#include "CommandChannel.hpp"
#include "../helpers/Uuid.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../helpers/time/Backoff.hpp"
#include "../helpers/time/Timer.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <format>
#include <thread>

using namespace Hyprview;

CCommandChannel::CCommandChannel(const std::filesystem::path& commandPath, const std::filesystem::path& responsePath, const SCommandPolicy& policy) :
    m_commandPath(commandPath), m_responsePath(responsePath), m_policy(policy) {
    ;
}

uint64_t CCommandChannel::peekSequence() const {
    return m_nextSeq.load();
}

const std::filesystem::path& CCommandChannel::commandPath() const {
    return m_commandPath;
}

const std::filesystem::path& CCommandChannel::responsePath() const {
    return m_responsePath;
}

std::expected<void, SViewerError> CCommandChannel::refresh(const Protocol::ViewerContent& content) {
    const uint64_t SEQ = m_nextSeq.fetch_add(1);

    Log::logger->log(Log::DEBUG, "CCommandChannel: refresh #{} with {}", SEQ, Protocol::contentTypeName(content));

    if (auto ret = send(Protocol::SRefreshCommand{.seq = SEQ, .content = content}, SEQ); !ret)
        return ret;

    auto response = awaitResponse(SEQ);
    if (!response)
        return std::unexpected(response.error());

    if (!response->success)
        return viewerError(VIEWER_ERROR_COMMAND_FAILED, "{}", response->error.value_or("viewer did not say why"));

    return {};
}

std::expected<void, SViewerError> CCommandChannel::send(const Protocol::ViewerCommand& command, uint64_t seq) {
    const auto JSON = Protocol::encodeCommand(command);
    if (!JSON)
        return viewerError(VIEWER_ERROR_SERIALIZATION, "Failed to serialize command #{}: {}", seq, JSON.error());

    // unique per send, two handles never race on the same temp file
    const auto TEMPNAME = std::format(".command-{}-{}.tmp", seq, Uuid::generate());

    if (auto ret = FsUtils::writeAtomically(m_commandPath, *JSON, TEMPNAME); !ret)
        return viewerError(VIEWER_ERROR_IO, "Failed to write command #{}: {}", seq, ret.error());

    return {};
}

std::expected<Protocol::SViewerCommandResponse, SViewerError> CCommandChannel::awaitResponse(uint64_t seq) {
    CTimer   timer;
    CBackoff backoff(m_policy.initialDelay, m_policy.maxDelay);

    while (true) {
        std::error_code ec;
        if (std::filesystem::exists(m_responsePath, ec) && !ec) {
            // the viewer writes this in place, a read can land mid-write, so parse errors are not final
            if (auto content = FsUtils::readFileAsString(m_responsePath); content) {
                if (auto response = Protocol::decodeCommandResponse(*content); response) {
                    if (response->seq == seq)
                        return std::move(*response);

                    Log::logger->log(Log::TRACE, "CCommandChannel: ignoring stale response #{} while waiting for #{}", response->seq, seq);
                } else
                    Log::logger->log(Log::TRACE, "CCommandChannel: unreadable response for #{}: {}", seq, response.error());
            }
        }

        if (timer.passed(m_policy.timeout))
            break;

        const auto LEFT = m_policy.timeout - timer.elapsed();
        std::this_thread::sleep_for(std::max(std::chrono::milliseconds{1}, std::min(backoff.next(), LEFT)));
    }

    return viewerError(VIEWER_ERROR_COMMAND_TIMEOUT, "Command #{} timed out after {}ms", seq, m_policy.timeout.count());
}
