#include "ViewerHandle.hpp"
#include "../helpers/time/Backoff.hpp"
#include "../helpers/time/Timer.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <thread>

using namespace Hyprview;

CViewerHandle::CViewerHandle(const std::string& id, UP<CChildProcess>&& child, UP<CWorkingArea>&& area, UP<CCommandChannel>&& channel, const SRetryPolicy& retry) :
    m_id(id), m_child(std::move(child)), m_area(std::move(area)), m_channel(std::move(channel)), m_retry(retry) {
    ;
}

const std::string& CViewerHandle::id() const {
    return m_id;
}

pid_t CViewerHandle::pid() const {
    return m_child->pid();
}

const std::filesystem::path& CViewerHandle::workingDir() const {
    return m_area->path();
}

bool CViewerHandle::supportsRefresh() const {
    return !!m_channel;
}

std::expected<Protocol::SViewerExitStatus, SViewerError> CViewerHandle::onExited(int exitCode) {
    if (!m_result)
        m_result = collectExitStatus(exitCode, m_area->resultPath(), m_id, m_retry);

    return *m_result;
}

std::expected<std::optional<Protocol::SViewerExitStatus>, SViewerError> CViewerHandle::tryWait() {
    auto exited = m_child->tryWait();
    if (!exited)
        return viewerError(VIEWER_ERROR_IO, "{}", exited.error());

    if (!exited->has_value())
        return std::nullopt;

    auto status = onExited(**exited);
    if (!status)
        return std::unexpected(status.error());

    return std::move(*status);
}

std::expected<Protocol::SViewerExitStatus, SViewerError> CViewerHandle::wait() {
    auto exitCode = m_child->wait();
    if (!exitCode)
        return viewerError(VIEWER_ERROR_IO, "{}", exitCode.error());

    return onExited(*exitCode);
}

std::expected<Protocol::SViewerExitStatus, SViewerError> CViewerHandle::waitFor(std::chrono::milliseconds timeout) {
    CTimer   timer;
    CBackoff backoff(std::chrono::milliseconds{10}, std::chrono::milliseconds{100});

    while (true) {
        auto exited = m_child->tryWait();
        if (!exited)
            return viewerError(VIEWER_ERROR_IO, "{}", exited.error());

        if (exited->has_value())
            return onExited(**exited);

        if (timer.passed(timeout))
            break;

        const auto LEFT = timeout - timer.elapsed();
        std::this_thread::sleep_for(std::max(std::chrono::milliseconds{1}, std::min(backoff.next(), LEFT)));
    }

    return viewerError(VIEWER_ERROR_TIMEOUT, "viewer {} still running after {}ms", m_id, timeout.count());
}

std::expected<void, SViewerError> CViewerHandle::terminate() {
    Log::logger->log(Log::DEBUG, "CViewerHandle: terminating {} (pid {})", m_id, m_child->pid());

    if (auto ret = m_child->kill(); !ret)
        return viewerError(VIEWER_ERROR_IO, "{}", ret.error());

    if (auto ret = m_child->wait(); !ret)
        return viewerError(VIEWER_ERROR_IO, "{}", ret.error());

    return {};
}

std::expected<void, SViewerError> CViewerHandle::refresh(const Protocol::ViewerContent& content) {
    if (!m_channel)
        return viewerError(VIEWER_ERROR_REFRESH_NOT_SUPPORTED, "viewer {} was opened without a command channel", m_id);

    auto exited = m_child->tryWait();
    if (!exited)
        return viewerError(VIEWER_ERROR_IO, "{}", exited.error());

    if (exited->has_value())
        return viewerError(VIEWER_ERROR_COMMAND_FAILED, "viewer {} has already exited with code {}", m_id, **exited);

    return m_channel->refresh(content);
}
