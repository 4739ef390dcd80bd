#include "Launcher.hpp"
#include "WorkingArea.hpp"
#include "ChildProcess.hpp"
#include "../helpers/Uuid.hpp"
#include "../helpers/env/Env.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

using namespace Hyprview;

CViewerLauncher::CViewerLauncher(SP<IAppLocator> locator) : m_locator(locator) {
    ;
}

CViewerLauncher::CViewerLauncher() : m_locator(makeShared<CDefaultAppLocator>()) {
    ;
}

void CViewerLauncher::setRetryPolicy(const SRetryPolicy& policy) {
    m_retryPolicy = policy;
}

void CViewerLauncher::setCommandPolicy(const SCommandPolicy& policy) {
    m_commandPolicy = policy;
}

Protocol::SViewerRequest CViewerLauncher::buildRequest(const std::string& id, const SViewerOptions& options, const CWorkingArea& area) const {
    Protocol::SViewerRequest request{
        .id          = id,
        .content     = options.content,
        .window      = options.window,
        .behaviour   = options.behaviour,
        .environment = options.environment,
        .dialog      = options.dialog,
    };

    if (options.wait == WAIT_NON_BLOCKING && options.enableCommands)
        request.commandPath = area.commandPath().string();

    return request;
}

std::expected<LaunchResult, SViewerError> CViewerLauncher::launch(const SViewerOptions& options) {
    const auto ID = Uuid::generate();

    auto       area = CWorkingArea::create(ID);
    if (!area)
        return std::unexpected(area.error());

    if (Env::keepWorkdir()) {
        (*area)->disableCleanup();
        Log::logger->log(Log::WARN, "${} is set, {} will be kept", Env::KEEP_WORKDIR, (*area)->path().string());
    }

    const auto REQUEST = buildRequest(ID, options, **area);

    const auto JSON = Protocol::encodeRequest(REQUEST);
    if (!JSON)
        return viewerError(VIEWER_ERROR_SERIALIZATION, "Failed to serialize request {}: {}", ID, JSON.error());

    if (auto ret = FsUtils::writeToFile((*area)->requestPath(), *JSON); !ret)
        return viewerError(VIEWER_ERROR_CONFIG_WRITE_FAILED, "{}", ret.error());

    const auto BINARY = m_locator->locateAppBinary();
    if (!BINARY)
        return std::unexpected(BINARY.error());

    Log::logger->log(Log::DEBUG, "CViewerLauncher: launching {} for {} ({})", BINARY->string(), ID, Protocol::contentTypeName(options.content));

    auto child = CChildProcess::spawn(BINARY->string(), {"--config-path", (*area)->requestPath().string(), "--result-path", (*area)->resultPath().string()});
    if (!child)
        return viewerError(VIEWER_ERROR_SPAWN_FAILED, "{}", child.error());

    if (options.wait == WAIT_NON_BLOCKING) {
        UP<CCommandChannel> channel;
        if (REQUEST.commandPath)
            channel = makeUnique<CCommandChannel>((*area)->commandPath(), (*area)->responsePath(), m_commandPolicy);

        return LaunchResult{makeUnique<CViewerHandle>(ID, std::move(*child), std::move(*area), std::move(channel), m_retryPolicy)};
    }

    const auto EXITCODE = (*child)->wait();
    if (!EXITCODE)
        return viewerError(VIEWER_ERROR_IO, "{}", EXITCODE.error());

    auto status = collectExitStatus(*EXITCODE, (*area)->resultPath(), ID, m_retryPolicy);
    if (!status)
        return std::unexpected(status.error());

    return LaunchResult{std::move(*status)};
}
