#include "WorkingArea.hpp"
#include "../debug/log/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

using namespace Hyprview;

constexpr const char* REQUEST_FILE  = "config.json";
constexpr const char* RESULT_FILE   = "result.json";
constexpr const char* COMMAND_FILE  = "commands.json";
constexpr const char* RESPONSE_FILE = "command_responses.json";

CWorkingArea::CWorkingArea(const std::filesystem::path& path) : m_path(path) {
    ;
}

CWorkingArea::~CWorkingArea() {
    if (!m_cleanup)
        return;

    // best effort, a stale temp dir is not worth surfacing to anyone
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
    if (ec)
        Log::logger->log(Log::DEBUG, "CWorkingArea: couldn't remove {}: {}", m_path.string(), ec.message());
    else
        Log::logger->log(Log::TRACE, "CWorkingArea: removed {}", m_path.string());
}

std::filesystem::path CWorkingArea::pathForId(const std::string& id) {
    std::error_code ec;
    auto            tmp = std::filesystem::temp_directory_path(ec);
    if (ec)
        tmp = "/tmp";

    return tmp / ("hyprview_" + id);
}

std::expected<UP<CWorkingArea>, SViewerError> CWorkingArea::create(const std::string& id) {
    const auto      PATH = pathForId(id);

    // created 0700 in one step, and never adopted if someone else got there first
    if (mkdir(PATH.c_str(), 0700) < 0) {
        if (errno == EEXIST)
            return viewerError(VIEWER_ERROR_CONFIG_WRITE_FAILED, "Temporary directory {} already exists, refusing to reuse it", PATH.string());

        return viewerError(VIEWER_ERROR_CONFIG_WRITE_FAILED, "Failed to create temporary directory at {}: {}\nCheck that {} is writable and has free space", PATH.string(),
                           strerror(errno), PATH.parent_path().string());
    }

    // from here on the directory is ours to remove, even if the chmod fails
    auto            area = makeUnique<CWorkingArea>(PATH);

    // umask may have stripped owner bits
    std::error_code ec;
    std::filesystem::permissions(PATH, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec)
        return viewerError(VIEWER_ERROR_CONFIG_WRITE_FAILED, "Failed to set directory permissions on {}: {}", PATH.string(), ec.message());

    return area;
}

void CWorkingArea::disableCleanup() {
    m_cleanup = false;
}

bool CWorkingArea::cleanupEnabled() const {
    return m_cleanup;
}

const std::filesystem::path& CWorkingArea::path() const {
    return m_path;
}

std::filesystem::path CWorkingArea::requestPath() const {
    return m_path / REQUEST_FILE;
}

std::filesystem::path CWorkingArea::resultPath() const {
    return m_path / RESULT_FILE;
}

std::filesystem::path CWorkingArea::commandPath() const {
    return m_path / COMMAND_FILE;
}

std::filesystem::path CWorkingArea::responsePath() const {
    return m_path / RESPONSE_FILE;
}
