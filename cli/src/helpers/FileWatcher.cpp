#include "FileWatcher.hpp"
#include "../../../src/debug/log/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::Memory;

using namespace Hyprview;
using namespace Hyprview::Cli;

CFileWatcher::~CFileWatcher() {
    if (m_fd.isValid() && m_wd >= 0)
        inotify_rm_watch(m_fd.get(), m_wd);
}

std::expected<void, std::string> CFileWatcher::watch(const std::filesystem::path& file) {
    m_fd = Hyprutils::OS::CFileDescriptor{inotify_init1(IN_NONBLOCK | IN_CLOEXEC)};
    if (!m_fd.isValid())
        return std::unexpected(std::format("Failed to initialize inotify: {}", strerror(errno)));

    std::error_code ec;
    const auto      ABSOLUTE = std::filesystem::absolute(file, ec);
    if (ec)
        return std::unexpected(std::format("Failed to resolve {}: {}", file.string(), ec.message()));

    const auto DIR = ABSOLUTE.parent_path();
    m_filename     = ABSOLUTE.filename().string();

    m_wd = inotify_add_watch(m_fd.get(), DIR.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY);
    if (m_wd < 0)
        return std::unexpected(std::format("Failed to watch {}: {}", DIR.string(), strerror(errno)));

    Log::logger->log(Log::DEBUG, "CFileWatcher: watching {} in {}", m_filename, DIR.string());
    return {};
}

std::expected<bool, std::string> CFileWatcher::waitForChange(int timeoutMs) {
    pollfd pfd = {.fd = m_fd.get(), .events = POLLIN, .revents = 0};

    const int RET = poll(&pfd, 1, timeoutMs);
    if (RET < 0) {
        if (errno == EINTR)
            return false;
        return std::unexpected(std::format("poll() failed: {}", strerror(errno)));
    }

    if (RET == 0)
        return false;

    bool changed = false;

    char buffer[4096] __attribute__((aligned(__alignof__(struct inotify_event))));
    while (true) {
        const ssize_t LEN = read(m_fd.get(), buffer, sizeof(buffer));
        if (LEN <= 0)
            break;

        const inotify_event* event = nullptr;
        for (char* ptr = buffer; ptr < buffer + LEN; ptr += sizeof(inotify_event) + event->len) {
            event = rc<const inotify_event*>(ptr);

            if (event->len > 0 && m_filename == event->name)
                changed = true;
        }
    }

    return changed;
}
