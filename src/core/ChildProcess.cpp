#include "ChildProcess.hpp"
#include "../debug/log/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

#include <hyprutils/os/FileDescriptor.hpp>

using namespace Hyprview;
using namespace Hyprutils::OS;

CChildProcess::CChildProcess(pid_t pid) : m_pid(pid) {
    ;
}

CChildProcess::~CChildProcess() {
    if (m_pid <= 0 || m_exitCode)
        return;

    // reap if it already went away, a live viewer is left alone
    int status = 0;
    if (waitpid(m_pid, &status, WNOHANG) == m_pid)
        onExited(status);
}

std::expected<UP<CChildProcess>, std::string> CChildProcess::spawn(const std::string& binary, const std::vector<std::string>& args) {
    // the child writes errno here if exec fails, a successful exec closes it
    int pipefds[2];
    if (pipe2(pipefds, O_CLOEXEC) < 0)
        return std::unexpected(std::format("pipe2() failed: {}", strerror(errno)));

    CFileDescriptor    readEnd{pipefds[0]}, writeEnd{pipefds[1]};

    std::vector<char*> argv = {const_cast<char*>(binary.c_str())};
    for (const auto& a : args) {
        argv.emplace_back(const_cast<char*>(a.c_str()));
    }
    argv.emplace_back(nullptr);

    const pid_t PID = fork();
    if (PID < 0)
        return std::unexpected(std::format("fork() failed: {}", strerror(errno)));

    if (PID == 0) {
        execv(binary.c_str(), argv.data());

        const int ERR = errno;
        if (write(writeEnd.get(), &ERR, sizeof(ERR)) < 0)
            _exit(126);
        _exit(127);
    }

    writeEnd.reset();

    int     execErrno = 0;
    ssize_t n         = 0;
    do {
        n = read(readEnd.get(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n == sizeof(execErrno)) {
        // the child is already on its way out via _exit(), collect it
        int status = 0;
        if (waitpid(PID, &status, 0) < 0)
            Log::logger->log(Log::WARN, "CChildProcess: couldn't reap failed child {}: {}", PID, strerror(errno));
        return std::unexpected(std::format("exec of {} failed: {}", binary, strerror(execErrno)));
    }

    Log::logger->log(Log::DEBUG, "CChildProcess: spawned {} with pid {}", binary, PID);

    return UP<CChildProcess>(new CChildProcess(PID));
}

void CChildProcess::onExited(int status) {
    if (WIFEXITED(status))
        m_exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        m_exitCode = -WTERMSIG(status);
    else
        m_exitCode = -1;

    Log::logger->log(Log::DEBUG, "CChildProcess: pid {} exited with {}", m_pid, *m_exitCode);
}

std::expected<int, std::string> CChildProcess::wait() {
    if (m_exitCode)
        return *m_exitCode;

    while (true) {
        int         status = 0;
        const pid_t RET    = waitpid(m_pid, &status, 0);
        if (RET == -1) {
            if (errno == EINTR)
                continue;
            return std::unexpected(std::format("waitpid() for {} failed: {}", m_pid, strerror(errno)));
        }

        if (WIFEXITED(status) || WIFSIGNALED(status)) {
            onExited(status);
            return *m_exitCode;
        }
    }
}

std::expected<std::optional<int>, std::string> CChildProcess::tryWait() {
    if (m_exitCode)
        return m_exitCode;

    int         status = 0;
    const pid_t RET    = waitpid(m_pid, &status, WNOHANG);
    if (RET == -1)
        return std::unexpected(std::format("waitpid() for {} failed: {}", m_pid, strerror(errno)));

    if (RET == 0 || (!WIFEXITED(status) && !WIFSIGNALED(status)))
        return std::nullopt;

    onExited(status);
    return m_exitCode;
}

std::expected<void, std::string> CChildProcess::kill() {
    if (m_exitCode)
        return {};

    if (::kill(m_pid, SIGKILL) < 0 && errno != ESRCH)
        return std::unexpected(std::format("kill() for {} failed: {}", m_pid, strerror(errno)));

    return {};
}

pid_t CChildProcess::pid() const {
    return m_pid;
}
