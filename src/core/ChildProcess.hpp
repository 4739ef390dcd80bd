#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

#include "../helpers/memory/Memory.hpp"

namespace Hyprview {
    // A directly forked child we can wait on. Hyprutils' CProcess detaches async
    // children, which loses the exit code.
    class CChildProcess {
      public:
        ~CChildProcess();

        CChildProcess(const CChildProcess&)            = delete;
        CChildProcess& operator=(const CChildProcess&) = delete;

        // fails if fork() fails or the binary couldn't be exec'd
        static std::expected<UP<CChildProcess>, std::string> spawn(const std::string& binary, const std::vector<std::string>& args);

        // blocks, returns the exit code or -signal
        std::expected<int, std::string>                      wait();
        // nullopt while still running
        std::expected<std::optional<int>, std::string>       tryWait();

        // SIGKILL, no graceful shutdown
        std::expected<void, std::string>                     kill();

        pid_t                                                pid() const;

      private:
        explicit CChildProcess(pid_t pid);

        void               onExited(int status);

        pid_t              m_pid = -1;
        std::optional<int> m_exitCode;
    };
};
