#pragma once

#include <format>
#include <string>
#include <string_view>

#include <hyprutils/cli/Logger.hpp>

#include "../../helpers/memory/Memory.hpp"
#include "../../helpers/env/Env.hpp"

namespace Hyprview::Log {
    class CLogger {
      public:
        CLogger();
        ~CLogger() = default;

        void log(Hyprutils::CLI::eLogLevel level, const std::string_view& str);

        template <typename... Args>
        //NOLINTNEXTLINE
        void log(Hyprutils::CLI::eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
            static bool TRACE = Env::isTrace();

            if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
                return;

            // std::format_string<Args...> validates the format at compile time, vformat can't throw a format_error here
            std::string logMsg = std::vformat(fmt.get(), std::make_format_args(args...));

            log(level, logMsg);
        }

        // the library stays quiet unless asked, the CLI flips this with --verbose
        void setEnableStdout(bool enabled);

      private:
        Hyprutils::CLI::CLogger m_logger;
    };

    inline UP<CLogger> logger = makeUnique<CLogger>();

    //
    inline constexpr const Hyprutils::CLI::eLogLevel DEBUG = Hyprutils::CLI::LOG_DEBUG;
    inline constexpr const Hyprutils::CLI::eLogLevel WARN  = Hyprutils::CLI::LOG_WARN;
    inline constexpr const Hyprutils::CLI::eLogLevel ERR   = Hyprutils::CLI::LOG_ERR;
    inline constexpr const Hyprutils::CLI::eLogLevel CRIT  = Hyprutils::CLI::LOG_CRIT;
    inline constexpr const Hyprutils::CLI::eLogLevel TRACE = Hyprutils::CLI::LOG_TRACE;
};
