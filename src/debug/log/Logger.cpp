#include "Logger.hpp"

using namespace Hyprview;
using namespace Hyprview::Log;

CLogger::CLogger() {
    m_logger.setLogLevel(Env::isTrace() ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_DEBUG);
    m_logger.setEnableColor(false);
    m_logger.setTime(true);
    m_logger.setEnableStdout(Env::isLogEnabled());
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {
    static bool TRACE = Env::isTrace();

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

void CLogger::setEnableStdout(bool enabled) {
    m_logger.setEnableStdout(enabled);
}
