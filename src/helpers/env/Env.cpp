#include "Env.hpp"

#include <cstdlib>
#include <string_view>

using namespace Hyprview;

bool Env::envEnabled(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret)
        return false;

    const std::string_view sv = ret;

    return !sv.empty() && sv != "0";
}

std::optional<std::string> Env::envValue(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret || ret[0] == '\0')
        return std::nullopt;

    return std::string{ret};
}

bool Env::isTrace() {
    static bool TRACE_ENABLED = envEnabled(TRACE);
    return TRACE_ENABLED;
}

bool Env::isLogEnabled() {
    return isTrace() || envEnabled(LOG);
}

bool Env::keepWorkdir() {
    return envEnabled(KEEP_WORKDIR);
}
