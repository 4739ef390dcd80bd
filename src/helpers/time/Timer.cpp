#include "Timer.hpp"

#define chr std::chrono

using namespace Hyprview;

CTimer::CTimer() : m_lastReset(chr::steady_clock::now()) {
    ;
}

void CTimer::reset() {
    m_lastReset = chr::steady_clock::now();
}

chr::milliseconds CTimer::elapsed() const {
    return chr::duration_cast<chr::milliseconds>(chr::steady_clock::now() - m_lastReset);
}

bool CTimer::passed(chr::milliseconds duration) const {
    return elapsed() >= duration;
}
