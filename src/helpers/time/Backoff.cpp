#include "Backoff.hpp"

#include <algorithm>
#include <thread>

using namespace Hyprview;

CBackoff::CBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max) : m_initial(initial), m_max(std::max(initial, max)), m_current(initial) {
    ;
}

std::chrono::milliseconds CBackoff::next() {
    const auto CURRENT = m_current;
    m_current          = std::min(m_current * 2, m_max);
    return CURRENT;
}

std::chrono::milliseconds CBackoff::peek() const {
    return m_current;
}

void CBackoff::reset() {
    m_current = m_initial;
}

void CBackoff::sleep() {
    std::this_thread::sleep_for(next());
}

std::vector<std::chrono::milliseconds> CBackoff::schedule(std::chrono::milliseconds initial, std::chrono::milliseconds max, size_t attempts) {
    std::vector<std::chrono::milliseconds> delays;
    delays.reserve(attempts);

    CBackoff backoff(initial, max);
    for (size_t i = 0; i < attempts; ++i) {
        delays.emplace_back(backoff.next());
    }

    return delays;
}
