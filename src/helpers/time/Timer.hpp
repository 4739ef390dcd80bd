#pragma once

#include <chrono>

namespace Hyprview {
    class CTimer {
      public:
        CTimer();

        void                      reset();
        std::chrono::milliseconds elapsed() const;
        bool                      passed(std::chrono::milliseconds duration) const;

      private:
        std::chrono::steady_clock::time_point m_lastReset;
    };
};
