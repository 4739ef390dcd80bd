#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace Hyprview {
    // doubling delay, clamped to a ceiling
    class CBackoff {
      public:
        CBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max);

        // returns the delay to sleep for now and advances
        std::chrono::milliseconds next();
        std::chrono::milliseconds peek() const;
        void                      reset();

        // sleeps for next()
        void                      sleep();

        static std::vector<std::chrono::milliseconds> schedule(std::chrono::milliseconds initial, std::chrono::milliseconds max, size_t attempts);

      private:
        std::chrono::milliseconds m_initial;
        std::chrono::milliseconds m_max;
        std::chrono::milliseconds m_current;
    };
};
