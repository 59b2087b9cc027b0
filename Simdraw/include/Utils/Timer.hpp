// Simdraw/include/Utils/Timer.hpp
#pragma once

#include <chrono>

namespace Simdraw {

/**
 * @brief Simple steady-clock stopwatch
 */
class Timer {
public:
    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Elapsed time up to stop(), or up to now while running
    double getElapsedSeconds() const;
    double getElapsedMilliseconds() const;

private:
    std::chrono::steady_clock::time_point m_start_time;
    std::chrono::steady_clock::time_point m_end_time;
    bool m_running = false;
};

} // namespace Simdraw
