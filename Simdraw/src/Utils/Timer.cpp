// Simdraw/src/Utils/Timer.cpp
#include <Utils/Timer.hpp>

namespace Simdraw {

void Timer::start() {
    m_start_time = std::chrono::steady_clock::now();
    m_end_time = m_start_time;
    m_running = true;
}

void Timer::stop() {
    if (!m_running) {
        return;
    }
    m_end_time = std::chrono::steady_clock::now();
    m_running = false;
}

double Timer::getElapsedSeconds() const {
    auto end = m_running ? std::chrono::steady_clock::now() : m_end_time;

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start_time);
    return duration.count() / 1000000.0;
}

double Timer::getElapsedMilliseconds() const {
    return getElapsedSeconds() * 1000.0;
}

} // namespace Simdraw
