// Simdraw/src/Utils/StoppableWorker.cpp
#include <Utils/StoppableWorker.hpp>
#include <Utils/Logger.hpp>
#include <utility>

namespace Simdraw {

void StopSignal::set() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set = true;
    }
    m_condition.notify_all();
}

void StopSignal::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_set = false;
}

bool StopSignal::isSet() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_set;
}

bool StopSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return m_set; });
}

StoppableWorker::StoppableWorker(std::string name, std::chrono::milliseconds interval, Task task)
    : m_name(std::move(name)), m_interval(interval), m_task(std::move(task)) {
}

StoppableWorker::~StoppableWorker() {
    join();
}

bool StoppableWorker::start() {
    if (m_thread.joinable()) {
        Logger::warning("Worker '{}' already started", m_name);
        return false;
    }

    m_stop_signal.reset();
    m_running = true;
    m_thread = std::thread(&StoppableWorker::threadMain, this);
    return true;
}

void StoppableWorker::requestStop() {
    m_stop_signal.set();
}

void StoppableWorker::join() {
    requestStop();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void StoppableWorker::threadMain() {
    Logger::debug("Worker '{}' started ({} ms interval)", m_name, m_interval.count());

    while (!m_stop_signal.isSet()) {
        try {
            if (m_task) {
                m_task(m_stop_signal);
            } else {
                Logger::debug("Worker '{}' running", m_name);
            }
        } catch (const std::exception& e) {
            Logger::error("Exception in worker '{}': {}", m_name, e.what());
        }

        m_iterations++;

        if (m_stop_signal.waitFor(m_interval)) {
            break;
        }
    }

    m_running = false;
    Logger::debug("Worker '{}' stopped after {} iterations", m_name, m_iterations.load());
}

} // namespace Simdraw
