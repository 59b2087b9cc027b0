// Simdraw/include/Utils/StoppableWorker.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace Simdraw {

/**
 * @brief Cancellation flag with a timed wait
 */
class StopSignal {
public:
    void set();
    void reset();
    bool isSet() const;

    // Sleeps up to timeout; returns true as soon as the signal is set
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    bool m_set = false;
};

/**
 * @brief Background loop that runs a task once per interval until stopped
 *
 * The stop signal is checked after every task run and interrupts the
 * interval wait, so join() returns without waiting out a full interval.
 */
class StoppableWorker {
public:
    using Task = std::function<void(const StopSignal&)>;

    StoppableWorker(std::string name, std::chrono::milliseconds interval, Task task = Task());
    ~StoppableWorker();

    StoppableWorker(const StoppableWorker&) = delete;
    StoppableWorker& operator=(const StoppableWorker&) = delete;

    // Lifecycle
    bool start();
    void requestStop();
    void join();  // signals stop, then waits for the loop to exit

    bool isRunning() const { return m_running.load(); }
    uint64_t iterations() const { return m_iterations.load(); }
    const std::string& getName() const { return m_name; }
    std::chrono::milliseconds getInterval() const { return m_interval; }

private:
    void threadMain();

private:
    std::string m_name;
    std::chrono::milliseconds m_interval;
    Task m_task;

    StopSignal m_stop_signal;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_iterations{0};
};

} // namespace Simdraw
