// Simdraw/include/Core/Viewer.hpp
#pragma once

#include <Types.hpp>
#include <Core/RaylibSurface.hpp>
#include <Graphics/PrimitiveRenderer.hpp>
#include <Utils/Config.hpp>
#include <Utils/StoppableWorker.hpp>
#include <Utils/Timer.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace Simdraw {

/**
 * @brief Interactive scene driving the geometry layer
 *
 * Owns the raylib surface, a PrimitiveRenderer on top of it and a background
 * worker that reports frame statistics. The scene pans a grid, orbits a
 * hexagon around a pivot and sweeps a sensor line.
 */
class Viewer {
public:
    struct Stats {
        std::atomic<uint64_t> frames_rendered{0};
        std::atomic<uint64_t> frame_errors{0};
        std::atomic<uint64_t> batches_submitted{0};
        std::atomic<uint64_t> vertices_submitted{0};
        std::atomic<float> avg_frame_time_ms{0.0f};
    };

    enum class State {
        STOPPED,
        INITIALIZING,
        RUNNING,
        STOPPING,
        ERROR
    };

public:
    explicit Viewer(const Config& config = Config{});
    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Lifecycle
    bool initialize();
    void run();
    void shutdown();
    void requestShutdown(const std::string& reason = "User request");

    // State management
    State getState() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == State::RUNNING; }
    std::string getStateString() const;

    const Config& getConfig() const { return m_config; }
    const Stats& getStats() const { return m_stats; }
    std::string getStatusReport() const;

    // Signal handling
    static void signalHandler(int signal);
    void handleSignal(int signal);

private:
    void mainLoop();
    void processFrame();
    void drawScene(float t);
    void reportStatistics(const StopSignal& stop);
    void setupSignalHandlers();

private:
    Config m_config;
    Stats m_stats;

    std::unique_ptr<RaylibSurface> m_surface;
    std::unique_ptr<PrimitiveRenderer> m_renderer;
    std::unique_ptr<StoppableWorker> m_stats_worker;

    std::atomic<State> m_state{State::STOPPED};
    std::atomic<bool> m_shutdown_requested{false};
    std::atomic<int> m_pending_signal{0};
    std::string m_shutdown_reason;

    Timer m_uptime;
    Timer m_frame_timer;
    float m_heading = 0.0f;
    uint64_t m_last_reported_frames = 0;

    static std::atomic<Viewer*> s_instance;
};

} // namespace Simdraw
