// Simdraw/src/Core/Viewer.cpp
#include <Core/Viewer.hpp>
#include <Geometry/ShapeTessellator.hpp>
#include <Geometry/Transform.hpp>
#include <Utils/Logger.hpp>
#include <csignal>
#include <sstream>

namespace Simdraw {

namespace {

constexpr float PAN_SPEED = 20.0f;          // world units per second
constexpr float ORBIT_RADIUS = 150.0f;
constexpr float ORBIT_SPEED = 0.5f;         // radians per second
constexpr float HEADING_SPEED = 1.5f;       // radians per second
constexpr float SENSOR_RANGE = 120.0f;
constexpr float HEXAGON_RADIUS = 40.0f;
constexpr uint64_t MAX_FRAME_ERRORS = 100;

} // namespace

std::atomic<Viewer*> Viewer::s_instance{nullptr};

Viewer::Viewer(const Config& config) : m_config(config) {
    s_instance.store(this);

    Logger::info("Viewer created with configuration:");
    Logger::info(m_config.getConfigSummary());
}

Viewer::~Viewer() {
    if (m_surface) {
        shutdown();
    }

    Viewer* self = this;
    s_instance.compare_exchange_strong(self, nullptr);
}

bool Viewer::initialize() {
    if (m_state.load() != State::STOPPED || m_surface) {
        Logger::warning("Viewer already initialized");
        return false;
    }

    m_state = State::INITIALIZING;
    Logger::info("Initializing viewer...");

    RaylibSurface::Config surface_config;
    surface_config.window_width = m_config.renderer().window_width;
    surface_config.window_height = m_config.renderer().window_height;
    surface_config.target_fps = m_config.renderer().target_fps;
    surface_config.enable_vsync = m_config.renderer().enable_vsync;
    surface_config.enable_antialiasing = m_config.renderer().enable_antialiasing;
    surface_config.hidden = m_config.renderer().hidden;
    surface_config.window_title = m_config.renderer().window_title;
    surface_config.background = m_config.renderer().background;

    m_surface = std::make_unique<RaylibSurface>(surface_config);
    if (!m_surface->initialize()) {
        Logger::error("Failed to initialize drawing surface");
        m_surface.reset();
        m_state = State::ERROR;
        return false;
    }

    m_renderer = std::make_unique<PrimitiveRenderer>(*m_surface, m_config.toTessellationSettings());

    if (m_config.worker().enable_stats_worker) {
        m_stats_worker = std::make_unique<StoppableWorker>(
            "stats", std::chrono::milliseconds(m_config.worker().stats_interval_ms),
            [this](const StopSignal& stop) { reportStatistics(stop); });
    }

    m_state = State::STOPPED; // Ready to run
    Logger::info("Viewer initialization completed successfully");
    return true;
}

void Viewer::run() {
    if (m_state.load() != State::STOPPED || !m_surface) {
        Logger::error("Cannot start viewer - invalid state: {}", getStateString());
        return;
    }

    Logger::info("Starting viewer main loop");
    m_state = State::RUNNING;
    m_uptime.start();

    if (m_stats_worker && !m_stats_worker->start()) {
        Logger::warning("Statistics worker was already running");
    }

    try {
        mainLoop();
    } catch (const std::exception& e) {
        Logger::error("Exception in viewer main loop: {}", e.what());
        m_state = State::ERROR;
    }

    if (m_stats_worker) {
        m_stats_worker->join();
    }

    m_uptime.stop();
    Logger::info("Viewer main loop ended after {} frames", m_stats.frames_rendered.load());
}

void Viewer::shutdown() {
    Logger::info("Shutting down viewer...");

    m_state = State::STOPPING;
    m_shutdown_requested = true;

    if (m_stats_worker) {
        m_stats_worker->join();
        m_stats_worker.reset();
    }

    m_renderer.reset();
    if (m_surface) {
        m_surface->shutdown();
        m_surface.reset();
    }

    m_state = State::STOPPED;
    Logger::info("Viewer shutdown complete");
}

void Viewer::requestShutdown(const std::string& reason) {
    Logger::info("Shutdown requested: {}", reason);
    m_shutdown_reason = reason;
    m_shutdown_requested = true;
}

std::string Viewer::getStateString() const {
    switch (m_state.load()) {
        case State::STOPPED: return "STOPPED";
        case State::INITIALIZING: return "INITIALIZING";
        case State::RUNNING: return "RUNNING";
        case State::STOPPING: return "STOPPING";
        case State::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Viewer::getStatusReport() const {
    std::stringstream ss;
    ss << "State: " << getStateString() << "\n";
    ss << "Uptime: " << m_uptime.getElapsedSeconds() << "s\n";
    ss << "Frames: " << m_stats.frames_rendered.load()
       << " (avg " << m_stats.avg_frame_time_ms.load() << "ms)\n";
    ss << "Batches: " << m_stats.batches_submitted.load()
       << ", vertices: " << m_stats.vertices_submitted.load() << "\n";
    ss << "Frame errors: " << m_stats.frame_errors.load() << "\n";
    return ss.str();
}

void Viewer::signalHandler(int signal) {
    Viewer* instance = s_instance.load();
    if (instance) {
        instance->handleSignal(signal);
    }
}

void Viewer::handleSignal(int signal) {
    // Logged from the main loop; only flags are touched here
    m_pending_signal.store(signal);
    m_shutdown_requested = true;
}

// Private methods implementation

void Viewer::mainLoop() {
    Logger::info("Entering main viewer loop");

    setupSignalHandlers();

    while (!m_shutdown_requested && m_state.load() == State::RUNNING) {
        try {
            processFrame();
        } catch (const std::exception& e) {
            Logger::error("Exception in frame: {}", e.what());

            if (m_surface->isInFrame()) {
                m_surface->endFrame();
            }

            if (m_stats.frame_errors.fetch_add(1) + 1 > MAX_FRAME_ERRORS) {
                Logger::error("Too many frame errors, stopping viewer");
                break;
            }
        }
    }

    int signal = m_pending_signal.exchange(0);
    if (signal != 0) {
        const char* signal_name = "Unknown";
        switch (signal) {
            case SIGINT: signal_name = "SIGINT"; break;
            case SIGTERM: signal_name = "SIGTERM"; break;
            case SIGHUP: signal_name = "SIGHUP"; break;
        }
        Logger::info("Received signal {} ({})", signal, signal_name);
    }

    Logger::info("Main viewer loop ended");
}

void Viewer::processFrame() {
    m_frame_timer.start();

    float t = static_cast<float>(m_uptime.getElapsedSeconds());

    m_surface->setCamera({t * PAN_SPEED, 0.0f});
    m_surface->beginFrame();

    drawScene(t);

    m_surface->endFrame();

    if (m_surface->shouldClose()) {
        requestShutdown("Window close requested");
    }

    m_frame_timer.stop();

    const auto& renderer_stats = m_renderer->getStats();
    m_stats.batches_submitted.store(renderer_stats.batches_submitted);
    m_stats.vertices_submitted.store(renderer_stats.vertices_submitted);

    // Exponential moving average
    float frame_ms = static_cast<float>(m_frame_timer.getElapsedMilliseconds());
    float avg = m_stats.avg_frame_time_ms.load();
    m_stats.avg_frame_time_ms.store(avg == 0.0f ? frame_ms : avg * 0.9f + frame_ms * 0.1f);

    m_stats.frames_rendered.fetch_add(1);
}

void Viewer::drawScene(float t) {
    const float width = static_cast<float>(m_config.renderer().window_width);
    const float height = static_cast<float>(m_config.renderer().window_height);
    const Point view_origin(t * PAN_SPEED, 0.0f);

    // Rejected batches are already logged by the renderer
    auto track = [this](ErrorCode code) {
        if (code != ErrorCode::SUCCESS) {
            m_stats.frame_errors.fetch_add(1);
        }
    };

    // Grid lines stay fixed in world space while the view pans
    track(m_renderer->drawGrid(view_origin, width, height));

    const Point pivot = view_origin + Point(width / 2.0f, height / 2.0f);
    track(m_renderer->drawCircle(pivot, 6.0f, true));

    // Orbiting hexagon, also spinning on its own heading
    float dt = m_surface->getStats().frame_time_ms / 1000.0f;
    m_heading = Transform::wrapAngle(m_heading + dt * HEADING_SPEED);

    Point orbit = Transform::rotateAround(pivot, pivot + Point(ORBIT_RADIUS, 0.0f), t * ORBIT_SPEED);
    track(m_renderer->drawNgon(orbit, HEXAGON_RADIUS, 6, m_heading, true));
    track(m_renderer->drawNgon(orbit, HEXAGON_RADIUS + 8.0f, 6, m_heading, false));

    // Sensor line from the pivot along the current heading, fading out
    Point tip = pivot + Transform::rotate(Point(SENSOR_RANGE, 0.0f), m_heading);
    ColorSequence sensor_colors = Color::Green.fill(1);
    ColorSequence tip_colors = Color::Transparent.fill(1);
    sensor_colors.insert(sensor_colors.end(), tip_colors.begin(), tip_colors.end());
    track(m_renderer->drawLine(pivot, tip, sensor_colors));

    // Ring the hexagon while the sensor tip is inside it
    if (Transform::distance(tip, orbit) < HEXAGON_RADIUS) {
        DrawBatch ring = ShapeTessellator::circleOutline(orbit.x, orbit.y, HEXAGON_RADIUS + 16.0f,
                                                         EllipseOptions(), m_renderer->getSettings());
        ring.colors = Color::Red.fill(ring.vertexCount());
        track(m_renderer->submit(ring));
    }

    // Dashed orbit guide
    EllipseOptions dashed;
    dashed.dashed = true;
    track(m_renderer->drawEllipse(pivot - Point(ORBIT_RADIUS, ORBIT_RADIUS),
                                  pivot + Point(ORBIT_RADIUS, ORBIT_RADIUS), false, dashed));

    track(m_renderer->drawBox(view_origin + Point(10.0f, 10.0f), width - 20.0f, height - 20.0f));
}

void Viewer::reportStatistics(const StopSignal& stop) {
    if (stop.isSet()) {
        return;
    }

    uint64_t frames = m_stats.frames_rendered.load();
    uint64_t delta = frames - m_last_reported_frames;
    m_last_reported_frames = frames;

    double seconds = static_cast<double>(m_config.worker().stats_interval_ms) / 1000.0;

    Logger::info("Frames: {} ({} fps), avg frame {}ms, batches {}, vertices {}, errors {}",
                 frames, static_cast<double>(delta) / seconds, m_stats.avg_frame_time_ms.load(),
                 m_stats.batches_submitted.load(), m_stats.vertices_submitted.load(),
                 m_stats.frame_errors.load());
}

void Viewer::setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
}

} // namespace Simdraw
