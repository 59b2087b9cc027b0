// Simdraw/include/Core/RaylibSurface.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <Geometry/DrawBatch.hpp>
#include <Graphics/DrawSurface.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include <raylib.h>

namespace Simdraw {

/**
 * @brief DrawSurface that draws batches into a raylib window through rlgl
 *
 * Batches are only accepted between beginFrame() and endFrame(). Every kind
 * is lowered to RL_LINES or RL_TRIANGLES; fans and polygons pivot on their
 * first vertex.
 */
class RaylibSurface : public DrawSurface {
public:
    struct Config {
        uint32_t window_width = Defaults::WINDOW_WIDTH;
        uint32_t window_height = Defaults::WINDOW_HEIGHT;
        uint32_t target_fps = Defaults::TARGET_FPS;
        bool enable_vsync = true;
        bool enable_antialiasing = true;
        bool hidden = false;          // For headless runs
        std::string window_title = Defaults::WINDOW_TITLE;

        Color background = Color::Black;
        Color default_color = Color::White;  // for batches without colors
        float point_size = 1.0f;
    };

    struct Stats {
        uint64_t frames_rendered = 0;
        uint64_t batches_drawn = 0;
        uint64_t batches_rejected = 0;
        uint64_t vertices_drawn = 0;

        float current_fps = 0.0f;
        float frame_time_ms = 0.0f;
    };

public:
    explicit RaylibSurface(const Config& config = Config{});
    ~RaylibSurface() override;

    RaylibSurface(const RaylibSurface&) = delete;
    RaylibSurface& operator=(const RaylibSurface&) = delete;

    // Lifecycle
    bool initialize();
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    // Rendering
    void beginFrame();
    void endFrame();
    bool isInFrame() const { return m_in_frame; }
    bool shouldClose() const;

    ErrorCode submit(const DrawBatch& batch) override;

    // World-space view, applied from the next beginFrame()
    void setCamera(const Point& target, float zoom = 1.0f);
    void resetCamera();

    // Performance and debugging
    const Stats& getStats() const { return m_stats; }
    void resetStats();

    const Config& getConfig() const { return m_config; }

private:
    void emitIndexed(const DrawBatch& batch, int mode, const std::vector<uint32_t>& indices);
    void emitPoints(const DrawBatch& batch);
    void emitColor(const DrawBatch& batch, size_t index);

    static void buildIndices(const DrawBatch& batch, std::vector<uint32_t>& indices);

private:
    Config m_config;
    Stats m_stats;

    Camera2D m_camera2d;
    bool m_using_camera2d = false;

    bool m_initialized = false;
    bool m_in_frame = false;
    bool m_window_should_close = false;

    std::vector<uint32_t> m_index_scratch;
};

} // namespace Simdraw
