// Simdraw/src/Core/RaylibSurface.cpp
#include <Core/RaylibSurface.hpp>
#include <Utils/Logger.hpp>
#include <algorithm>

#include <raylib.h>
#include <rlgl.h>

namespace Simdraw {

namespace {

// Vertices per rlBegin/rlEnd block; divisible by 2, 3 and 6
constexpr size_t VERTICES_PER_BLOCK = 1020;

::Color toRaylibColor(const Color& color) {
    auto channel = [](float value) {
        return static_cast<unsigned char>(std::clamp(value, 0.0f, 1.0f) * 255.0f + 0.5f);
    };
    return ::Color{channel(color.r), channel(color.g), channel(color.b), channel(color.a)};
}

} // namespace

RaylibSurface::RaylibSurface(const Config& config)
    : m_config(config) {

    m_camera2d = Camera2D{};
    m_camera2d.target = {0.0f, 0.0f};
    m_camera2d.offset = {0.0f, 0.0f};
    m_camera2d.rotation = 0.0f;
    m_camera2d.zoom = 1.0f;

    Logger::info("RaylibSurface created with {}x{} resolution",
                 m_config.window_width, m_config.window_height);
}

RaylibSurface::~RaylibSurface() {
    if (m_initialized) {
        shutdown();
    }
}

bool RaylibSurface::initialize() {
    if (m_initialized) {
        Logger::warning("RaylibSurface already initialized");
        return true;
    }

    Logger::info("Initializing RaylibSurface...");

    unsigned int flags = 0;

    if (m_config.enable_antialiasing) {
        flags |= FLAG_MSAA_4X_HINT;
    }

    if (m_config.enable_vsync) {
        flags |= FLAG_VSYNC_HINT;
    }

    if (m_config.hidden) {
        flags |= FLAG_WINDOW_HIDDEN;
    }

    SetConfigFlags(flags);

    InitWindow(static_cast<int>(m_config.window_width), static_cast<int>(m_config.window_height),
               m_config.window_title.c_str());

    if (!IsWindowReady()) {
        Logger::error("Failed to create raylib window");
        return false;
    }

    SetTargetFPS(static_cast<int>(m_config.target_fps));

    m_initialized = true;
    m_window_should_close = false;

    Logger::info("RaylibSurface initialized successfully");
    Logger::info("Raylib version: {}", RAYLIB_VERSION);

    return true;
}

void RaylibSurface::shutdown() {
    if (!m_initialized) {
        return;
    }

    Logger::info("Shutting down RaylibSurface...");

    if (m_in_frame) {
        endFrame();
    }

    if (IsWindowReady()) {
        CloseWindow();
    }

    m_initialized = false;
    Logger::info("RaylibSurface shutdown complete");
}

void RaylibSurface::beginFrame() {
    if (!m_initialized || m_in_frame) {
        return;
    }

    BeginDrawing();
    ClearBackground(toRaylibColor(m_config.background));

    if (m_using_camera2d) {
        BeginMode2D(m_camera2d);
    }

    // Fans and polygons arrive in either winding
    rlDisableBackfaceCulling();

    m_in_frame = true;
}

void RaylibSurface::endFrame() {
    if (!m_initialized || !m_in_frame) {
        return;
    }

    rlDrawRenderBatchActive();
    rlEnableBackfaceCulling();

    if (m_using_camera2d) {
        EndMode2D();
    }

    EndDrawing();
    m_in_frame = false;

    m_stats.current_fps = static_cast<float>(GetFPS());
    m_stats.frame_time_ms = GetFrameTime() * 1000.0f;
    m_stats.frames_rendered++;

    m_window_should_close = WindowShouldClose();
}

bool RaylibSurface::shouldClose() const {
    return m_window_should_close;
}

ErrorCode RaylibSurface::submit(const DrawBatch& batch) {
    ErrorCode result = batch.validate();
    if (result != ErrorCode::SUCCESS) {
        m_stats.batches_rejected++;
        return result;
    }

    if (!m_in_frame) {
        Logger::warning("Dropping {} batch submitted outside a frame", primitiveKindToString(batch.kind));
        m_stats.batches_rejected++;
        return ErrorCode::SURFACE_NOT_READY;
    }

    if (batch.isEmpty()) {
        return ErrorCode::SUCCESS;
    }

    switch (batch.kind) {
        case PrimitiveKind::POINTS:
            emitPoints(batch);
            break;

        case PrimitiveKind::LINES:
        case PrimitiveKind::LINE_LOOP:
            buildIndices(batch, m_index_scratch);
            emitIndexed(batch, RL_LINES, m_index_scratch);
            break;

        case PrimitiveKind::TRIANGLE_FAN:
        case PrimitiveKind::POLYGON:
        case PrimitiveKind::QUADS:
            buildIndices(batch, m_index_scratch);
            emitIndexed(batch, RL_TRIANGLES, m_index_scratch);
            break;
    }

    m_stats.batches_drawn++;
    m_stats.vertices_drawn += batch.vertexCount();
    return ErrorCode::SUCCESS;
}

void RaylibSurface::setCamera(const Point& target, float zoom) {
    m_camera2d.target = {target.x, target.y};
    m_camera2d.zoom = zoom;
    m_using_camera2d = true;
}

void RaylibSurface::resetCamera() {
    m_camera2d.target = {0.0f, 0.0f};
    m_camera2d.zoom = 1.0f;
    m_using_camera2d = false;
}

void RaylibSurface::resetStats() {
    m_stats = Stats{};
    Logger::debug("RaylibSurface statistics reset");
}

// Private methods implementation

void RaylibSurface::buildIndices(const DrawBatch& batch, std::vector<uint32_t>& indices) {
    indices.clear();
    uint32_t n = static_cast<uint32_t>(batch.vertexCount());

    switch (batch.kind) {
        case PrimitiveKind::LINES:
            for (uint32_t i = 0; i + 1 < n; i += 2) {
                indices.insert(indices.end(), {i, i + 1});
            }
            break;

        case PrimitiveKind::LINE_LOOP:
            if (n >= 2) {
                for (uint32_t i = 0; i < n; ++i) {
                    indices.insert(indices.end(), {i, (i + 1) % n});
                }
            }
            break;

        case PrimitiveKind::TRIANGLE_FAN:
        case PrimitiveKind::POLYGON:
            for (uint32_t i = 1; i + 1 < n; ++i) {
                indices.insert(indices.end(), {0u, i, i + 1});
            }
            break;

        case PrimitiveKind::QUADS:
            for (uint32_t i = 0; i + 3 < n; i += 4) {
                indices.insert(indices.end(), {i, i + 1, i + 2, i, i + 2, i + 3});
            }
            break;

        case PrimitiveKind::POINTS:
            break;
    }
}

void RaylibSurface::emitIndexed(const DrawBatch& batch, int mode, const std::vector<uint32_t>& indices) {
    for (size_t start = 0; start < indices.size(); start += VERTICES_PER_BLOCK) {
        size_t count = std::min(VERTICES_PER_BLOCK, indices.size() - start);

        rlCheckRenderBatchLimit(static_cast<int>(count));
        rlBegin(mode);

        for (size_t k = 0; k < count; ++k) {
            uint32_t index = indices[start + k];
            emitColor(batch, index);
            rlVertex2f(batch.vertices[index * 2], batch.vertices[index * 2 + 1]);
        }

        rlEnd();
    }
}

void RaylibSurface::emitPoints(const DrawBatch& batch) {
    // Points are rendered as small quads
    const float size = m_config.point_size;
    const size_t per_block = VERTICES_PER_BLOCK / 6;

    for (size_t start = 0; start < batch.vertexCount(); start += per_block) {
        size_t end = std::min(start + per_block, batch.vertexCount());

        rlCheckRenderBatchLimit(static_cast<int>((end - start) * 6));
        rlBegin(RL_TRIANGLES);

        for (size_t i = start; i < end; ++i) {
            Point p = batch.vertex(i);
            emitColor(batch, i);

            rlVertex2f(p.x, p.y);
            rlVertex2f(p.x, p.y + size);
            rlVertex2f(p.x + size, p.y + size);

            rlVertex2f(p.x, p.y);
            rlVertex2f(p.x + size, p.y + size);
            rlVertex2f(p.x + size, p.y);
        }

        rlEnd();
    }
}

void RaylibSurface::emitColor(const DrawBatch& batch, size_t index) {
    if (batch.hasColors()) {
        rlColor4f(batch.colors[index * 4], batch.colors[index * 4 + 1],
                  batch.colors[index * 4 + 2], batch.colors[index * 4 + 3]);
    } else {
        const Color& color = m_config.default_color;
        rlColor4f(color.r, color.g, color.b, color.a);
    }
}

} // namespace Simdraw
