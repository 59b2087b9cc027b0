// Simdraw/include/Utils/Config.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <Geometry/ShapeTessellator.hpp>
#include <Utils/Logger.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Simdraw {

/**
 * @brief Configuration for the viewer and the geometry layer
 */
class Config {
public:
    struct RendererConfig {
        uint32_t window_width = Defaults::WINDOW_WIDTH;
        uint32_t window_height = Defaults::WINDOW_HEIGHT;
        uint32_t target_fps = Defaults::TARGET_FPS;
        bool enable_vsync = true;
        bool enable_antialiasing = true;
        bool hidden = false;
        std::string window_title = Defaults::WINDOW_TITLE;
        Color background = Color::Black;
    };

    struct TessellationConfig {
        float chord_length = Defaults::CHORD_LENGTH;
        float max_angle_step = Defaults::MAX_ANGLE_STEP;
        float min_radius = Defaults::MIN_RADIUS;
        float grid_spacing = Defaults::GRID_SPACING;
        uint32_t max_curve_segments = Limits::MAX_CURVE_SEGMENTS;
    };

    struct WorkerConfig {
        uint32_t stats_interval_ms = Defaults::STATS_INTERVAL_MS;
        bool enable_stats_worker = true;
    };

    struct LoggingConfig {
        std::string log_level = "info";
        std::string log_file = Defaults::LOG_FILE;
        bool log_to_console = true;
        bool log_to_file = true;
        size_t max_log_file_size_mb = 100;
        uint32_t max_backup_files = 5;
    };

public:
    Config();
    ~Config() = default;

    // Command line parsing
    bool parseCommandLine(int argc, char* argv[]);
    bool parseArguments(const std::vector<std::string>& args);
    const std::vector<std::string>& getParseErrors() const { return m_parse_errors; }
    static void printUsage(const char* program_name);

    // Configuration access
    RendererConfig& renderer() { return m_renderer; }
    const RendererConfig& renderer() const { return m_renderer; }

    TessellationConfig& tessellation() { return m_tessellation; }
    const TessellationConfig& tessellation() const { return m_tessellation; }

    WorkerConfig& worker() { return m_worker; }
    const WorkerConfig& worker() const { return m_worker; }

    LoggingConfig& logging() { return m_logging; }
    const LoggingConfig& logging() const { return m_logging; }

    // Conversions for the subsystems
    TessellationSettings toTessellationSettings() const;
    Logger::Config toLoggerConfig() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Utilities
    void setDefaults();
    std::string saveToJson() const;
    std::string getConfigSummary() const;

private:
    RendererConfig m_renderer;
    TessellationConfig m_tessellation;
    WorkerConfig m_worker;
    LoggingConfig m_logging;

    std::vector<std::string> m_parse_errors;

    friend class ConfigBuilder;
};

/**
 * @brief Builder pattern for easy configuration
 */
class ConfigBuilder {
public:
    ConfigBuilder();

    // Renderer configuration
    ConfigBuilder& withWindowSize(uint32_t width, uint32_t height);
    ConfigBuilder& withTargetFPS(uint32_t fps);
    ConfigBuilder& withWindowTitle(const std::string& title);
    ConfigBuilder& withBackground(const Color& color);
    ConfigBuilder& enableVSync(bool enabled = true);
    ConfigBuilder& enableAntialiasing(bool enabled = true);
    ConfigBuilder& enableHiddenWindow(bool enabled = true);

    // Tessellation configuration
    ConfigBuilder& withChordLength(float length);
    ConfigBuilder& withMaxAngleStep(float radians);
    ConfigBuilder& withGridSpacing(float spacing);

    // Worker configuration
    ConfigBuilder& withStatsInterval(uint32_t interval_ms);
    ConfigBuilder& enableStatsWorker(bool enabled = true);

    // Logging configuration
    ConfigBuilder& withLogLevel(const std::string& level);
    ConfigBuilder& withLogFile(const std::string& filename);
    ConfigBuilder& enableConsoleLogging(bool enabled = true);
    ConfigBuilder& enableFileLogging(bool enabled = true);

    // Build final configuration
    Config build() const;

private:
    Config m_config;
};

} // namespace Simdraw
