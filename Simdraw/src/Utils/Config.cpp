// Simdraw/src/Utils/Config.cpp
#include <Utils/Config.hpp>
#include <Constants.hpp>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Simdraw {

namespace {

bool parseUnsigned(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > UINT32_MAX) {
            return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseFloat(const std::string& text, float& out) {
    try {
        size_t consumed = 0;
        float value = std::stof(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

const char* boolString(bool value) {
    return value ? "true" : "false";
}

} // namespace

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    m_renderer = RendererConfig{};
    m_tessellation = TessellationConfig{};
    m_worker = WorkerConfig{};
    m_logging = LoggingConfig{};
    m_parse_errors.clear();
}

std::string Config::saveToJson() const {
    std::stringstream ss;
    ss << "{\n";
    ss << "  \"renderer\": {\n";
    ss << "    \"window_width\": " << m_renderer.window_width << ",\n";
    ss << "    \"window_height\": " << m_renderer.window_height << ",\n";
    ss << "    \"target_fps\": " << m_renderer.target_fps << ",\n";
    ss << "    \"enable_vsync\": " << boolString(m_renderer.enable_vsync) << ",\n";
    ss << "    \"enable_antialiasing\": " << boolString(m_renderer.enable_antialiasing) << ",\n";
    ss << "    \"hidden\": " << boolString(m_renderer.hidden) << ",\n";
    ss << "    \"window_title\": \"" << m_renderer.window_title << "\"\n";
    ss << "  },\n";
    ss << "  \"tessellation\": {\n";
    ss << "    \"chord_length\": " << m_tessellation.chord_length << ",\n";
    ss << "    \"max_angle_step\": " << m_tessellation.max_angle_step << ",\n";
    ss << "    \"min_radius\": " << m_tessellation.min_radius << ",\n";
    ss << "    \"grid_spacing\": " << m_tessellation.grid_spacing << ",\n";
    ss << "    \"max_curve_segments\": " << m_tessellation.max_curve_segments << "\n";
    ss << "  },\n";
    ss << "  \"worker\": {\n";
    ss << "    \"stats_interval_ms\": " << m_worker.stats_interval_ms << ",\n";
    ss << "    \"enable_stats_worker\": " << boolString(m_worker.enable_stats_worker) << "\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"log_level\": \"" << m_logging.log_level << "\",\n";
    ss << "    \"log_file\": \"" << m_logging.log_file << "\",\n";
    ss << "    \"log_to_console\": " << boolString(m_logging.log_to_console) << ",\n";
    ss << "    \"log_to_file\": " << boolString(m_logging.log_to_file) << "\n";
    ss << "  }\n";
    ss << "}\n";
    return ss.str();
}

bool Config::parseCommandLine(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseArguments(args);
}

bool Config::parseArguments(const std::vector<std::string>& args) {
    m_parse_errors.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Boolean flags (no value)
        if (arg == "--hidden") {
            m_renderer.hidden = true;
            continue;
        }
        if (arg == "--no-vsync") {
            m_renderer.enable_vsync = false;
            continue;
        }
        if (arg == "--no-antialiasing") {
            m_renderer.enable_antialiasing = false;
            continue;
        }
        if (arg == "--no-log-file") {
            m_logging.log_to_file = false;
            continue;
        }
        if (arg == "--no-stats") {
            m_worker.enable_stats_worker = false;
            continue;
        }
        if (arg == "--debug") {
            m_logging.log_level = "debug";
            continue;
        }

        bool takes_value = arg == "--width" || arg == "--height" || arg == "--fps" ||
                           arg == "--title" || arg == "--grid-spacing" || arg == "--chord-length" ||
                           arg == "--stats-interval" || arg == "--log-level" || arg == "--log-file";
        if (!takes_value) {
            m_parse_errors.push_back("Unknown option: " + arg);
            continue;
        }

        if (i + 1 >= args.size()) {
            m_parse_errors.push_back("Missing value for " + arg);
            break;
        }
        const std::string& value = args[++i];

        bool ok = true;
        if (arg == "--width") {
            ok = parseUnsigned(value, m_renderer.window_width);
        }
        else if (arg == "--height") {
            ok = parseUnsigned(value, m_renderer.window_height);
        }
        else if (arg == "--fps") {
            ok = parseUnsigned(value, m_renderer.target_fps);
        }
        else if (arg == "--title") {
            m_renderer.window_title = value;
        }
        else if (arg == "--grid-spacing") {
            ok = parseFloat(value, m_tessellation.grid_spacing);
        }
        else if (arg == "--chord-length") {
            ok = parseFloat(value, m_tessellation.chord_length);
        }
        else if (arg == "--stats-interval") {
            ok = parseUnsigned(value, m_worker.stats_interval_ms);
        }
        else if (arg == "--log-level") {
            m_logging.log_level = value;
        }
        else if (arg == "--log-file") {
            m_logging.log_file = value;
        }

        if (!ok) {
            m_parse_errors.push_back("Invalid value for " + arg + ": " + value);
        }
    }

    if (!m_parse_errors.empty()) {
        std::cerr << "Command line errors:\n";
        for (const auto& error : m_parse_errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return validate();
}

void Config::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n\n";
    std::cout << "Graphics Options:\n";
    std::cout << "  --width <pixels>       Window width (default: " << Defaults::WINDOW_WIDTH << ")\n";
    std::cout << "  --height <pixels>      Window height (default: " << Defaults::WINDOW_HEIGHT << ")\n";
    std::cout << "  --fps <rate>           Target FPS (default: " << Defaults::TARGET_FPS << ")\n";
    std::cout << "  --title <text>         Window title\n";
    std::cout << "  --hidden               Start hidden\n";
    std::cout << "  --no-vsync             Disable VSync\n";
    std::cout << "  --no-antialiasing      Disable MSAA\n\n";

    std::cout << "Geometry Options:\n";
    std::cout << "  --grid-spacing <units> Grid spacing (default: " << Defaults::GRID_SPACING << ")\n";
    std::cout << "  --chord-length <units> Target curve segment length (default: "
              << Defaults::CHORD_LENGTH << ")\n\n";

    std::cout << "Worker Options:\n";
    std::cout << "  --stats-interval <ms>  Statistics report interval (default: "
              << Defaults::STATS_INTERVAL_MS << ")\n";
    std::cout << "  --no-stats             Disable the statistics worker\n\n";

    std::cout << "Logging Options:\n";
    std::cout << "  --log-level <level>    Log level (debug|info|warning|error)\n";
    std::cout << "  --log-file <path>      Log file path\n";
    std::cout << "  --no-log-file          Log to console only\n";
    std::cout << "  --debug                Enable debug logging\n\n";

    std::cout << "General:\n";
    std::cout << "  --print-config         Print the effective configuration and exit\n";
    std::cout << "  --version              Print version and exit\n";
    std::cout << "  --help                 Show this help\n";
}

bool Config::validate() const {
    std::vector<std::string> errors = getValidationErrors();

    if (!errors.empty()) {
        std::cerr << "Configuration validation errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

std::vector<std::string> Config::getValidationErrors() const {
    std::vector<std::string> errors;

    // Renderer validation
    if (m_renderer.window_width < Limits::MIN_WINDOW_WIDTH ||
        m_renderer.window_height < Limits::MIN_WINDOW_HEIGHT) {
        errors.push_back("Window size must be at least " + std::to_string(Limits::MIN_WINDOW_WIDTH) +
                         "x" + std::to_string(Limits::MIN_WINDOW_HEIGHT));
    }

    if (m_renderer.target_fps < Limits::MIN_FPS || m_renderer.target_fps > Limits::MAX_FPS) {
        errors.push_back("Target FPS must be between " + std::to_string(Limits::MIN_FPS) +
                         " and " + std::to_string(Limits::MAX_FPS));
    }

    // Tessellation validation
    if (!std::isfinite(m_tessellation.chord_length) || m_tessellation.chord_length <= 0.0f) {
        errors.push_back("Chord length must be positive");
    }

    if (!std::isfinite(m_tessellation.max_angle_step) || m_tessellation.max_angle_step <= 0.0f ||
        m_tessellation.max_angle_step > Angles::HALF_TURN) {
        errors.push_back("Max angle step must be in (0, pi]");
    }

    if (!std::isfinite(m_tessellation.min_radius) || m_tessellation.min_radius <= 0.0f) {
        errors.push_back("Min radius must be positive");
    }

    if (!std::isfinite(m_tessellation.grid_spacing) ||
        m_tessellation.grid_spacing < Limits::MIN_GRID_SPACING) {
        errors.push_back("Grid spacing must be at least " +
                         std::to_string(Limits::MIN_GRID_SPACING));
    }

    if (m_tessellation.max_curve_segments == 0 ||
        m_tessellation.max_curve_segments > Limits::MAX_CURVE_SEGMENTS) {
        errors.push_back("Max curve segments must be between 1 and " +
                         std::to_string(Limits::MAX_CURVE_SEGMENTS));
    }

    // Worker validation
    if (m_worker.stats_interval_ms == 0) {
        errors.push_back("Stats interval must be at least 1ms");
    }

    // Logging validation
    Logger::Level level;
    if (!Logger::parseLevel(m_logging.log_level, level)) {
        errors.push_back("Invalid log level: " + m_logging.log_level);
    }

    if (m_logging.log_to_file && m_logging.log_file.empty()) {
        errors.push_back("Log file path must not be empty");
    }

    return errors;
}

TessellationSettings Config::toTessellationSettings() const {
    TessellationSettings settings;
    settings.chord_length = m_tessellation.chord_length;
    settings.max_angle_step = m_tessellation.max_angle_step;
    settings.min_radius = m_tessellation.min_radius;
    settings.grid_spacing = m_tessellation.grid_spacing;
    settings.max_segments = m_tessellation.max_curve_segments;
    return settings;
}

Logger::Config Config::toLoggerConfig() const {
    Logger::Config logger_config;
    if (!Logger::parseLevel(m_logging.log_level, logger_config.log_level)) {
        logger_config.log_level = Logger::Level::Info;
    }
    logger_config.log_to_console = m_logging.log_to_console;
    logger_config.log_to_file = m_logging.log_to_file;
    logger_config.log_file = m_logging.log_file;
    logger_config.max_file_size_mb = m_logging.max_log_file_size_mb;
    logger_config.max_backup_files = m_logging.max_backup_files;
    return logger_config;
}

std::string Config::getConfigSummary() const {
    std::stringstream ss;
    ss << "Configuration Summary:\n";
    ss << "  Graphics: " << m_renderer.window_width << "x" << m_renderer.window_height
       << " @ " << m_renderer.target_fps << "fps";
    if (m_renderer.hidden) {
        ss << " (hidden)";
    }
    ss << "\n";
    ss << "  Geometry: chord " << m_tessellation.chord_length
       << ", grid " << m_tessellation.grid_spacing << "\n";
    ss << "  Worker: ";
    if (m_worker.enable_stats_worker) {
        ss << "stats every " << m_worker.stats_interval_ms << "ms\n";
    } else {
        ss << "disabled\n";
    }
    ss << "  Logging: " << m_logging.log_level;
    if (m_logging.log_to_file) {
        ss << " -> " << m_logging.log_file;
    }
    ss << "\n";
    return ss.str();
}

// ConfigBuilder implementation
ConfigBuilder::ConfigBuilder() {
    m_config.setDefaults();
}

ConfigBuilder& ConfigBuilder::withWindowSize(uint32_t width, uint32_t height) {
    m_config.m_renderer.window_width = width;
    m_config.m_renderer.window_height = height;
    return *this;
}

ConfigBuilder& ConfigBuilder::withTargetFPS(uint32_t fps) {
    m_config.m_renderer.target_fps = fps;
    return *this;
}

ConfigBuilder& ConfigBuilder::withWindowTitle(const std::string& title) {
    m_config.m_renderer.window_title = title;
    return *this;
}

ConfigBuilder& ConfigBuilder::withBackground(const Color& color) {
    m_config.m_renderer.background = color;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableVSync(bool enabled) {
    m_config.m_renderer.enable_vsync = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableAntialiasing(bool enabled) {
    m_config.m_renderer.enable_antialiasing = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableHiddenWindow(bool enabled) {
    m_config.m_renderer.hidden = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::withChordLength(float length) {
    m_config.m_tessellation.chord_length = length;
    return *this;
}

ConfigBuilder& ConfigBuilder::withMaxAngleStep(float radians) {
    m_config.m_tessellation.max_angle_step = radians;
    return *this;
}

ConfigBuilder& ConfigBuilder::withGridSpacing(float spacing) {
    m_config.m_tessellation.grid_spacing = spacing;
    return *this;
}

ConfigBuilder& ConfigBuilder::withStatsInterval(uint32_t interval_ms) {
    m_config.m_worker.stats_interval_ms = interval_ms;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableStatsWorker(bool enabled) {
    m_config.m_worker.enable_stats_worker = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::withLogLevel(const std::string& level) {
    m_config.m_logging.log_level = level;
    return *this;
}

ConfigBuilder& ConfigBuilder::withLogFile(const std::string& filename) {
    m_config.m_logging.log_file = filename;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableConsoleLogging(bool enabled) {
    m_config.m_logging.log_to_console = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableFileLogging(bool enabled) {
    m_config.m_logging.log_to_file = enabled;
    return *this;
}

Config ConfigBuilder::build() const {
    return m_config;
}

} // namespace Simdraw
