// Simdraw/include/Utils/Logger.hpp
#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <sstream>
#include <utility>

namespace Simdraw {

enum class LoggerLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Defined outside Logger so Config{} can be a default argument of
// Logger::initialize (GCC rejects nested NSDMI structs there).
struct LoggerConfig {
    LoggerLevel log_level = LoggerLevel::Info;
    bool log_to_console = true;
    bool log_to_file = true;
    std::string log_file = "simdraw.log";
    bool flush_immediately = false;
    size_t max_file_size_mb = 100;
    uint32_t max_backup_files = 5;
};

/**
 * @brief Thread-safe logger with console and file output
 *
 * Messages logged before initialize() are dropped, so library code can log
 * unconditionally.
 */
class Logger {
public:
    using Level = LoggerLevel;

    using Config = LoggerConfig;

public:
    ~Logger();

    // Singleton access
    static Logger& getInstance();

    // Configuration
    static bool initialize(const Config& config = Config{});
    static void shutdown();
    static bool isInitialized();
    static void setLevel(Level level);
    static Level getLevel();
    static bool parseLevel(const std::string& name, Level& level);

    // Logging methods
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);

    // Template logging with "{}" placeholders
    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        getInstance().log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        getInstance().log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        getInstance().log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        getInstance().log(Level::Error, format, std::forward<Args>(args)...);
    }

    // Substitutes each "{}" in order; surplus arguments are ignored,
    // surplus placeholders are left as they are.
    template<typename... Args>
    static std::string formatMessage(const std::string& format, Args&&... args) {
        std::ostringstream out;
        size_t position = 0;
        (appendArgument(out, format, position, std::forward<Args>(args)), ...);
        out << format.substr(position);
        return out.str();
    }

    // File management
    static void flush();
    static void rotateLogs();

private:
    Logger() = default;

    // Internal logging
    void log(Level level, const std::string& message);

    template<typename... Args>
    void log(Level level, const std::string& format, Args&&... args) {
        if (level < getLevel()) {
            return;
        }

        log(level, formatMessage(format, std::forward<Args>(args)...));
    }

    template<typename T>
    static void appendArgument(std::ostringstream& out, const std::string& format,
                               size_t& position, T&& value) {
        size_t next = format.find("{}", position);
        if (next == std::string::npos) {
            return;
        }
        out << format.substr(position, next - position) << value;
        position = next + 2;
    }

    // Utilities (callers hold m_log_mutex)
    void write(Level level, const std::string& message);
    void rotateLocked();
    std::string levelToString(Level level) const;
    std::string getCurrentTimestamp() const;
    void writeToConsole(Level level, const std::string& message);
    void writeToFile(const std::string& message);

private:
    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_instance_mutex;

    Config m_config;
    std::ofstream m_log_file;
    std::mutex m_log_mutex;
    bool m_initialized = false;
    size_t m_current_file_size = 0;
};

// Convenience macros for common logging patterns
#define SIMDRAW_LOG_DEBUG(...) Simdraw::Logger::debug(__VA_ARGS__)
#define SIMDRAW_LOG_INFO(...) Simdraw::Logger::info(__VA_ARGS__)
#define SIMDRAW_LOG_WARNING(...) Simdraw::Logger::warning(__VA_ARGS__)
#define SIMDRAW_LOG_ERROR(...) Simdraw::Logger::error(__VA_ARGS__)

} // namespace Simdraw
