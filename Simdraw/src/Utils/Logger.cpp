// Simdraw/src/Utils/Logger.cpp
#include <Utils/Logger.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <chrono>
#include <ctime>

namespace Simdraw {

// Static members
std::unique_ptr<Logger> Logger::s_instance;
std::mutex Logger::s_instance_mutex;

Logger& Logger::getInstance() {
    std::lock_guard<std::mutex> lock(s_instance_mutex);
    if (!s_instance) {
        s_instance = std::unique_ptr<Logger>(new Logger());
    }
    return *s_instance;
}

bool Logger::initialize(const Config& config) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);

    if (instance.m_initialized) {
        return true; // Already initialized
    }

    instance.m_config = config;

    if (config.log_to_file) {
        try {
            std::filesystem::path log_path(config.log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            instance.m_log_file.open(config.log_file, std::ios::app);
            if (!instance.m_log_file.is_open()) {
                std::cerr << "Failed to open log file: " << config.log_file << std::endl;
                return false;
            }
            instance.m_current_file_size = static_cast<size_t>(
                std::filesystem::file_size(log_path));
        } catch (const std::exception& e) {
            std::cerr << "Exception opening log file: " << e.what() << std::endl;
            return false;
        }
    }

    instance.m_initialized = true;
    instance.write(Level::Info, "Logger initialized");

    return true;
}

void Logger::shutdown() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);

    if (!instance.m_initialized) {
        return;
    }

    instance.write(Level::Info, "Logger shutting down");

    if (instance.m_log_file.is_open()) {
        instance.m_log_file.close();
    }

    instance.m_initialized = false;
}

bool Logger::isInitialized() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);
    return instance.m_initialized;
}

void Logger::setLevel(Level level) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);
    instance.m_config.log_level = level;
}

Logger::Level Logger::getLevel() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);
    return instance.m_config.log_level;
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    if (name == "debug") {
        level = Level::Debug;
    } else if (name == "info") {
        level = Level::Info;
    } else if (name == "warning") {
        level = Level::Warning;
    } else if (name == "error") {
        level = Level::Error;
    } else {
        return false;
    }
    return true;
}

void Logger::debug(const std::string& message) {
    getInstance().log(Level::Debug, message);
}

void Logger::info(const std::string& message) {
    getInstance().log(Level::Info, message);
}

void Logger::warning(const std::string& message) {
    getInstance().log(Level::Warning, message);
}

void Logger::error(const std::string& message) {
    getInstance().log(Level::Error, message);
}

void Logger::flush() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);

    if (instance.m_log_file.is_open()) {
        instance.m_log_file.flush();
    }

    if (instance.m_config.log_to_console) {
        std::cout.flush();
        std::cerr.flush();
    }
}

void Logger::rotateLogs() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.m_log_mutex);
    instance.rotateLocked();
}

Logger::~Logger() {
    if (m_log_file.is_open()) {
        m_log_file.close();
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_log_mutex);
    write(level, message);
}

void Logger::write(Level level, const std::string& message) {
    if (!m_initialized || level < m_config.log_level) {
        return;
    }

    std::string formatted_message = getCurrentTimestamp() + " [" + levelToString(level) + "] " + message;

    if (m_config.log_to_console) {
        writeToConsole(level, formatted_message);
    }

    if (m_config.log_to_file && m_log_file.is_open()) {
        writeToFile(formatted_message);
    }

    if (m_config.flush_immediately) {
        if (m_log_file.is_open()) {
            m_log_file.flush();
        }
        if (m_config.log_to_console) {
            std::cout.flush();
        }
    }

    if (m_config.log_to_file &&
        m_current_file_size > m_config.max_file_size_mb * 1024 * 1024) {
        rotateLocked();
    }
}

void Logger::rotateLocked() {
    if (!m_config.log_to_file || !m_log_file.is_open()) {
        return;
    }

    if (m_current_file_size < m_config.max_file_size_mb * 1024 * 1024) {
        return; // File not large enough to rotate
    }

    m_log_file.close();

    try {
        std::filesystem::path log_path(m_config.log_file);
        std::filesystem::path dir = log_path.parent_path();
        std::string base_name = log_path.stem().string();
        std::string extension = log_path.extension().string();

        auto backup_path = [&](uint32_t index) {
            return dir / (base_name + "." + std::to_string(index) + extension);
        };

        // Shift backups up by one, dropping the oldest
        for (uint32_t i = m_config.max_backup_files; i > 0; --i) {
            std::filesystem::path old_file = backup_path(i);
            if (!std::filesystem::exists(old_file)) {
                continue;
            }
            if (i == m_config.max_backup_files) {
                std::filesystem::remove(old_file);
            } else {
                std::filesystem::rename(old_file, backup_path(i + 1));
            }
        }

        if (m_config.max_backup_files > 0) {
            std::filesystem::rename(log_path, backup_path(1));
        } else {
            std::filesystem::remove(log_path);
        }

        m_log_file.open(m_config.log_file, std::ios::app);
        m_current_file_size = 0;

        write(Level::Info, "Log file rotated");

    } catch (const std::exception& e) {
        std::cerr << "Failed to rotate log file: " << e.what() << std::endl;
        m_log_file.open(m_config.log_file, std::ios::app);
    }
}

std::string Logger::levelToString(Level level) const {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::stringstream ss;
    ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

void Logger::writeToConsole(Level level, const std::string& message) {
    // Use cerr for warnings and errors, cout for others
    if (level >= Level::Warning) {
        std::cerr << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}

void Logger::writeToFile(const std::string& message) {
    m_log_file << message << '\n';
    m_current_file_size += message.length() + 1; // +1 for newline
}

} // namespace Simdraw
