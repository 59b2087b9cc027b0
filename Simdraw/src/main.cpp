// Simdraw/src/main.cpp
#include <Core/Viewer.hpp>
#include <Utils/Logger.hpp>
#include <Utils/Config.hpp>
#include <Constants.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace Simdraw;

void printBanner() {
    std::cout << R"(
===============================================================================
                           SIMDRAW GEOMETRY VIEWER
===============================================================================
    )" << std::endl;
}

void printVersion() {
    std::cout << "Simdraw Geometry Viewer\n";
    std::cout << "Version: " << VERSION_STRING << "\n";
    std::cout << "Build Date: " << __DATE__ << " " << __TIME__ << "\n";

#if defined(__linux__)
    std::cout << "Platform: Linux\n";
#elif defined(__APPLE__)
    std::cout << "Platform: macOS\n";
#else
    std::cout << "Platform: Unknown\n";
#endif
}

void printStartupInfo(const Config& config) {
    std::cout << "\n===============================================================================\n";
    std::cout << "                            VIEWER CONFIGURATION\n";
    std::cout << "===============================================================================\n";

    std::cout << "Graphics:\n";
    std::cout << "  Resolution: " << config.renderer().window_width
              << "x" << config.renderer().window_height << "\n";
    std::cout << "  Target FPS: " << config.renderer().target_fps << "\n";
    std::cout << "  VSync: " << (config.renderer().enable_vsync ? "Enabled" : "Disabled") << "\n";
    std::cout << "  Antialiasing: " << (config.renderer().enable_antialiasing ? "Enabled" : "Disabled") << "\n";

    std::cout << "\nGeometry:\n";
    std::cout << "  Chord Length: " << config.tessellation().chord_length << "\n";
    std::cout << "  Grid Spacing: " << config.tessellation().grid_spacing << "\n";

    std::cout << "\nLogging:\n";
    std::cout << "  Log Level: " << config.logging().log_level << "\n";
    if (config.logging().log_to_file) {
        std::cout << "  Log File: " << config.logging().log_file << "\n";
    }
    std::cout << "===============================================================================\n";
    std::cout << "Press Ctrl+C or close the window to stop\n";
}

int main(int argc, char* argv[]) {
    try {
        // Options handled before the configuration is parsed
        std::vector<std::string> args;
        bool print_config = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                Config::printUsage(argv[0]);
                return 0;
            }
            else if (arg == "--version" || arg == "-v") {
                printVersion();
                return 0;
            }
            else if (arg == "--print-config") {
                print_config = true;
            }
            else {
                args.push_back(arg);
            }
        }

        Config config;
        if (!config.parseArguments(args)) {
            Config::printUsage(argv[0]);
            return 1;
        }

        if (print_config) {
            std::cout << config.saveToJson();
            return 0;
        }

        printBanner();

        if (!Logger::initialize(config.toLoggerConfig())) {
            std::cerr << "Failed to initialize logging system" << std::endl;
            return 1;
        }

        Viewer viewer(config);

        std::cout << "Initializing viewer..." << std::endl;
        if (!viewer.initialize()) {
            std::cerr << "Failed to initialize viewer" << std::endl;
            Logger::shutdown();
            return 1;
        }

        printStartupInfo(config);

        Logger::info("Simdraw viewer starting up");
        viewer.run();
        Logger::info(viewer.getStatusReport());

        viewer.shutdown();

        std::cout << "\nViewer stopped." << std::endl;
        Logger::info("Simdraw viewer stopped normally");
        Logger::shutdown();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }
}
