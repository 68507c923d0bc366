#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include "config.hpp"
#include "logging.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print the effective configuration
    inline void printConfig(const DoorwatchConfig &config)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Port: " << config.port << "\n";
        std::cout << "  - Camera: " << config.camera_source << "\n";
        std::cout << "  - Resolution: " << config.width << "x" << config.height << "\n";
        std::cout << "  - FPS: " << config.fps << "\n";
        std::cout << "  - Threshold: " << config.threshold << "%\n";
        std::cout << "  - Uploads: " << config.upload_dir << "\n";
        std::cout << "  - JPEG quality: " << config.jpeg_quality << "\n";
        if (!config.log_file.empty())
            std::cout << "  - Log file: " << config.log_file << "\n";
        if (config.timestamps)
            std::cout << "  - Console timestamps: on\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "OpenDoorwatch runtime version: " << version << std::endl;
        std::exit(0);
    }

    inline void printHelpAndExit()
    {
        std::cout << "Usage: opendoorwatch [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --port <port>          HTTP port (default: 5000)\n";
        std::cout << "  --camera <source>      Camera index, device path or stream URL (default: 0)\n";
        std::cout << "  --width <width>        Capture width (default: 640)\n";
        std::cout << "  --height <height>      Capture height (default: 480)\n";
        std::cout << "  --fps <fps>            Capture frames per second (default: 30)\n";
        std::cout << "  --threshold <percent>  Initial change threshold, 1.0 - 15.0 (default: 5.0)\n";
        std::cout << "  --uploads <dir>        Directory for uploaded videos (default: uploads)\n";
        std::cout << "  --jpeg-quality <q>     JPEG quality for streamed frames (default: 80)\n";
        std::cout << "  --log-file <path>      Also append log lines to this file\n";
        std::cout << "  --timestamps           Prefix console log lines with the time\n";
        std::cout << "  --debug, -d            Show all log messages\n";
        std::cout << "  --quiet, -q            Quiet mode (only show errors)\n";
        std::cout << "  --version              Show version information\n";
        std::cout << "  --help                 Show this help message\n";
        std::exit(0);
    }

} // namespace debug
