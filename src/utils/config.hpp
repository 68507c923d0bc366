#pragma once
#include <string>

// Runtime configuration, filled from command line flags in main()
struct DoorwatchConfig
{
    // HTTP service
    int port = 5000;

    // Live camera
    std::string camera_source = "0"; // Device index, device path, stream URL or video file
    int width = 640;
    int height = 480;
    int fps = 30;

    // Detection
    double threshold = 5.0; // Initial change percentage separating CLOSED from OPEN

    // Uploads and encoding
    std::string upload_dir = "uploads";
    int jpeg_quality = 80;

    // Logging
    std::string log_file = ""; // Empty = console only
    bool timestamps = false;   // Prefix console lines with HH:MM:SS.mmm
    bool debug_mode = false;
    bool quiet_mode = false;
};
