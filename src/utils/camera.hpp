#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <cctype>
#include "logging.hpp"

using namespace cv;
using namespace std;

namespace camera
{
    // Determine if a given path is a video file based on its extension
    inline bool isVideoFile(const string &path)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), ::tolower);

        const vector<string> video_extensions = {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".webm"};
        for (const auto &ext : video_extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    // "0", "1", ... select a camera by index
    inline bool isDeviceIndex(const string &source)
    {
        return !source.empty() && all_of(source.begin(), source.end(), [](unsigned char c)
                                          { return isdigit(c) != 0; });
    }

    // Decode a fourcc code to a human-readable string
    inline string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = (fourcc & 0xFF);
        code[1] = (fourcc >> 8) & 0xFF;
        code[2] = (fourcc >> 16) & 0xFF;
        code[3] = (fourcc >> 24) & 0xFF;
        code[4] = '\0';
        return string(code);
    }

    // Open a live camera (index, device path or stream URL) and request the capture format.
    // Video files are opened as-is so a recording can stand in for the camera.
    inline bool openCamera(VideoCapture &cap, const string &source, int width, int height, int fps)
    {
        log_debug("Opening camera: " + log_string_src(source));

        try
        {
            if (isVideoFile(source))
            {
                log_debug("Detected video file: " + source);
                cap.open(source);
            }
            else
            {
                if (isDeviceIndex(source))
                    cap.open(stoi(source));
                else
                    cap.open(source);

                if (cap.isOpened())
                {
                    cap.set(CAP_PROP_FRAME_WIDTH, width);
                    cap.set(CAP_PROP_FRAME_HEIGHT, height);
                    cap.set(CAP_PROP_FPS, fps);
                    int fourcc = VideoWriter::fourcc('M', 'J', 'P', 'G');
                    cap.set(CAP_PROP_FOURCC, fourcc);
                }
            }
        }
        catch (const cv::Exception &e)
        {
            log_error("OpenCV error opening " + source + ": " + string(e.what()));
            cap.release();
            return false;
        }

        if (!cap.isOpened())
        {
            log_error("Failed to open camera/video " + source);
            return false;
        }

        log_debug("Camera " + source + " verification:");
        log_debug("  Resolution: " + log_string((int)cap.get(CAP_PROP_FRAME_WIDTH)) + "x" + log_string((int)cap.get(CAP_PROP_FRAME_HEIGHT)) +
                  " (expected: " + log_string(width) + "x" + log_string(height) + ")");
        log_debug("  FPS: " + log_string((int)cap.get(CAP_PROP_FPS)) + " (expected: " + log_string(fps) + ")");
        log_debug("  FOURCC: " + log_string_src(decodeFourCC((int)cap.get(CAP_PROP_FOURCC))));
        log_debug("  Backend: " + log_string_src(cap.getBackendName()));

        return true;
    }

    // Open a recorded video for offline analysis
    inline bool openVideo(VideoCapture &cap, const string &path)
    {
        try
        {
            cap.open(path);
        }
        catch (const cv::Exception &e)
        {
            log_error("OpenCV error opening video " + path + ": " + string(e.what()));
            cap.release();
            return false;
        }

        if (!cap.isOpened())
        {
            log_warning("Could not open video " + log_string_src(path));
            return false;
        }
        return true;
    }

    // Read one frame; false on end of stream or hardware error
    inline bool readFrame(VideoCapture &cap, Mat &frame)
    {
        try
        {
            return cap.read(frame) && !frame.empty();
        }
        catch (const cv::Exception &e)
        {
            log_error("OpenCV error reading frame: " + string(e.what()));
            return false;
        }
    }

}
