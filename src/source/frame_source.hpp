#pragma once
#include <functional>
#include <memory>
#include <string>
#include <opencv2/opencv.hpp>

// Anything that produces BGR frames one at a time: a camera, a recorded video, a test stub
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // Acquire the underlying device or file
    virtual bool open() = 0;

    virtual bool isOpened() const = 0;

    // Next frame; false means end of stream or a hardware/decoding error
    virtual bool read(cv::Mat &frame) = 0;

    // Give the device or file back; safe to call more than once
    virtual void release() = 0;
};

// A finite source with known length and rate
class VideoSource : public FrameSource
{
public:
    virtual int frameCount() const = 0;
    virtual double fps() const = 0;
};

using CameraFactory = std::function<std::unique_ptr<FrameSource>()>;
using VideoFactory = std::function<std::unique_ptr<VideoSource>(const std::string &path)>;
