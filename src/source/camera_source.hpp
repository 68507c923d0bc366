#pragma once
#include <string>
#include <opencv2/opencv.hpp>
#include "frame_source.hpp"

// Live camera backed by cv::VideoCapture
class CameraSource : public FrameSource
{
public:
    CameraSource(const std::string &source, int width, int height, int fps);
    ~CameraSource() override;

    bool open() override;
    bool isOpened() const override { return cap_.isOpened(); }
    bool read(cv::Mat &frame) override;
    void release() override;

    // Factory used by LiveSession to open the configured camera on every start
    static CameraFactory factory(const std::string &source, int width, int height, int fps);

private:
    std::string source_;
    int width_;
    int height_;
    int fps_;
    cv::VideoCapture cap_;
};
