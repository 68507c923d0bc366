#pragma once
#include <string>
#include <opencv2/opencv.hpp>
#include "frame_source.hpp"

// Recorded video backed by cv::VideoCapture
class VideoFileSource : public VideoSource
{
public:
    explicit VideoFileSource(const std::string &path);
    ~VideoFileSource() override;

    bool open() override;
    bool isOpened() const override { return cap_.isOpened(); }
    bool read(cv::Mat &frame) override;
    void release() override;

    int frameCount() const override { return frame_count_; }
    double fps() const override { return fps_; }

    static VideoFactory factory();

private:
    std::string path_;
    cv::VideoCapture cap_;
    int frame_count_ = 0;
    double fps_ = 0.0;
};
