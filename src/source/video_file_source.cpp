#include "video_file_source.hpp"
#include "camera.hpp"
#include "utils.hpp"

using namespace std;

VideoFileSource::VideoFileSource(const string &path)
    : path_(path)
{
}

VideoFileSource::~VideoFileSource()
{
    release();
}

bool VideoFileSource::open()
{
    if (cap_.isOpened())
        return true;

    if (!camera::openVideo(cap_, path_))
        return false;

    // Containers without an index report 0 or negative counts
    frame_count_ = max(0, static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_COUNT)));
    fps_ = max(0.0, cap_.get(cv::CAP_PROP_FPS));

    log_debug("Opened video " + log_string_src(path_) + ": " + log_string(frame_count_) + " frames @ " + formatDecimal(fps_, 2) + " fps");
    return true;
}

bool VideoFileSource::read(cv::Mat &frame)
{
    if (!cap_.isOpened())
        return false;
    return camera::readFrame(cap_, frame);
}

void VideoFileSource::release()
{
    if (cap_.isOpened())
        cap_.release();
}

VideoFactory VideoFileSource::factory()
{
    return [](const string &path)
    {
        return make_unique<VideoFileSource>(path);
    };
}
