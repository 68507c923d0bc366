#include "camera_source.hpp"
#include "camera.hpp"
#include "utils.hpp"

using namespace std;

CameraSource::CameraSource(const string &source, int width, int height, int fps)
    : source_(source), width_(width), height_(height), fps_(fps)
{
}

CameraSource::~CameraSource()
{
    release();
}

bool CameraSource::open()
{
    if (cap_.isOpened())
        return true;

    if (!camera::openCamera(cap_, source_, width_, height_, fps_))
        return false;

    log_info("Camera " + log_string_src(source_) + " opened at " + log_string(width_) + "x" + log_string(height_));
    return true;
}

bool CameraSource::read(cv::Mat &frame)
{
    if (!cap_.isOpened())
        return false;
    return camera::readFrame(cap_, frame);
}

void CameraSource::release()
{
    if (cap_.isOpened())
    {
        cap_.release();
        log_info("Camera " + log_string_src(source_) + " released");
    }
}

CameraFactory CameraSource::factory(const string &source, int width, int height, int fps)
{
    return [source, width, height, fps]()
    {
        return make_unique<CameraSource>(source, width, height, fps);
    };
}
