#include "live_session.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

LiveSession::LiveSession(CameraFactory camera_factory, const DetectorParams &params)
    : camera_factory_(std::move(camera_factory)), params_(params)
{
}

LiveSession::~LiveSession()
{
    stop();
}

OperationResult LiveSession::start()
{
    lock_guard<mutex> lock(mutex_);

    if (active_)
    {
        log_warning("Live detection already running");
        return OperationResult::fail(DoorError::ALREADY_ACTIVE);
    }

    unique_ptr<FrameSource> camera = camera_factory_ ? camera_factory_() : nullptr;
    if (!camera || !camera->open())
    {
        log_error("Camera not available");
        return OperationResult::fail(DoorError::CAMERA_UNAVAILABLE);
    }

    camera_ = std::move(camera);
    detector_ = make_shared<DoorDetector>(params_);
    active_ = true;

    log_info("Live detection started");
    return OperationResult::ok("Live detection started");
}

vector<HistoryEntry> LiveSession::stop()
{
    lock_guard<mutex> lock(mutex_);

    active_ = false;

    if (camera_)
    {
        camera_->release();
        camera_.reset();
    }

    vector<HistoryEntry> history;
    if (detector_)
    {
        history = detector_->history();
        detector_.reset();
        log_info("Live detection stopped with " + log_string(history.size()) + " history entries");
    }

    return history;
}

OperationResult LiveSession::readFrame(Mat &frame)
{
    // Held only for this one read so stop() cannot release the camera mid-read
    lock_guard<mutex> lock(mutex_);

    if (!active_ || !camera_)
        return OperationResult::fail(DoorError::NOT_ACTIVE);

    if (!camera_->read(frame))
    {
        log_warning("Camera returned no frame");
        return OperationResult::fail(DoorError::NOT_ACTIVE);
    }

    return OperationResult::ok();
}

OperationResult LiveSession::setRoi(const Rect &roi)
{
    lock_guard<mutex> lock(mutex_);

    if (!detector_)
        return OperationResult::fail(DoorError::NOT_READY);

    return detector_->setRoi(roi);
}

OperationResult LiveSession::calibrate()
{
    lock_guard<mutex> lock(mutex_);

    if (!detector_ || !camera_)
        return OperationResult::fail(DoorError::NOT_READY);

    Mat frame;
    if (!camera_->read(frame))
    {
        log_warning("Camera returned no frame for calibration");
        return OperationResult::fail(DoorError::NOT_ACTIVE);
    }

    return detector_->calibrateClosed(frame);
}

OperationResult LiveSession::adjustSensitivity(SensitivityDirection direction, double &threshold)
{
    lock_guard<mutex> lock(mutex_);

    if (!detector_)
        return OperationResult::fail(DoorError::NOT_READY);

    threshold = detector_->adjustSensitivity(direction);
    return OperationResult::ok();
}

shared_ptr<DoorDetector> LiveSession::detector() const
{
    lock_guard<mutex> lock(mutex_);
    return detector_;
}

vector<HistoryEntry> LiveSession::history() const
{
    lock_guard<mutex> lock(mutex_);
    return detector_ ? detector_->history() : vector<HistoryEntry>();
}
