#include "frame_stream.hpp"
#include "overlay.hpp"
#include "mjpeg.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

// ------------------------------------------------------------------ FrameStream

FrameStream::FrameStream(int jpeg_quality)
    : jpeg_quality_(jpeg_quality)
{
}

bool FrameStream::next(vector<uchar> &jpeg)
{
    if (finished_)
        return false;

    Mat display;
    if (!produce(display))
    {
        finish();
        return false;
    }

    if (!mjpeg::encodeJpeg(display, jpeg, jpeg_quality_))
    {
        log_error("Could not encode frame " + log_string(frames_produced_) + ", ending stream");
        finish();
        return false;
    }

    frames_produced_++;
    return true;
}

void FrameStream::finish()
{
    if (finished_)
        return;

    finished_ = true;
    onFinished();
    log_debug("Stream finished after " + log_string(frames_produced_) + " frames");
}

// ------------------------------------------------------------------ LiveFrameStream

LiveFrameStream::LiveFrameStream(shared_ptr<LiveSession> session, int jpeg_quality)
    : FrameStream(jpeg_quality), session_(std::move(session))
{
    if (session_)
        detector_ = session_->detector();
}

bool LiveFrameStream::produce(Mat &display)
{
    // Stop instead of touching a released camera or a newer session's detector
    if (!session_ || !detector_ || !session_->isActive() || session_->detector() != detector_)
        return false;

    Mat frame;
    if (!session_->readFrame(frame))
        return false;

    display = frame.clone();

    optional<Rect> roi = detector_->roi();
    if (roi)
        overlay::drawRoi(display, *roi, 2, true);

    ClassificationResult result = detector_->classify(frame);
    overlay::drawLiveStatus(display, result, detector_->threshold());
    return true;
}

// ------------------------------------------------------------------ PlaybackFrameStream

PlaybackFrameStream::PlaybackFrameStream(PlaybackInput input, int jpeg_quality)
    : FrameStream(jpeg_quality), source_(std::move(input.source)), detector_(std::move(input.detector)), fps_(input.fps)
{
}

bool PlaybackFrameStream::produce(Mat &display)
{
    if (!source_ || !detector_)
        return false;

    Mat frame;
    if (!source_->read(frame))
        return false;

    display = frame.clone();

    optional<Rect> roi = detector_->roi();
    if (roi)
        overlay::drawRoi(display, *roi, 3, false);

    ClassificationResult result = detector_->classify(frame);
    overlay::drawPlaybackBanner(display, result, frame_index_, fps_);
    frame_index_++;
    return true;
}

void PlaybackFrameStream::onFinished()
{
    if (source_)
        source_->release();
    log_info("Playback finished after " + log_string(frame_index_) + " frames");
}
