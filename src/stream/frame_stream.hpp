#pragma once

#include <memory>
#include <vector>
#include <opencv2/opencv.hpp>
#include "detector/door_detector.hpp"
#include "session/live_session.hpp"
#include "session/video_job.hpp"

using namespace cv;
using namespace std;

// Lazy, single-pass sequence of JPEG frames. The consumer pulls one frame at a time with next();
// once next() returns false the stream is finished for good.
class FrameStream
{
public:
    virtual ~FrameStream() = default;

    // Produce, annotate and encode the next frame. False at end of stream.
    bool next(vector<uchar> &jpeg);

    bool finished() const { return finished_; }
    int framesProduced() const { return frames_produced_; }

protected:
    explicit FrameStream(int jpeg_quality);

    // Fill `display` with the next annotated frame; false ends the stream
    virtual bool produce(Mat &display) = 0;

    // Called once when the stream ends
    virtual void onFinished() {}

    void finish();

private:
    int jpeg_quality_;
    bool finished_ = false;
    int frames_produced_ = 0;
};

// Unbounded feed from the live camera. Ends when the session stops, is restarted, or the camera fails.
class LiveFrameStream : public FrameStream
{
public:
    explicit LiveFrameStream(shared_ptr<LiveSession> session, int jpeg_quality = 80);

protected:
    bool produce(Mat &display) override;

private:
    shared_ptr<LiveSession> session_;
    shared_ptr<DoorDetector> detector_; // Detector of the session this stream was opened on
};

// Finite playback of an uploaded video, one pass over its frames
class PlaybackFrameStream : public FrameStream
{
public:
    explicit PlaybackFrameStream(PlaybackInput input, int jpeg_quality = 80);

protected:
    bool produce(Mat &display) override;
    void onFinished() override;

private:
    unique_ptr<VideoSource> source_;
    shared_ptr<DoorDetector> detector_;
    double fps_;
    int frame_index_ = 0;
};
