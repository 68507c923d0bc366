#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include <opencv2/opencv.hpp>
#include "detector/door_detector.hpp"
#include "source/frame_source.hpp"

using namespace std;

// The single live camera session. One mutex guards every transition that touches the camera
// handle or the detector reference; the frame loop itself runs outside the lock.
class LiveSession
{
public:
    LiveSession(CameraFactory camera_factory, const DetectorParams &params = DetectorParams());
    ~LiveSession();

    LiveSession(const LiveSession &) = delete;
    LiveSession &operator=(const LiveSession &) = delete;

    // Open the camera and create a fresh detector
    OperationResult start();

    // Release the camera and return the detector's history; empty if nothing was running
    vector<HistoryEntry> stop();

    // Next camera frame; NOT_ACTIVE when stopped or when the camera yields nothing
    OperationResult readFrame(Mat &frame);

    OperationResult setRoi(const Rect &roi);

    // Grab a frame and store its ROI as the closed reference
    OperationResult calibrate();

    // On success `threshold` holds the new value
    OperationResult adjustSensitivity(SensitivityDirection direction, double &threshold);

    bool isActive() const { return active_; }

    // Detector of the running session, nullptr when stopped
    shared_ptr<DoorDetector> detector() const;

    // History so far without stopping
    vector<HistoryEntry> history() const;

private:
    CameraFactory camera_factory_;
    DetectorParams params_;

    unique_ptr<FrameSource> camera_;
    shared_ptr<DoorDetector> detector_;
    atomic<bool> active_{false};

    mutable mutex mutex_;
};
