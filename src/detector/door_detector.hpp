#pragma once

#include <opencv2/opencv.hpp>
#include <mutex>
#include <optional>
#include <vector>
#include "door_types.hpp"
#include "change_scoring.hpp"

using namespace cv;
using namespace std;

struct DetectorParams
{
    change_scoring::ChangeParams change; // Blur kernel and binary cutoff
    double initial_threshold = 5.0;      // Change percentage separating CLOSED from OPEN
    double min_threshold = 1.0;
    double max_threshold = 15.0;
    double sensitivity_step = 0.5;
};

// Classifies a door as OPEN or CLOSED by differencing a fixed ROI against a calibrated "closed" reference.
// All methods are thread-safe: HTTP handlers adjust the detector while a stream classifies frames.
class DoorDetector
{
public:
    explicit DoorDetector(const DetectorParams &params = DetectorParams());

    // Replace the ROI. Reference and status are left untouched.
    OperationResult setRoi(const Rect &roi);

    // Crop the ROI from a frame and store it as the closed reference (last call wins)
    OperationResult calibrateClosed(const Mat &frame);

    // Classify a full frame. No side effects unless the detector is calibrated and the frame fits the ROI.
    ClassificationResult classify(const Mat &frame);

    // Clamp to [min_threshold, max_threshold]; returns the value actually set
    double setThreshold(double value);

    // INCREASE lowers the threshold by one step, DECREASE raises it
    double adjustSensitivity(SensitivityDirection direction);
    double increaseSensitivity() { return adjustSensitivity(SensitivityDirection::INCREASE); }
    double decreaseSensitivity() { return adjustSensitivity(SensitivityDirection::DECREASE); }

    double threshold() const;
    DoorStatus status() const;
    optional<Rect> roi() const;
    bool isCalibrated() const;

    // Snapshot of the status transitions so far
    vector<HistoryEntry> history() const;

private:
    bool roiFitsFrame(const Rect &roi, const Mat &frame) const;
    void recordStatus(DoorStatus status);
    DoorVisualization buildVisualization(const Mat &roi_frame, const change_scoring::ChangeResult &change, DoorStatus status) const;

    DetectorParams params_;
    optional<Rect> roi_;
    optional<Mat> reference_; // Gray + blurred ROI of the closed door
    DoorStatus status_ = DoorStatus::UNCALIBRATED;
    double threshold_;
    vector<HistoryEntry> history_;

    mutable mutex mutex_;
};
