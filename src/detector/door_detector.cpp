#include "door_detector.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>

using namespace cv;
using namespace std;

DoorDetector::DoorDetector(const DetectorParams &params)
    : params_(params), threshold_(params.initial_threshold)
{
    threshold_ = clamp(threshold_, params_.min_threshold, params_.max_threshold);
}

OperationResult DoorDetector::setRoi(const Rect &roi)
{
    // The far corner must be representable, x + width is computed when clipping
    if (roi.x < 0 || roi.y < 0 || roi.width <= 0 || roi.height <= 0 ||
        roi.x > numeric_limits<int>::max() - roi.width || roi.y > numeric_limits<int>::max() - roi.height)
    {
        log_warning("Rejected door frame " + to_string(roi.x) + "," + to_string(roi.y) + " " +
                    to_string(roi.width) + "x" + to_string(roi.height));
        return OperationResult::fail(DoorError::INVALID_ROI);
    }

    lock_guard<mutex> lock(mutex_);
    roi_ = roi;
    log_info("Door frame set to (" + log_string(roi.x) + "," + log_string(roi.y) + ") " +
             log_string(roi.width) + "x" + log_string(roi.height));
    return OperationResult::ok();
}

OperationResult DoorDetector::calibrateClosed(const Mat &frame)
{
    lock_guard<mutex> lock(mutex_);

    if (!roi_)
    {
        log_warning("Calibration requested before the door frame was set");
        return OperationResult::fail(DoorError::NO_ROI);
    }

    if (!roiFitsFrame(*roi_, frame))
    {
        log_warning("Door frame does not fit a " + to_string(frame.cols) + "x" + to_string(frame.rows) + " frame");
        return OperationResult::fail(DoorError::INVALID_ROI);
    }

    // Wholesale replacement, the previous reference is dropped
    reference_ = change_scoring::prepareGray(frame(*roi_), params_.change);
    log_info("Calibrated closed reference (" + log_string(reference_->cols) + "x" + log_string(reference_->rows) + ")");
    return OperationResult::ok();
}

ClassificationResult DoorDetector::classify(const Mat &frame)
{
    ClassificationResult result;
    lock_guard<mutex> lock(mutex_);

    if (!roi_ || !reference_)
    {
        result.error = DoorError::NOT_CALIBRATED;
        return result;
    }

    if (!roiFitsFrame(*roi_, frame))
    {
        result.error = DoorError::INVALID_ROI;
        result.status = status_;
        return result;
    }

    Mat roi_frame = frame(*roi_);
    Mat current = change_scoring::prepareGray(roi_frame, params_.change);

    change_scoring::ChangeResult change = change_scoring::scoreChange(*reference_, current, params_.change);
    if (!change)
    {
        // e.g. ROI replaced after calibration; keep the last status and history
        result.error = change.error;
        result.status = status_;
        return result;
    }

    // Boundary value counts as CLOSED
    DoorStatus status = (change.percentage > threshold_) ? DoorStatus::OPEN : DoorStatus::CLOSED;
    recordStatus(status);

    result.classified = true;
    result.error = DoorError::NONE;
    result.status = status;
    result.change_percentage = change.percentage;
    result.visualization = buildVisualization(roi_frame, change, status);
    return result;
}

double DoorDetector::setThreshold(double value)
{
    lock_guard<mutex> lock(mutex_);
    threshold_ = clamp(value, params_.min_threshold, params_.max_threshold);
    log_debug("Threshold set to " + formatDecimal(threshold_) + "%");
    return threshold_;
}

double DoorDetector::adjustSensitivity(SensitivityDirection direction)
{
    lock_guard<mutex> lock(mutex_);

    double step = (direction == SensitivityDirection::INCREASE) ? -params_.sensitivity_step : params_.sensitivity_step;
    threshold_ = clamp(threshold_ + step, params_.min_threshold, params_.max_threshold);

    log_info(string(direction == SensitivityDirection::INCREASE ? "Increased" : "Decreased") +
             " sensitivity, threshold now " + formatDecimal(threshold_) + "%");
    return threshold_;
}

double DoorDetector::threshold() const
{
    lock_guard<mutex> lock(mutex_);
    return threshold_;
}

DoorStatus DoorDetector::status() const
{
    lock_guard<mutex> lock(mutex_);
    return status_;
}

optional<Rect> DoorDetector::roi() const
{
    lock_guard<mutex> lock(mutex_);
    return roi_;
}

bool DoorDetector::isCalibrated() const
{
    lock_guard<mutex> lock(mutex_);
    return roi_.has_value() && reference_.has_value();
}

vector<HistoryEntry> DoorDetector::history() const
{
    lock_guard<mutex> lock(mutex_);
    return history_;
}

bool DoorDetector::roiFitsFrame(const Rect &roi, const Mat &frame) const
{
    if (frame.empty())
        return false;
    return (roi & Rect(0, 0, frame.cols, frame.rows)) == roi;
}

// Caller holds mutex_
void DoorDetector::recordStatus(DoorStatus status)
{
    status_ = status;

    // Run-length compression: the first classification is always logged, then only changes
    if (history_.empty() || history_.back().status != status)
    {
        history_.push_back({nowTimestamp(), status});
        log_info("Door is now " + toString(status) + " (" + log_string(history_.size()) + " transitions)");
    }
}

DoorVisualization DoorDetector::buildVisualization(const Mat &roi_frame, const change_scoring::ChangeResult &change, DoorStatus status) const
{
    DoorVisualization vis;
    Scalar color = (status == DoorStatus::OPEN) ? colors::STATUS_OPEN : colors::STATUS_CLOSED;

    if (roi_frame.channels() == 1)
        cvtColor(roi_frame, vis.annotated, COLOR_GRAY2BGR);
    else
        vis.annotated = roi_frame.clone();

    putText(vis.annotated, "Change: " + formatDecimal(change.percentage) + "%", Point(10, 30),
            FONT_HERSHEY_SIMPLEX, 0.7, color, 2);
    putText(vis.annotated, toString(status), Point(10, 60),
            FONT_HERSHEY_SIMPLEX, 0.9, color, 2);

    applyColorMap(change.diff, vis.diff_colored, COLORMAP_JET);
    vis.mask = change.mask;
    return vis;
}
