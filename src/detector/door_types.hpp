#pragma once
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

using namespace cv;
using namespace std;

enum class DoorStatus
{
    UNCALIBRATED, // ROI or reference missing
    OPEN,
    CLOSED
};

enum class DoorError
{
    NONE,
    CAMERA_UNAVAILABLE,
    ALREADY_ACTIVE,
    NOT_ACTIVE,
    NOT_READY,
    NOT_CALIBRATED,
    NO_ROI,
    INVALID_ROI,
    SHAPE_MISMATCH,
    UNREADABLE_VIDEO,
    END_OF_STREAM, // Normal stream termination, never reported to clients as a failure
    INVALID_REQUEST
};

enum class SensitivityDirection
{
    INCREASE, // Lowers the numeric threshold
    DECREASE  // Raises the numeric threshold
};

inline string toString(DoorStatus status)
{
    switch (status)
    {
    case DoorStatus::OPEN:
        return "OPEN";
    case DoorStatus::CLOSED:
        return "CLOSED";
    case DoorStatus::UNCALIBRATED:
    default:
        return "UNCALIBRATED";
    }
}

// Human readable reason, used as the "message" of failed operations
inline string errorMessage(DoorError error)
{
    switch (error)
    {
    case DoorError::NONE:
        return "";
    case DoorError::CAMERA_UNAVAILABLE:
        return "Camera not available";
    case DoorError::ALREADY_ACTIVE:
        return "Already running";
    case DoorError::NOT_ACTIVE:
        return "Live detection not running";
    case DoorError::NOT_READY:
        return "Not ready";
    case DoorError::NOT_CALIBRATED:
        return "Not calibrated";
    case DoorError::NO_ROI:
        return "Door frame not set";
    case DoorError::INVALID_ROI:
        return "Door frame outside the image";
    case DoorError::SHAPE_MISMATCH:
        return "Reference and frame sizes differ";
    case DoorError::UNREADABLE_VIDEO:
        return "Could not read video";
    case DoorError::END_OF_STREAM:
        return "End of stream";
    case DoorError::INVALID_REQUEST:
        return "Invalid request";
    }
    return "Unknown error";
}

// One status transition
struct HistoryEntry
{
    string timestamp; // "YYYY-MM-DD HH:MM:SS"
    DoorStatus status = DoorStatus::UNCALIBRATED;
};

// Outcome of a session or job operation
struct OperationResult
{
    bool success = true;
    DoorError error = DoorError::NONE;
    string message = "";

    static OperationResult ok(const string &message = "")
    {
        return OperationResult{true, DoorError::NONE, message};
    }

    static OperationResult fail(DoorError error)
    {
        return OperationResult{false, error, errorMessage(error)};
    }

    operator bool() const { return success; }
};

// Diagnostic images produced by a classification
struct DoorVisualization
{
    Mat annotated;    // ROI crop with change percentage and status label
    Mat diff_colored; // JET false-colour difference map
    Mat mask;         // Binary change mask
};

// Result of classifying one frame
struct ClassificationResult
{
    bool classified = false;
    DoorError error = DoorError::NOT_CALIBRATED;
    DoorStatus status = DoorStatus::UNCALIBRATED;
    double change_percentage = 0.0;
    DoorVisualization visualization;

    operator bool() const { return classified; }
};
