#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include "detector/door_types.hpp"

using namespace cv;
using namespace std;

namespace overlay
{
    // "OPEN", "CLOSED" or "Not Calibrated"
    string statusLabel(DoorStatus status);

    // Label for one classification. A detector that is calibrated but could not score this
    // frame keeps showing its last status; before any status exists the error is shown.
    string resultLabel(const ClassificationResult &result);

    // Green for CLOSED, red otherwise
    Scalar statusColor(DoorStatus status);

    // Elapsed video time "MM:SS" for a frame index; falls back to the index when fps is unknown
    string formatElapsed(int frame_index, double fps);

    // Yellow ROI outline, optionally labelled "DOOR FRAME" above it
    void drawRoi(Mat &display, const Rect &roi, int thickness, bool label);

    // Live feed: black status box with "Door: <STATUS>" and the sensitivity readout below it
    void drawLiveStatus(Mat &display, const ClassificationResult &result, double threshold);

    // Playback feed: semi-transparent top banner with status, frame index, elapsed time and change
    void drawPlaybackBanner(Mat &display, const ClassificationResult &result, int frame_index, double fps);

} // namespace overlay
