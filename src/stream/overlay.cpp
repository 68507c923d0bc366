#include "overlay.hpp"
#include "utils.hpp"

#include <cstdio>

using namespace cv;
using namespace std;

namespace overlay
{
    string statusLabel(DoorStatus status)
    {
        if (status == DoorStatus::UNCALIBRATED)
            return "Not Calibrated";
        return toString(status);
    }

    string resultLabel(const ClassificationResult &result)
    {
        if (result.classified || result.error == DoorError::NOT_CALIBRATED || result.status != DoorStatus::UNCALIBRATED)
            return statusLabel(result.status);
        return errorMessage(result.error);
    }

    Scalar statusColor(DoorStatus status)
    {
        return (status == DoorStatus::CLOSED) ? colors::STATUS_CLOSED : colors::STATUS_OPEN;
    }

    string formatElapsed(int frame_index, double fps)
    {
        double seconds = (fps > 0) ? frame_index / fps : frame_index;
        int total = static_cast<int>(seconds);

        char buf[16];
        snprintf(buf, sizeof(buf), "%02d:%02d", total / 60, total % 60);
        return string(buf);
    }

    void drawRoi(Mat &display, const Rect &roi, int thickness, bool label)
    {
        rectangle(display, roi, colors::ROI_OUTLINE, thickness);

        if (label)
        {
            putText(display, "DOOR FRAME", Point(roi.x, max(15, roi.y - 10)),
                    FONT_HERSHEY_SIMPLEX, 0.6, colors::ROI_OUTLINE, 2);
        }
    }

    void drawLiveStatus(Mat &display, const ClassificationResult &result, double threshold)
    {
        rectangle(display, Point(5, 5), Point(300, 60), colors::BANNER, FILLED);
        putText(display, "Door: " + resultLabel(result), Point(10, 40),
                FONT_HERSHEY_SIMPLEX, 1.2, statusColor(result.status), 3);

        putText(display, "Sensitivity: " + formatDecimal(threshold) + "%", Point(10, 80),
                FONT_HERSHEY_SIMPLEX, 0.6, colors::TEXT_PRIMARY, 2);
    }

    void drawPlaybackBanner(Mat &display, const ClassificationResult &result, int frame_index, double fps)
    {
        // Blend a black band over the top 100 rows: 70% band, 30% picture
        Mat band = display.clone();
        rectangle(band, Point(0, 0), Point(display.cols, 100), colors::BANNER, FILLED);
        addWeighted(band, 0.7, display, 0.3, 0, display);

        putText(display, "Door: " + resultLabel(result), Point(20, 50),
                FONT_HERSHEY_SIMPLEX, 1.5, statusColor(result.status), 4);

        string info = "Frame: " + to_string(frame_index) +
                      " | Time: " + formatElapsed(frame_index, fps) +
                      " | Change: " + formatDecimal(result.change_percentage) + "%";
        putText(display, info, Point(20, 85), FONT_HERSHEY_SIMPLEX, 0.6, colors::TEXT_PRIMARY, 2);
    }

} // namespace overlay
