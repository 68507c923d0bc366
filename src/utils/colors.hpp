#pragma once

#include <opencv2/opencv.hpp>

using namespace cv;

// BGR colors shared by the overlays
namespace colors
{
    inline const Scalar STATUS_CLOSED(0, 255, 0);  // Green
    inline const Scalar STATUS_OPEN(0, 0, 255);    // Red, also used while uncalibrated
    inline const Scalar ROI_OUTLINE(0, 255, 255);  // Yellow
    inline const Scalar TEXT_PRIMARY(255, 255, 255);
    inline const Scalar BANNER(0, 0, 0);
}
