#pragma once

#include <opencv2/opencv.hpp>
#include "door_types.hpp"

using namespace cv;

namespace change_scoring
{
    struct ChangeParams
    {
        int blur_kernel_size = 15; // Gaussian kernel applied before differencing (odd)
        int binary_threshold = 30; // Intensity difference (0-255) counted as changed
    };

    struct ChangeResult
    {
        bool valid = false;
        DoorError error = DoorError::NONE;
        double percentage = 0.0; // 0 - 100
        int changed_pixels = 0;
        int total_pixels = 0;
        Mat diff; // Absolute difference, single channel
        Mat mask; // diff > binary_threshold, 0 or 255

        operator bool() const { return valid; }
    };

    // Crop-independent preprocessing: BGR (or gray) -> gray -> Gaussian blur
    Mat prepareGray(const Mat &image, const ChangeParams &params = ChangeParams());

    // Compare two prepared single-channel images of identical size.
    // Fails with SHAPE_MISMATCH when sizes or channel counts differ.
    ChangeResult scoreChange(const Mat &reference, const Mat &candidate, const ChangeParams &params = ChangeParams());

} // namespace change_scoring
