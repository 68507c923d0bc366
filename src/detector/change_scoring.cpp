#include "change_scoring.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace change_scoring
{
    Mat prepareGray(const Mat &image, const ChangeParams &params)
    {
        if (image.empty())
            return Mat();

        Mat gray;
        if (image.channels() == 3)
            cvtColor(image, gray, COLOR_BGR2GRAY);
        else if (image.channels() == 4)
            cvtColor(image, gray, COLOR_BGRA2GRAY);
        else
            gray = image.clone();

        GaussianBlur(gray, gray, Size(params.blur_kernel_size, params.blur_kernel_size), 0);
        return gray;
    }

    ChangeResult scoreChange(const Mat &reference, const Mat &candidate, const ChangeParams &params)
    {
        ChangeResult result;

        if (reference.empty() || candidate.empty() ||
            reference.size() != candidate.size() ||
            reference.type() != candidate.type() ||
            reference.channels() != 1)
        {
            log_debug("Cannot score " + to_string(candidate.cols) + "x" + to_string(candidate.rows) +
                      " against reference " + to_string(reference.cols) + "x" + to_string(reference.rows));
            result.error = DoorError::SHAPE_MISMATCH;
            return result;
        }

        absdiff(reference, candidate, result.diff);
        threshold(result.diff, result.mask, params.binary_threshold, 255, THRESH_BINARY);

        result.changed_pixels = countNonZero(result.mask);
        result.total_pixels = result.mask.rows * result.mask.cols;
        result.percentage = 100.0 * result.changed_pixels / result.total_pixels;
        result.valid = true;
        return result;
    }

} // namespace change_scoring
