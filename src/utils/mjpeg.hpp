// mjpeg.hpp: JPEG encoding and multipart/x-mixed-replace framing
// ------------------------------------------------------------------
// * Every streamed frame is a separate JPEG part delimited by "--frame".
// * Parts carry Content-Length so browsers do not have to scan for the boundary.
//
#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "logging.hpp"

namespace mjpeg
{
    inline const std::string CONTENT_TYPE = "multipart/x-mixed-replace; boundary=frame";

    // Encode a BGR or grayscale frame; false if OpenCV cannot encode it
    inline bool encodeJpeg(const cv::Mat &frame, std::vector<uchar> &jpg, int quality = 80)
    {
        if (frame.empty())
            return false;

        try
        {
            return cv::imencode(".jpg", frame, jpg, {cv::IMWRITE_JPEG_QUALITY, quality});
        }
        catch (const cv::Exception &e)
        {
            log_error("JPEG encoding failed: " + std::string(e.what()));
            return false;
        }
    }

    // Wrap one JPEG into a multipart part, trailing CRLF included
    inline std::string formatPart(const std::vector<uchar> &jpg)
    {
        std::string part = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: " +
                           std::to_string(jpg.size()) + "\r\n\r\n";
        part.append(reinterpret_cast<const char *>(jpg.data()), jpg.size());
        part.append("\r\n");
        return part;
    }

} // namespace mjpeg
