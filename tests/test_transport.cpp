#include <gtest/gtest.h>
#include "communication/door_service.hpp"
#include "stream/overlay.hpp"
#include "mjpeg.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

TEST(Mjpeg, PartCarriesBoundaryHeadersAndPayload)
{
    vector<uchar> jpeg = {0xFF, 0xD8, 0x01, 0x02, 0xFF, 0xD9};

    string part = mjpeg::formatPart(jpeg);

    string header = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: 6\r\n\r\n";
    ASSERT_EQ(part.size(), header.size() + jpeg.size() + 2);
    EXPECT_EQ(part.substr(0, header.size()), header);
    EXPECT_EQ(part.substr(header.size(), jpeg.size()), string(jpeg.begin(), jpeg.end()));
    EXPECT_EQ(part.substr(part.size() - 2), "\r\n");
    EXPECT_NE(mjpeg::CONTENT_TYPE.find("boundary=frame"), string::npos);
}

TEST(Mjpeg, EmptyFrameIsNotEncoded)
{
    vector<uchar> jpeg;
    EXPECT_FALSE(mjpeg::encodeJpeg(Mat(), jpeg));
}

TEST(Utils, Base64MatchesStandardAlphabetAndPadding)
{
    EXPECT_EQ(base64Encode({}), "");
    EXPECT_EQ(base64Encode({'M'}), "TQ==");
    EXPECT_EQ(base64Encode({'M', 'a'}), "TWE=");
    EXPECT_EQ(base64Encode({'M', 'a', 'n'}), "TWFu");
    EXPECT_EQ(base64Encode({0xFB, 0xFF}), "+/8=");
}

TEST(Utils, FormatDecimal)
{
    EXPECT_EQ(formatDecimal(5.0), "5.0");
    EXPECT_EQ(formatDecimal(12.345, 2), "12.35");
}

TEST(Overlay, ElapsedTimeFromFrameIndex)
{
    EXPECT_EQ(overlay::formatElapsed(0, 30.0), "00:00");
    EXPECT_EQ(overlay::formatElapsed(90, 30.0), "00:03");
    EXPECT_EQ(overlay::formatElapsed(3600, 30.0), "02:00");
    EXPECT_EQ(overlay::formatElapsed(75, 0.0), "01:15");
}

TEST(Overlay, StatusLabelsAndColors)
{
    EXPECT_EQ(overlay::statusLabel(DoorStatus::UNCALIBRATED), "Not Calibrated");
    EXPECT_EQ(overlay::statusLabel(DoorStatus::OPEN), "OPEN");
    EXPECT_EQ(overlay::statusColor(DoorStatus::CLOSED), colors::STATUS_CLOSED);
    EXPECT_EQ(overlay::statusColor(DoorStatus::OPEN), colors::STATUS_OPEN);
}

TEST(Overlay, ScoringErrorKeepsLastKnownStatus)
{
    DoorDetector detector;
    Mat closed = test_helpers::makeFrame(80, 60, 70);

    EXPECT_EQ(overlay::resultLabel(detector.classify(closed)), "Not Calibrated");

    ASSERT_TRUE(detector.setRoi(Rect(0, 0, 20, 20)));
    ASSERT_TRUE(detector.calibrateClosed(closed));
    ClassificationResult classified = detector.classify(closed);
    ASSERT_TRUE(classified);
    EXPECT_EQ(overlay::resultLabel(classified), "CLOSED");

    ASSERT_TRUE(detector.setRoi(Rect(0, 0, 30, 30)));
    ClassificationResult mismatch = detector.classify(closed);
    ASSERT_EQ(mismatch.error, DoorError::SHAPE_MISMATCH);
    EXPECT_EQ(overlay::resultLabel(mismatch), "CLOSED");
}

TEST(Overlay, ScoringErrorBeforeAnyStatusShowsReason)
{
    DoorDetector detector;
    ASSERT_TRUE(detector.setRoi(Rect(0, 0, 20, 20)));
    ASSERT_TRUE(detector.calibrateClosed(test_helpers::makeFrame(80, 60, 70)));

    ClassificationResult result = detector.classify(test_helpers::makeFrame(10, 10, 70));

    ASSERT_EQ(result.error, DoorError::INVALID_ROI);
    EXPECT_EQ(overlay::resultLabel(result), errorMessage(DoorError::INVALID_ROI));
}

TEST(DoorService, ParsesRoiBody)
{
    Rect roi;
    json body = {{"x", 10}, {"y", 20}, {"width", 100}, {"height", 200}};

    ASSERT_TRUE(DoorService::parseRoi(body, roi));
    EXPECT_EQ(roi, Rect(10, 20, 100, 200));
}

TEST(DoorService, RejectsIncompleteRoiBody)
{
    Rect roi(1, 2, 3, 4);

    EXPECT_FALSE(DoorService::parseRoi({{"x", 10}, {"y", 20}, {"width", 100}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", "10"}, {"y", 20}, {"width", 100}, {"height", 5}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", 10.5}, {"y", 20}, {"width", 100}, {"height", 5}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", 1e20}, {"y", 20}, {"width", 100}, {"height", 5}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", 10}, {"y", 20}, {"width", 4294967296LL}, {"height", 5}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", 10}, {"y", -4294967296LL}, {"width", 100}, {"height", 5}}, roi));
    EXPECT_FALSE(DoorService::parseRoi({{"x", 10}, {"y", 20}, {"width", 100}, {"height", 18446744073709551615ULL}}, roi));
    EXPECT_EQ(roi, Rect(1, 2, 3, 4));
}

TEST(DoorService, AcceptsRoiAtIntLimits)
{
    Rect roi;
    json body = {{"x", 0}, {"y", 0}, {"width", 2147483647}, {"height", 1}};

    ASSERT_TRUE(DoorService::parseRoi(body, roi));
    EXPECT_EQ(roi.width, 2147483647);
}

TEST(DoorService, UploadNameKeepsOnlyBasename)
{
    EXPECT_EQ(DoorService::uploadFileName("door.mp4"), "door.mp4");
    EXPECT_EQ(DoorService::uploadFileName("clips/front/door.mp4"), "door.mp4");
    EXPECT_EQ(DoorService::uploadFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(DoorService::uploadFileName(""), "upload.mp4");
    EXPECT_EQ(DoorService::uploadFileName("clips/.."), "upload.mp4");
}

TEST(DoorService, HistoryAsJson)
{
    vector<HistoryEntry> history = {{"2025-01-02 03:04:05", DoorStatus::CLOSED},
                                    {"2025-01-02 03:04:09", DoorStatus::OPEN}};

    json j = DoorService::historyJson(history);

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["timestamp"], "2025-01-02 03:04:05");
    EXPECT_EQ(j[0]["status"], "CLOSED");
    EXPECT_EQ(j[1]["status"], "OPEN");
    EXPECT_TRUE(DoorService::historyJson({}).empty());
}

TEST(DoorService, ResultJsonCarriesMessage)
{
    json failed = DoorService::resultJson(OperationResult::fail(DoorError::ALREADY_ACTIVE));
    EXPECT_FALSE(failed["success"].get<bool>());
    EXPECT_EQ(failed["message"], errorMessage(DoorError::ALREADY_ACTIVE));

    json ok = DoorService::resultJson(OperationResult::ok());
    EXPECT_TRUE(ok["success"].get<bool>());
    EXPECT_FALSE(ok.contains("message"));
}
