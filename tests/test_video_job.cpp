#include <gtest/gtest.h>
#include "session/video_job.hpp"
#include "source/video_file_source.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace test_helpers;
namespace fs = std::filesystem;

namespace
{
    void writeFile(const fs::path &path, const string &content)
    {
        ofstream file(path, ios::binary | ios::trunc);
        file << content;
    }

    string readFile(const fs::path &path)
    {
        ifstream file(path, ios::binary);
        return string(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
    }
}

class VideoJobTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        library = make_shared<StubLibrary>();
        closed = makeFrame(64, 48, 40);
        library->videos["uploads/door.mp4"] = {closed, closed, paintRegion(closed, roi, 220)};
        manager = make_unique<VideoJobManager>(stubVideoFactory(library));
    }

    shared_ptr<StubLibrary> library;
    unique_ptr<VideoJobManager> manager;
    Mat closed;
    Rect roi{4, 4, 20, 20};
};

TEST_F(VideoJobTest, UploadReportsMetadataAndFirstFrame)
{
    UploadResult uploaded = manager->upload("uploads/door.mp4", "door.mp4");

    ASSERT_TRUE(uploaded);
    EXPECT_EQ(uploaded.total_frames, 3);
    EXPECT_DOUBLE_EQ(uploaded.fps, 25.0);
    EXPECT_EQ(uploaded.filename, "door.mp4");
    ASSERT_FALSE(uploaded.first_frame.empty());
    EXPECT_EQ(cv::norm(uploaded.first_frame, closed, cv::NORM_INF), 0.0);

    ASSERT_TRUE(manager->hasJob());
    optional<VideoJob> job = manager->job();
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->path, "uploads/door.mp4");
    ASSERT_NE(job->detector, nullptr);
    EXPECT_FALSE(job->detector->isCalibrated());
}

TEST_F(VideoJobTest, UnreadableUploadIsRejected)
{
    UploadResult uploaded = manager->upload("uploads/missing.mp4");

    EXPECT_FALSE(uploaded);
    EXPECT_EQ(uploaded.result.error, DoorError::UNREADABLE_VIDEO);
    EXPECT_TRUE(uploaded.first_frame.empty());
    EXPECT_FALSE(manager->hasJob());
}

TEST_F(VideoJobTest, EmptyVideoIsRejected)
{
    library->videos["uploads/empty.mp4"] = {};

    EXPECT_EQ(manager->upload("uploads/empty.mp4").result.error, DoorError::UNREADABLE_VIDEO);
}

TEST_F(VideoJobTest, FailedUploadKeepsPreviousJob)
{
    ASSERT_TRUE(manager->upload("uploads/door.mp4", "door.mp4"));
    ASSERT_TRUE(manager->setRoi(roi));

    EXPECT_FALSE(manager->upload("uploads/missing.mp4"));

    optional<VideoJob> job = manager->job();
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->filename, "door.mp4");
    EXPECT_TRUE(job->detector->roi().has_value());
}

TEST_F(VideoJobTest, NewUploadReplacesDetector)
{
    library->videos["uploads/other.mp4"] = {closed};
    ASSERT_TRUE(manager->upload("uploads/door.mp4"));
    ASSERT_TRUE(manager->setRoi(roi));
    ASSERT_TRUE(manager->calibrateFromFirstFrame());

    ASSERT_TRUE(manager->upload("uploads/other.mp4"));

    optional<VideoJob> job = manager->job();
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->filename, "uploads/other.mp4");
    EXPECT_FALSE(job->detector->isCalibrated());
    EXPECT_FALSE(job->detector->roi().has_value());
}

TEST_F(VideoJobTest, OperationsWithoutJobAreNotReady)
{
    PlaybackInput input;

    EXPECT_EQ(manager->setRoi(roi).error, DoorError::NOT_READY);
    EXPECT_EQ(manager->calibrateFromFirstFrame().error, DoorError::NOT_READY);
    EXPECT_EQ(manager->openPlayback(input).error, DoorError::NOT_READY);
}

TEST_F(VideoJobTest, CalibrationUsesFirstFrame)
{
    ASSERT_TRUE(manager->upload("uploads/door.mp4"));

    EXPECT_EQ(manager->calibrateFromFirstFrame().error, DoorError::NO_ROI);

    ASSERT_TRUE(manager->setRoi(roi));
    ASSERT_TRUE(manager->calibrateFromFirstFrame());

    shared_ptr<DoorDetector> detector = manager->job()->detector;
    EXPECT_TRUE(detector->isCalibrated());
    EXPECT_EQ(detector->classify(closed).status, DoorStatus::CLOSED);
}

TEST_F(VideoJobTest, VanishedVideoCannotBeCalibratedOrPlayed)
{
    ASSERT_TRUE(manager->upload("uploads/door.mp4"));
    ASSERT_TRUE(manager->setRoi(roi));
    library->videos.erase("uploads/door.mp4");

    PlaybackInput input;
    EXPECT_EQ(manager->calibrateFromFirstFrame().error, DoorError::UNREADABLE_VIDEO);
    EXPECT_EQ(manager->openPlayback(input).error, DoorError::UNREADABLE_VIDEO);
    EXPECT_EQ(input.source, nullptr);
}

TEST_F(VideoJobTest, PlaybackSharesJobDetector)
{
    ASSERT_TRUE(manager->upload("uploads/door.mp4"));

    PlaybackInput input;
    ASSERT_TRUE(manager->openPlayback(input));

    ASSERT_NE(input.source, nullptr);
    EXPECT_TRUE(input.source->isOpened());
    EXPECT_EQ(input.detector, manager->job()->detector);
    EXPECT_EQ(input.total_frames, 3);
    EXPECT_DOUBLE_EQ(input.fps, 25.0);
}

TEST(VideoFileUpload, NonexistentFileIsUnreadable)
{
    VideoJobManager manager(VideoFileSource::factory());

    UploadResult uploaded = manager.upload("/nonexistent/doorwatch/clip.mp4");

    EXPECT_FALSE(uploaded);
    EXPECT_EQ(uploaded.result.error, DoorError::UNREADABLE_VIDEO);
    EXPECT_FALSE(manager.hasJob());
}

class StagedUploadTest : public VideoJobTest
{
protected:
    void SetUp() override
    {
        VideoJobTest::SetUp();
        dir = fs::path(::testing::TempDir()) / "doorwatch_staged_upload";
        fs::remove_all(dir);
        fs::create_directories(dir);
        final_path = (dir / "door.mp4").string();
    }

    void TearDown() override
    {
        fs::remove_all(dir);
    }

    fs::path dir;
    string final_path;
};

TEST_F(StagedUploadTest, CommitMovesStagedFileIntoPlace)
{
    string staged = (dir / ".incoming-0-door.mp4").string();
    writeFile(staged, "first video");
    library->videos[staged] = {closed, closed};

    UploadResult uploaded = manager->commitUpload(staged, final_path, "door.mp4");

    ASSERT_TRUE(uploaded);
    EXPECT_EQ(uploaded.filename, "door.mp4");
    EXPECT_EQ(uploaded.total_frames, 2);
    EXPECT_FALSE(fs::exists(staged));
    EXPECT_EQ(readFile(final_path), "first video");
    EXPECT_EQ(manager->job()->path, final_path);
}

TEST_F(StagedUploadTest, RejectedUploadUnderSameNameKeepsPreviousVideo)
{
    string good = (dir / ".incoming-0-door.mp4").string();
    writeFile(good, "first video");
    library->videos[good] = {closed, closed};
    ASSERT_TRUE(manager->commitUpload(good, final_path, "door.mp4"));
    library->videos[final_path] = {closed, closed}; // the committed file now decodes at its final path
    ASSERT_TRUE(manager->setRoi(roi));

    string corrupt = (dir / ".incoming-1-door.mp4").string();
    writeFile(corrupt, "not a video");
    UploadResult uploaded = manager->commitUpload(corrupt, final_path, "door.mp4");

    EXPECT_FALSE(uploaded);
    EXPECT_EQ(uploaded.result.error, DoorError::UNREADABLE_VIDEO);
    EXPECT_FALSE(fs::exists(corrupt));
    EXPECT_EQ(readFile(final_path), "first video");

    optional<VideoJob> job = manager->job();
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->path, final_path);
    EXPECT_TRUE(job->detector->roi().has_value());
    EXPECT_TRUE(manager->calibrateFromFirstFrame());

    PlaybackInput input;
    EXPECT_TRUE(manager->openPlayback(input));
}
