#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <opencv2/opencv.hpp>
#include "detector/door_detector.hpp"
#include "source/frame_source.hpp"

using namespace std;

// An uploaded video and the detector used to analyse it offline
struct VideoJob
{
    string path;
    string filename;
    int total_frames = 0;
    double fps = 0.0;
    shared_ptr<DoorDetector> detector;
};

struct UploadResult
{
    OperationResult result;
    Mat first_frame; // For ROI selection
    int total_frames = 0;
    double fps = 0.0;
    string filename;

    operator bool() const { return result.success; }
};

// Everything a playback stream needs, detached from the job slot
struct PlaybackInput
{
    unique_ptr<VideoSource> source;
    shared_ptr<DoorDetector> detector;
    int total_frames = 0;
    double fps = 0.0;
};

// Single-slot owner of the current video job. A new upload replaces the previous job;
// every operation is serialized on one mutex.
class VideoJobManager
{
public:
    VideoJobManager(VideoFactory video_factory, const DetectorParams &params = DetectorParams());

    // Decode the first frame and metadata of `path`, then make it the current job.
    // A failed upload leaves the previous job in place.
    UploadResult upload(const string &path, const string &filename = "");

    // Validate a video written to `staged_path` and, only if it decodes, move it over
    // `final_path` and make it the current job. The staged file is removed on failure,
    // so a bad upload never replaces the file the current job reads from.
    UploadResult commitUpload(const string &staged_path, const string &final_path, const string &filename);

    OperationResult setRoi(const Rect &roi);

    // Re-open the video and calibrate the job's detector on its first frame
    OperationResult calibrateFromFirstFrame();

    // Open a fresh decoder over the current video for playback
    OperationResult openPlayback(PlaybackInput &input);

    bool hasJob() const;
    optional<VideoJob> job() const;

private:
    // Caller holds mutex_
    unique_ptr<VideoSource> openSource(const string &path) const;
    UploadResult inspectVideo(const string &path, VideoJob &job) const;

    VideoFactory video_factory_;
    DetectorParams params_;
    optional<VideoJob> job_;

    mutable mutex mutex_;
};
