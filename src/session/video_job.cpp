#include "video_job.hpp"
#include "utils.hpp"

#include <filesystem>
#include <system_error>

using namespace cv;
using namespace std;

VideoJobManager::VideoJobManager(VideoFactory video_factory, const DetectorParams &params)
    : video_factory_(std::move(video_factory)), params_(params)
{
}

unique_ptr<VideoSource> VideoJobManager::openSource(const string &path) const
{
    unique_ptr<VideoSource> source = video_factory_ ? video_factory_(path) : nullptr;
    if (!source || !source->open())
        return nullptr;
    return source;
}

// Caller holds mutex_
UploadResult VideoJobManager::inspectVideo(const string &path, VideoJob &job) const
{
    UploadResult uploaded;

    unique_ptr<VideoSource> source = openSource(path);
    if (!source || !source->read(uploaded.first_frame))
    {
        log_warning("Could not read uploaded video " + log_string_src(path));
        uploaded.result = OperationResult::fail(DoorError::UNREADABLE_VIDEO);
        uploaded.first_frame.release();
        return uploaded;
    }

    job.total_frames = source->frameCount();
    job.fps = source->fps();
    source->release();

    uploaded.result = OperationResult::ok();
    uploaded.total_frames = job.total_frames;
    uploaded.fps = job.fps;
    return uploaded;
}

UploadResult VideoJobManager::upload(const string &path, const string &filename)
{
    lock_guard<mutex> lock(mutex_);

    VideoJob job;
    UploadResult uploaded = inspectVideo(path, job);
    if (!uploaded)
        return uploaded;

    job.path = path;
    job.filename = filename.empty() ? path : filename;
    job.detector = make_shared<DoorDetector>(params_);
    uploaded.filename = job.filename;

    log_info("Video job " + log_string_src(job.filename) + ": " + log_string(job.total_frames) + " frames @ " +
             formatDecimal(job.fps, 2) + " fps");

    job_ = std::move(job);
    return uploaded;
}

UploadResult VideoJobManager::commitUpload(const string &staged_path, const string &final_path, const string &filename)
{
    namespace fs = std::filesystem;
    lock_guard<mutex> lock(mutex_);

    VideoJob job;
    UploadResult uploaded = inspectVideo(staged_path, job);

    error_code ec;
    if (uploaded)
    {
        fs::rename(staged_path, final_path, ec);
        if (ec)
        {
            log_error("Could not move " + log_string_src(staged_path) + " to " + log_string_src(final_path) + ": " + ec.message());
            uploaded = UploadResult();
            uploaded.result = OperationResult::fail(DoorError::UNREADABLE_VIDEO);
        }
    }

    if (!uploaded)
    {
        fs::remove(staged_path, ec);
        if (ec)
            log_warning("Could not remove staged upload " + log_string_src(staged_path) + ": " + ec.message());
        return uploaded;
    }

    job.path = final_path;
    job.filename = filename.empty() ? final_path : filename;
    job.detector = make_shared<DoorDetector>(params_);
    uploaded.filename = job.filename;

    log_info("Video job " + log_string_src(job.filename) + ": " + log_string(job.total_frames) + " frames @ " +
             formatDecimal(job.fps, 2) + " fps");

    job_ = std::move(job);
    return uploaded;
}

OperationResult VideoJobManager::setRoi(const Rect &roi)
{
    lock_guard<mutex> lock(mutex_);

    if (!job_)
        return OperationResult::fail(DoorError::NOT_READY);

    return job_->detector->setRoi(roi);
}

OperationResult VideoJobManager::calibrateFromFirstFrame()
{
    lock_guard<mutex> lock(mutex_);

    if (!job_)
        return OperationResult::fail(DoorError::NOT_READY);

    Mat first_frame;
    unique_ptr<VideoSource> source = openSource(job_->path);
    if (!source || !source->read(first_frame))
    {
        log_warning("Could not read first frame of " + log_string_src(job_->path));
        return OperationResult::fail(DoorError::UNREADABLE_VIDEO);
    }
    source->release();

    return job_->detector->calibrateClosed(first_frame);
}

OperationResult VideoJobManager::openPlayback(PlaybackInput &input)
{
    lock_guard<mutex> lock(mutex_);

    if (!job_)
        return OperationResult::fail(DoorError::NOT_READY);

    unique_ptr<VideoSource> source = openSource(job_->path);
    if (!source)
        return OperationResult::fail(DoorError::UNREADABLE_VIDEO);

    input.source = std::move(source);
    input.detector = job_->detector;
    input.total_frames = job_->total_frames;
    input.fps = job_->fps;
    return OperationResult::ok();
}

bool VideoJobManager::hasJob() const
{
    lock_guard<mutex> lock(mutex_);
    return job_.has_value();
}

optional<VideoJob> VideoJobManager::job() const
{
    lock_guard<mutex> lock(mutex_);
    return job_;
}
