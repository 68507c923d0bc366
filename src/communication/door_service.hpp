#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "session/live_session.hpp"
#include "session/video_job.hpp"

// HTTP control surface: live session lifecycle, video jobs and the two MJPEG feeds
class DoorService
{
public:
    DoorService(std::shared_ptr<LiveSession> live, std::shared_ptr<VideoJobManager> videos, const DoorwatchConfig &config);
    ~DoorService();

    // Listen on a background thread
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // JSON shapes shared by the routes
    static nlohmann::json resultJson(const OperationResult &result);
    static nlohmann::json historyJson(const std::vector<HistoryEntry> &history);
    static nlohmann::json configJson(const DoorwatchConfig &config);

    // {"x":..,"y":..,"width":..,"height":..}; false when a field is missing or not an integer
    static bool parseRoi(const nlohmann::json &body, Rect &roi);

    // Basename of a client-supplied file name, "upload.mp4" when nothing usable is left
    static std::string uploadFileName(const std::string &filename);

private:
    void registerRoutes();
    void registerLiveRoutes();
    void registerVideoRoutes();

    // Saves an uploaded file under the upload directory; returns the path or "" on failure
    // Write the request body to a unique staging file inside the uploads directory
    bool stageUpload(const std::string &name, const std::string &content, std::string &staged_path, std::string &final_path);

    std::shared_ptr<LiveSession> live_;
    std::shared_ptr<VideoJobManager> videos_;
    DoorwatchConfig config_;

    std::unique_ptr<httplib::Server> server_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<unsigned long> upload_counter_{0};
};
