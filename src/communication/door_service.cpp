#include "door_service.hpp"
#include "stream/frame_stream.hpp"
#include "mjpeg.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

using namespace std;
using json = nlohmann::json;

namespace
{
    // Parse a JSON object request body; on failure answer 400 and return false
    bool parseBody(const httplib::Request &req, httplib::Response &res, json &body)
    {
        try
        {
            body = json::parse(req.body);
        }
        catch (const json::parse_error &e)
        {
            log_warning("Rejected request body: " + string(e.what()));
            body = json();
        }

        if (body.is_object())
            return true;

        res.status = 400;
        json error = DoorService::resultJson(OperationResult::fail(DoorError::INVALID_REQUEST));
        res.set_content(error.dump(), "application/json");
        return false;
    }

    void reply(httplib::Response &res, const json &payload)
    {
        res.set_content(payload.dump(), "application/json");
    }

    // Encode a frame for a JSON payload; "" if encoding fails
    string frameToBase64(const Mat &frame, int quality)
    {
        vector<uchar> jpeg;
        if (!mjpeg::encodeJpeg(frame, jpeg, quality))
            return "";
        return base64Encode(jpeg);
    }

    // Pull one frame per provider call until the stream ends
    void streamFrames(httplib::Response &res, shared_ptr<FrameStream> stream)
    {
        res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
        res.set_header("Pragma", "no-cache");
        res.set_chunked_content_provider(
            mjpeg::CONTENT_TYPE,
            [stream](size_t, httplib::DataSink &sink)
            {
                vector<uchar> jpeg;
                if (!stream->next(jpeg))
                {
                    sink.done();
                    return true;
                }

                string part = mjpeg::formatPart(jpeg);
                return sink.write(part.data(), part.size());
            });
    }
}

DoorService::DoorService(shared_ptr<LiveSession> live, shared_ptr<VideoJobManager> videos, const DoorwatchConfig &config)
    : live_(std::move(live)), videos_(std::move(videos)), config_(config)
{
}

DoorService::~DoorService()
{
    stop();
}

json DoorService::resultJson(const OperationResult &result)
{
    json j;
    j["success"] = result.success;
    if (!result.message.empty())
        j["message"] = result.message;
    return j;
}

json DoorService::historyJson(const vector<HistoryEntry> &history)
{
    json entries = json::array();
    for (const auto &entry : history)
    {
        entries.push_back({{"timestamp", entry.timestamp}, {"status", toString(entry.status)}});
    }
    return entries;
}

json DoorService::configJson(const DoorwatchConfig &config)
{
    json j;
    j["port"] = config.port;
    j["camera"] = config.camera_source;
    j["width"] = config.width;
    j["height"] = config.height;
    j["fps"] = config.fps;
    j["threshold"] = config.threshold;
    j["uploads"] = config.upload_dir;
    j["jpeg_quality"] = config.jpeg_quality;
    return j;
}

bool DoorService::parseRoi(const json &body, Rect &roi)
{
    int values[4];
    const char *keys[4] = {"x", "y", "width", "height"};

    for (int i = 0; i < 4; i++)
    {
        if (!body.contains(keys[i]))
            return false;

        // Integers only, and only those that fit an int
        const json &field = body[keys[i]];
        if (field.is_number_unsigned())
        {
            if (field.get<uint64_t>() > static_cast<uint64_t>(numeric_limits<int>::max()))
                return false;
        }
        else if (field.is_number_integer())
        {
            int64_t value = field.get<int64_t>();
            if (value < numeric_limits<int>::min() || value > numeric_limits<int>::max())
                return false;
        }
        else
        {
            return false;
        }

        values[i] = static_cast<int>(field.get<int64_t>());
    }

    roi = Rect(values[0], values[1], values[2], values[3]);
    return true;
}

string DoorService::uploadFileName(const string &filename)
{
    // Keep only the last path component of whatever the client sent
    string name = std::filesystem::path(filename).filename().string();
    if (name.empty() || name == "." || name == "..")
        name = "upload.mp4";
    return name;
}

bool DoorService::stageUpload(const string &name, const string &content, string &staged_path, string &final_path)
{
    namespace fs = std::filesystem;

    try
    {
        fs::create_directories(config_.upload_dir);

        // Unique per request, so concurrent uploads of the same name never share a file
        string staged_name = ".incoming-" + to_string(upload_counter_++) + "-" + name;
        fs::path staged = fs::path(config_.upload_dir) / staged_name;

        ofstream file(staged, ios::binary | ios::trunc);
        if (!file)
        {
            log_error("Failed to open " + staged.string() + " for writing");
            return false;
        }

        file.write(content.data(), content.size());
        file.close();
        if (file.fail())
        {
            log_error("Failed to write upload " + staged.string());
            error_code ec;
            fs::remove(staged, ec);
            return false;
        }

        staged_path = staged.string();
        final_path = (fs::path(config_.upload_dir) / name).string();
        log_debug("Staged upload " + log_string_src(staged_path) + " (" + log_string(content.size()) + " bytes)");
        return true;
    }
    catch (const exception &e)
    {
        log_error("Error saving upload: " + string(e.what()));
        return false;
    }
}

bool DoorService::start()
{
    if (running_)
        return true;

    server_ = make_unique<httplib::Server>();
    registerRoutes();

    if (!server_->bind_to_port("0.0.0.0", config_.port))
    {
        log_error("Cannot bind HTTP service to port " + log_string(config_.port));
        server_.reset();
        return false;
    }

    running_ = true;
    worker_thread_ = thread([this]()
                            {
                                log_info("HTTP service listening on http://0.0.0.0:" + to_string(config_.port) + "/");
                                if (!server_->listen_after_bind())
                                    log_error("HTTP service stopped unexpectedly");
                                running_ = false;
                            });

    return true;
}

void DoorService::stop()
{
    if (server_)
        server_->stop();

    if (worker_thread_.joinable())
        worker_thread_.join();

    if (running_)
        log_info("HTTP service stopped");
    running_ = false;
}

void DoorService::registerRoutes()
{
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { reply(res, {{"status", "ok"}, {"service", "OpenDoorwatch"}}); });

    server_->Get("/config", [this](const httplib::Request &, httplib::Response &res)
                 { reply(res, configJson(config_)); });

    registerLiveRoutes();
    registerVideoRoutes();
}

void DoorService::registerLiveRoutes()
{
    server_->Post("/start_live", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, resultJson(live_->start())); });

    server_->Post("/stop_live", [this](const httplib::Request &, httplib::Response &res)
                  {
        json j = resultJson(OperationResult::ok());
        j["history"] = historyJson(live_->stop());
        reply(res, j); });

    server_->Get("/video_feed", [this](const httplib::Request &, httplib::Response &res)
                 {
        if (!live_->isActive())
        {
            res.status = 503;
            reply(res, resultJson(OperationResult::fail(DoorError::NOT_ACTIVE)));
            return;
        }
        log_debug("Live feed client connected");
        streamFrames(res, make_shared<LiveFrameStream>(live_, config_.jpeg_quality)); });

    server_->Post("/set_roi", [this](const httplib::Request &req, httplib::Response &res)
                  {
        json body;
        if (!parseBody(req, res, body))
            return;

        Rect roi;
        if (!parseRoi(body, roi))
        {
            reply(res, resultJson(OperationResult::fail(DoorError::INVALID_REQUEST)));
            return;
        }
        reply(res, resultJson(live_->setRoi(roi))); });

    server_->Post("/calibrate", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, resultJson(live_->calibrate())); });

    server_->Get("/get_frame", [this](const httplib::Request &, httplib::Response &res)
                 {
        Mat frame;
        OperationResult result = live_->readFrame(frame);
        string encoded = result ? frameToBase64(frame, config_.jpeg_quality) : "";
        if (encoded.empty())
        {
            reply(res, {{"success", false}});
            return;
        }
        reply(res, {{"success", true}, {"frame", encoded}}); });

    server_->Post("/adjust_sensitivity", [this](const httplib::Request &req, httplib::Response &res)
                  {
        json body;
        if (!parseBody(req, res, body))
            return;

        string action = body.value("action", "");
        if (action != "increase" && action != "decrease")
        {
            reply(res, resultJson(OperationResult::fail(DoorError::INVALID_REQUEST)));
            return;
        }

        double threshold = 0.0;
        SensitivityDirection direction = (action == "increase") ? SensitivityDirection::INCREASE : SensitivityDirection::DECREASE;
        OperationResult result = live_->adjustSensitivity(direction, threshold);

        json j = resultJson(result);
        if (result)
            j["value"] = threshold;
        reply(res, j); });

    server_->Get("/history", [this](const httplib::Request &, httplib::Response &res)
                 {
        json j = resultJson(OperationResult::ok());
        j["history"] = historyJson(live_->history());
        reply(res, j); });

    server_->Get("/status", [this](const httplib::Request &, httplib::Response &res)
                 {
        json j;
        j["active"] = live_->isActive();

        shared_ptr<DoorDetector> detector = live_->detector();
        if (detector)
        {
            j["status"] = toString(detector->status());
            j["threshold"] = detector->threshold();
            j["calibrated"] = detector->isCalibrated();
            optional<Rect> roi = detector->roi();
            if (roi)
                j["roi"] = {{"x", roi->x}, {"y", roi->y}, {"width", roi->width}, {"height", roi->height}};
        }
        reply(res, j); });
}

void DoorService::registerVideoRoutes()
{
    server_->Post("/upload_video", [this](const httplib::Request &req, httplib::Response &res)
                  {
        if (!req.has_file("video"))
        {
            reply(res, {{"success", false}, {"message", "No video file"}});
            return;
        }

        const auto file = req.get_file_value("video");
        string name = uploadFileName(file.filename);
        string staged_path, final_path;
        if (!stageUpload(name, file.content, staged_path, final_path))
        {
            reply(res, {{"success", false}, {"message", "Could not store video"}});
            return;
        }

        UploadResult uploaded = videos_->commitUpload(staged_path, final_path, name);
        if (!uploaded)
        {
            reply(res, resultJson(uploaded.result));
            return;
        }

        reply(res, {{"success", true},
                    {"first_frame", frameToBase64(uploaded.first_frame, config_.jpeg_quality)},
                    {"total_frames", uploaded.total_frames},
                    {"fps", uploaded.fps},
                    {"filename", uploaded.filename}}); });

    server_->Post("/set_video_roi", [this](const httplib::Request &req, httplib::Response &res)
                  {
        json body;
        if (!parseBody(req, res, body))
            return;

        Rect roi;
        if (!parseRoi(body, roi))
        {
            reply(res, resultJson(OperationResult::fail(DoorError::INVALID_REQUEST)));
            return;
        }
        reply(res, resultJson(videos_->setRoi(roi))); });

    server_->Post("/calibrate_video", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, resultJson(videos_->calibrateFromFirstFrame())); });

    server_->Get("/video_playback_feed", [this](const httplib::Request &, httplib::Response &res)
                 {
        PlaybackInput input;
        OperationResult result = videos_->openPlayback(input);
        if (!result)
        {
            res.status = 404;
            reply(res, resultJson(result));
            return;
        }
        log_debug("Playback feed client connected");
        streamFrames(res, make_shared<PlaybackFrameStream>(std::move(input), config_.jpeg_quality)); });
}
