#include "communication/door_service.hpp"
#include "session/live_session.hpp"
#include "session/video_job.hpp"
#include "source/camera_source.hpp"
#include "source/video_file_source.hpp"
#include "utils/args.hpp"
#include "utils/config.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  // Parse command line arguments with defaults
  DoorwatchConfig config;
  config.port = getArg(argc, argv, "--port", config.port);
  config.camera_source = getArg(argc, argv, "--camera", config.camera_source);
  config.width = getArg(argc, argv, "--width", config.width);
  config.height = getArg(argc, argv, "--height", config.height);
  config.fps = getArg(argc, argv, "--fps", config.fps);
  config.threshold = getArg(argc, argv, "--threshold", config.threshold);
  config.upload_dir = getArg(argc, argv, "--uploads", config.upload_dir);
  config.jpeg_quality = getArg(argc, argv, "--jpeg-quality", config.jpeg_quality);
  config.log_file = getArg(argc, argv, "--log-file", config.log_file);
  config.timestamps = hasFlag(argc, argv, "--timestamps");
  config.debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  config.quiet_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

  // set log level based on debug mode
  if (config.debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG); // Show everything
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (config.quiet_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR); // Only errors
  }

  logging::setShowTimestamp(config.timestamps);

  if (!config.log_file.empty() && !logging::setFileLogging(true, config.log_file))
  {
    log_warning("Cannot write log file " + config.log_file + ", logging to console only");
  }

  debug::printStartup("OpenDoorwatch", version);
  debug::printConfig(config);

  DetectorParams params;
  params.initial_threshold = config.threshold;

  auto live = make_shared<LiveSession>(
      CameraSource::factory(config.camera_source, config.width, config.height, config.fps), params);
  auto videos = make_shared<VideoJobManager>(VideoFileSource::factory(), params);

  DoorService service(live, videos, config);

  signals::setupSignalHandlers();

  if (!service.start())
  {
    log_error("Failed to start HTTP service on port " + to_string(config.port));
    return 1;
  }

  while (service.isRunning() && !signals::shutdownRequested())
  {
    this_thread::sleep_for(chrono::milliseconds(200));
  }

  if (signals::shutdownRequested())
    log_warning("Received signal " + to_string(signals::receivedSignal()) + ", shutting down...");

  // Release the camera first so open streams end, then stop serving
  live->stop();
  service.stop();
  log_info("OpenDoorwatch stopped");
  return 0;
}
