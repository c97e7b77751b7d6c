#include "communication/event_queue.hpp"
#include "communication/event_service.hpp"
#include "detector/detector_factory.hpp"
#include "tracker/calibration.hpp"
#include "tracker/dart_tracker.hpp"
#include "tracker/tracker_runner.hpp"
#include "utils/args.hpp"
#include "utils/cache.hpp"
#include "utils/camera.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <memory>
#include <string>

using namespace std;

const string version = "0.1.0";

int main(int argc, char **argv)
{
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  string cam = getArg(argc, argv, "--cam", "/dev/video0");
  int width = getArg(argc, argv, "--width", 640);
  int height = getArg(argc, argv, "--height", 480);
  int fps = getArg(argc, argv, "--fps", 30);
  string board_type = getArg(argc, argv, "--board", "enhanced");
  string validator = getArg(argc, argv, "--validator", "motion");
  string calibration_path = getArg(argc, argv, "--calibration", cache::calibration::DEFAULT_PATH);
  int port = getArg(argc, argv, "--port", 13520);
  bool no_server = hasFlag(argc, argv, "--no-server");
  int debounce_ms = getArg(argc, argv, "--debounce", 1000);
  bool debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  bool quiet_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

  if (debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (quiet_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR);
  }
  logging::setFileLogging(true);

  debug::printStartup("DartSight", version);
  debug::printConfig(width, height, fps, cam, board_type, validator, calibration_path, no_server ? 0 : port);

  CameraFrameSource source(cam, width, height, fps);
  if (!source.isOpened())
  {
    log_error("No frame source, exiting");
    return 1;
  }

  FileCalibrationStore store(calibration_path);
  auto events = make_shared<EventQueue>();

  TrackerParams params;
  params.detection_debounce_ms = debounce_ms;
  params.debug_mode = debug_mode;
  params.dart = dart_processing::validatorParamsByName(validator);

  DartTracker tracker(source,
                      DetectorFactory::createBoardDetector(board_type, debug_mode),
                      events->makeCallbacks(),
                      params,
                      &store);

  if (!tracker.loadCalibration())
  {
    tracker.initialize(calibration::getDefaultCalibration(width, height));
  }

  unique_ptr<EventService> service;
  if (!no_server)
  {
    service = make_unique<EventService>(
        events,
        [&tracker]()
        { return trackerSnapshot(tracker); },
        [&tracker]()
        { tracker.startTurn(); },
        port);
    service->start();
  }

  TrackerRunner runner(tracker);
  signals::setupSignalHandlers([&runner]()
                               { runner.requestStop(); });

  tracker.startTurn();
  runner.run();

  if (service)
  {
    service->stop();
  }

  log_info("DartSight stopped");
  return 0;
}
