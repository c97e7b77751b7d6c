#include "board_detector.hpp"
#include "contour_processing.hpp"
#include "utils.hpp"
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

BoardDetector::BoardDetector(const string &name, const board_processing::BoardParams &params, bool debug_mode)
    : name_(name), params_(params), debug_mode_(debug_mode)
{
    log_debug("Board detector '" + name_ + "' ready");
}

BoardDetection BoardDetector::detect(const Mat &frame)
{
    BoardDetection detection = board_processing::detectBoard(frame, params_);

    // One debug image per second at 30 fps is plenty
    if (debug_mode_ && (frame_count_++ % 30) == 0)
    {
        saveDebugImage(frame, detection);
    }

    return detection;
}

void BoardDetector::saveDebugImage(const Mat &frame, const BoardDetection &detection)
{
    if (frame.empty() || !debug::ensureDirectory("debug_frames/board_processing"))
        return;

    Mat overlay;
    cvtColor(frame, overlay, COLOR_RGBA2BGR);

    // Segment masks tinted over the frame
    Mat blue = contour_processing::renderContours(detection.blue_contours, frame.size());
    Mat white = contour_processing::renderContours(detection.white_contours, frame.size());
    Mat red = contour_processing::renderContours(detection.red_contours, frame.size());
    overlay.setTo(Scalar(255, 128, 0), blue);
    overlay.setTo(Scalar(200, 200, 200), white);
    overlay.setTo(Scalar(0, 0, 255), red);

    if (detection.found)
    {
        const BoardGeometry &g = detection.geometry;
        circle(overlay, g.center, cvRound(g.radius), Scalar(0, 255, 0), 2);
        circle(overlay, g.center, 3, Scalar(0, 255, 0), FILLED);
        putText(overlay, "conf " + to_string(g.confidence).substr(0, 4), Point(10, 25), FONT_HERSHEY_SIMPLEX, 0.7, Scalar(0, 255, 0), 2);
    }
    else
    {
        putText(overlay, "no board", Point(10, 25), FONT_HERSHEY_SIMPLEX, 0.7, Scalar(0, 0, 255), 2);
    }

    debug::saveImage("debug_frames/board_processing/board_" + name_ + ".jpg", overlay);
}
