#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

using namespace cv;
using namespace std;

// Board truth persisted between sessions
struct CalibrationData
{
    Point2f center{0, 0};
    double radius = 0.0;
    string reference_frame = ""; // Empty-board snapshot as an image data URL, empty when none
    int64_t timestamp = 0;       // Milliseconds since epoch of the last update

    bool hasReferenceFrame() const { return !reference_frame.empty(); }
};

namespace calibration
{
    // Centre of the frame, radius 0.4 of the shorter side
    CalibrationData getDefaultCalibration(int width, int height);

    bool isCalibrationComplete(const CalibrationData &data);

    // Pixel -> board-relative coordinates where the double ring's outer edge is 1.0
    Point2f normalizePoint(const Point2f &point, const Point2f &center, double radius);

    // Distance from the board centre in board radii
    double distanceFromCenter(const Point2f &point, const Point2f &center, double radius);

    // Copy of data carrying a new snapshot, stamped with timestamp_ms
    CalibrationData setReferenceFrame(const CalibrationData &data, const string &data_url, int64_t timestamp_ms);

    int64_t currentTimestampMs();

} // namespace calibration
