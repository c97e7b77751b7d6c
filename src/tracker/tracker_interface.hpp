#pragma once
#include <opencv2/core.hpp>
#include "calibration.hpp"

using namespace cv;

// Supplies RGBA (CV_8UC4) frames on demand
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // False when no frame is available right now
    virtual bool captureFrame(Mat &frame) = 0;

    virtual bool isOpened() const = 0;
};

// Keeps the single calibration record between sessions
class CalibrationStore
{
public:
    virtual ~CalibrationStore() = default;

    // False when nothing usable is stored
    virtual bool load(CalibrationData &data) = 0;

    virtual bool save(const CalibrationData &data) = 0;
};
