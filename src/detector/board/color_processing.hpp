#pragma once

#include <opencv2/core.hpp>
#include <string>

using namespace cv;
using namespace std;

namespace color_processing
{
    // Inclusive HSV window: hue in degrees [0,360), saturation and value in [0,255]
    struct HsvRange
    {
        double h_min = 0, h_max = 360;
        double s_min = 0, s_max = 255;
        double v_min = 0, v_max = 255;
        bool wraps_hue = false; // Also match hues at the top of the circle
    };

    enum class ColorCategory
    {
        BOARD_BLUE,
        BOARD_WHITE,
        BOARD_RED,
        DART_BLACK
    };

    struct ColorParams
    {
        HsvRange blue{200, 240, 50, 255, 50, 255, false};
        HsvRange white{0, 360, 0, 30, 200, 255, false};
        HsvRange red{0, 15, 100, 255, 100, 255, true};
        HsvRange dart_black{0, 360, 0, 255, 0, 204, false}; // v <= 80%

        double wrap_hue_start = 345.0; // Lower bound of the wrapped red window
    };

    struct Hsv
    {
        double h = 0; // degrees
        double s = 0; // 0..255
        double v = 0; // 0..255
    };

    // Per-pixel matching masks of the three board colours
    struct BoardMasks
    {
        Mat blue;
        Mat white;
        Mat red;
    };

    Hsv rgbToHsv(uchar r, uchar g, uchar b);

    bool matchesRange(const Hsv &hsv, const HsvRange &range, double wrap_hue_start = 345.0);

    const HsvRange &rangeFor(ColorCategory category, const ColorParams &params);

    // RGBA frame -> CV_32FC3 with H in degrees, S and V in [0,1]
    Mat convertToHsv(const Mat &frame);

    // CV_8UC1 mask, 255 where every bound holds
    Mat segmentHsv(const Mat &hsv, const HsvRange &range, double wrap_hue_start = 345.0);

    Mat segmentColor(const Mat &frame, const HsvRange &range, const ColorParams &params = ColorParams());

    Mat segmentCategory(const Mat &frame, ColorCategory category, const ColorParams &params = ColorParams());

    // One conversion, three masks
    BoardMasks segmentBoard(const Mat &frame, const ColorParams &params = ColorParams());

    string getColorCategoryName(ColorCategory category);
}
