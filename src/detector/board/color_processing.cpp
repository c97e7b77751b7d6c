#include "color_processing.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

using namespace cv;
using namespace std;

namespace color_processing
{
    Hsv rgbToHsv(uchar r, uchar g, uchar b)
    {
        double rf = r / 255.0;
        double gf = g / 255.0;
        double bf = b / 255.0;

        double max_c = std::max(rf, std::max(gf, bf));
        double min_c = std::min(rf, std::min(gf, bf));
        double delta = max_c - min_c;

        Hsv hsv;
        hsv.v = max_c * 255.0;
        hsv.s = max_c > 0 ? (delta / max_c) * 255.0 : 0.0;

        if (delta > 0)
        {
            if (max_c == rf)
                hsv.h = 60.0 * (gf - bf) / delta;
            else if (max_c == gf)
                hsv.h = 120.0 + 60.0 * (bf - rf) / delta;
            else
                hsv.h = 240.0 + 60.0 * (rf - gf) / delta;

            if (hsv.h < 0)
                hsv.h += 360.0;
        }

        return hsv;
    }

    bool matchesRange(const Hsv &hsv, const HsvRange &range, double wrap_hue_start)
    {
        bool hue_ok = hsv.h >= range.h_min && hsv.h <= range.h_max;
        if (range.wraps_hue && hsv.h >= wrap_hue_start)
        {
            hue_ok = true;
        }

        return hue_ok &&
               hsv.s >= range.s_min && hsv.s <= range.s_max &&
               hsv.v >= range.v_min && hsv.v <= range.v_max;
    }

    const HsvRange &rangeFor(ColorCategory category, const ColorParams &params)
    {
        switch (category)
        {
        case ColorCategory::BOARD_BLUE:
            return params.blue;
        case ColorCategory::BOARD_WHITE:
            return params.white;
        case ColorCategory::BOARD_RED:
            return params.red;
        case ColorCategory::DART_BLACK:
        default:
            return params.dart_black;
        }
    }

    Mat convertToHsv(const Mat &frame)
    {
        Mat rgb, rgb_float, hsv;
        cvtColor(frame, rgb, COLOR_RGBA2RGB);
        rgb.convertTo(rgb_float, CV_32FC3, 1.0 / 255.0);
        cvtColor(rgb_float, hsv, COLOR_RGB2HSV);
        return hsv;
    }

    Mat segmentHsv(const Mat &hsv, const HsvRange &range, double wrap_hue_start)
    {
        Scalar lower(range.h_min, range.s_min / 255.0, range.v_min / 255.0);
        Scalar upper(range.h_max, range.s_max / 255.0, range.v_max / 255.0);

        Mat mask;
        inRange(hsv, lower, upper, mask);

        // Red straddles 0 degrees
        if (range.wraps_hue)
        {
            Mat wrapped;
            inRange(hsv,
                    Scalar(wrap_hue_start, lower[1], lower[2]),
                    Scalar(360.0, upper[1], upper[2]),
                    wrapped);
            bitwise_or(mask, wrapped, mask);
        }

        return mask;
    }

    Mat segmentColor(const Mat &frame, const HsvRange &range, const ColorParams &params)
    {
        return segmentHsv(convertToHsv(frame), range, params.wrap_hue_start);
    }

    Mat segmentCategory(const Mat &frame, ColorCategory category, const ColorParams &params)
    {
        return segmentColor(frame, rangeFor(category, params), params);
    }

    BoardMasks segmentBoard(const Mat &frame, const ColorParams &params)
    {
        Mat hsv = convertToHsv(frame);

        BoardMasks masks;
        masks.blue = segmentHsv(hsv, params.blue, params.wrap_hue_start);
        masks.white = segmentHsv(hsv, params.white, params.wrap_hue_start);
        masks.red = segmentHsv(hsv, params.red, params.wrap_hue_start);
        return masks;
    }

    string getColorCategoryName(ColorCategory category)
    {
        switch (category)
        {
        case ColorCategory::BOARD_BLUE:
            return "board-blue";
        case ColorCategory::BOARD_WHITE:
            return "board-white";
        case ColorCategory::BOARD_RED:
            return "board-red";
        case ColorCategory::DART_BLACK:
            return "dart-black";
        default:
            return "unknown";
        }
    }
}
