#pragma once

#include <opencv2/core.hpp>
#include "detector/detector_interface.hpp"

using namespace cv;
using namespace std;

namespace diff_processing
{
    struct DiffParams
    {
        int diff_threshold = 30;       // Grey levels a pixel must change by (strictly more)
        int dilate_kernel_size = 3;    // One dilation pass, no erosion
        int min_contour_area = 50;     // Pixels
        int max_contour_area = 10000;  // Larger regions are lighting shifts
    };

    struct DiffResult
    {
        bool input_valid = false;       // Both frames RGBA and the same size
        bool found = false;             // A contour passed the size filter
        int change_area = 0;            // Set pixels in the cleaned mask, reported even when found is false
        Contour largest_contour;        // Biggest qualifying region
        Point2f centroid{-1, -1};       // Of the largest region
        Point2f tip{-1, -1};            // Region point farthest from its centroid
        Mat mask;                       // Cleaned binary difference

        // Easy boolean check
        operator bool() const { return found; }
    };

    bool isValidFrame(const Mat &frame);

    bool haveSameDimensions(const Mat &a, const Mat &b);

    // RGBA -> grey with 0.299/0.587/0.114 weights
    Mat toGrayscale(const Mat &frame);

    // Thresholded, dilated absolute difference of two grey images
    Mat differenceMask(const Mat &current_gray, const Mat &reference_gray, const DiffParams &params = DiffParams());

    Point2f findFarthestPoint(const Contour &contour, const Point2f &from);

    DiffResult detectFrameDifference(const Mat &current, const Mat &reference, const DiffParams &params = DiffParams());

} // namespace diff_processing
