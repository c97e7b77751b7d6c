#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include "detector/detector_interface.hpp"

using namespace cv;
using namespace std;

namespace contour_processing
{
    struct ContourParams
    {
        int min_contour_size = 50; // Components with fewer pixels are dropped
        int max_contour_size = 0;  // 0 = no upper bound
        int connectivity = 4;      // 4-connected flood fill
    };

    // Connected components of every non-zero pixel of a CV_8UC1 mask
    vector<Contour> extractContours(const Mat &mask, const ContourParams &params = ContourParams());

    vector<Contour> extractContours(const Mat &mask, int min_size, int max_size = 0);

    // All points of all contours in one set
    vector<Point> flattenContours(const vector<Contour> &contours);

    size_t countPoints(const vector<Contour> &contours);

    // Index of the contour with the most points, -1 for none
    int findLargestContour(const vector<Contour> &contours);

    // Draw contours as filled pixels into a CV_8UC1 mask of the given size
    Mat renderContours(const vector<Contour> &contours, const Size &size);

} // namespace contour_processing
