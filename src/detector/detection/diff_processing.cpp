#include "diff_processing.hpp"
#include "detector/board/contour_processing.hpp"
#include "utils/logging.hpp"
#include "utils/math.hpp"
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

namespace diff_processing
{
    bool isValidFrame(const Mat &frame)
    {
        return !frame.empty() && frame.type() == CV_8UC4;
    }

    bool haveSameDimensions(const Mat &a, const Mat &b)
    {
        return a.size() == b.size();
    }

    Mat toGrayscale(const Mat &frame)
    {
        Mat gray;
        cvtColor(frame, gray, COLOR_RGBA2GRAY);
        return gray;
    }

    Mat differenceMask(const Mat &current_gray, const Mat &reference_gray, const DiffParams &params)
    {
        Mat diff;
        absdiff(current_gray, reference_gray, diff);

        Mat thresh;
        threshold(diff, thresh, params.diff_threshold, 255, THRESH_BINARY);

        // Close single-pixel gaps from noise and compression
        Mat kernel = getStructuringElement(MORPH_RECT, Size(params.dilate_kernel_size, params.dilate_kernel_size));
        Mat cleaned;
        dilate(thresh, cleaned, kernel);
        return cleaned;
    }

    Point2f findFarthestPoint(const Contour &contour, const Point2f &from)
    {
        Point2f farthest(-1, -1);
        double best = -1.0;
        for (const Point &p : contour)
        {
            double d = math::distanceToPoint(Point2f(p), from);
            if (d > best)
            {
                best = d;
                farthest = Point2f(p);
            }
        }
        return farthest;
    }

    DiffResult detectFrameDifference(const Mat &current, const Mat &reference, const DiffParams &params)
    {
        DiffResult result;

        if (!isValidFrame(current) || !isValidFrame(reference) || !haveSameDimensions(current, reference))
        {
            log_debug("Frame difference skipped: frames must be RGBA and of equal size");
            return result;
        }
        result.input_valid = true;

        result.mask = differenceMask(toGrayscale(current), toGrayscale(reference), params);
        result.change_area = countNonZero(result.mask);
        if (result.change_area == 0)
        {
            return result;
        }

        vector<Contour> contours = contour_processing::extractContours(result.mask, params.min_contour_area, params.max_contour_area);
        int largest = contour_processing::findLargestContour(contours);
        if (largest < 0)
        {
            return result;
        }

        result.found = true;
        result.largest_contour = std::move(contours[largest]);
        result.centroid = math::centroid(result.largest_contour);
        result.tip = findFarthestPoint(result.largest_contour, result.centroid);
        return result;
    }

} // namespace diff_processing
