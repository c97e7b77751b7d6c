#include "contour_processing.hpp"
#include <opencv2/imgproc.hpp>
#include "utils/logging.hpp"

using namespace cv;
using namespace std;

namespace contour_processing
{
    vector<Contour> extractContours(const Mat &mask, const ContourParams &params)
    {
        vector<Contour> contours;
        if (mask.empty() || mask.type() != CV_8UC1)
        {
            log_debug("Contour extraction needs a non-empty CV_8UC1 mask");
            return contours;
        }

        Mat labels, stats, centroids;
        int num_labels = connectedComponentsWithStats(mask, labels, stats, centroids, params.connectivity, CV_32S);

        // Label -> output slot, -1 for filtered components (label 0 is background)
        vector<int> slot(num_labels, -1);
        for (int label = 1; label < num_labels; label++)
        {
            int area = stats.at<int>(label, CC_STAT_AREA);
            if (area < params.min_contour_size)
                continue;
            if (params.max_contour_size > 0 && area > params.max_contour_size)
                continue;

            slot[label] = static_cast<int>(contours.size());
            contours.emplace_back();
            contours.back().reserve(area);
        }

        if (contours.empty())
        {
            return contours;
        }

        for (int y = 0; y < labels.rows; y++)
        {
            const int *row = labels.ptr<int>(y);
            for (int x = 0; x < labels.cols; x++)
            {
                int label = row[x];
                if (label > 0 && slot[label] >= 0)
                {
                    contours[slot[label]].push_back(Point(x, y));
                }
            }
        }

        return contours;
    }

    vector<Contour> extractContours(const Mat &mask, int min_size, int max_size)
    {
        ContourParams params;
        params.min_contour_size = min_size;
        params.max_contour_size = max_size;
        return extractContours(mask, params);
    }

    vector<Point> flattenContours(const vector<Contour> &contours)
    {
        vector<Point> points;
        points.reserve(countPoints(contours));
        for (const Contour &contour : contours)
        {
            points.insert(points.end(), contour.begin(), contour.end());
        }
        return points;
    }

    size_t countPoints(const vector<Contour> &contours)
    {
        size_t total = 0;
        for (const Contour &contour : contours)
        {
            total += contour.size();
        }
        return total;
    }

    int findLargestContour(const vector<Contour> &contours)
    {
        int best = -1;
        size_t best_size = 0;
        for (size_t i = 0; i < contours.size(); i++)
        {
            if (contours[i].size() > best_size)
            {
                best_size = contours[i].size();
                best = static_cast<int>(i);
            }
        }
        return best;
    }

    Mat renderContours(const vector<Contour> &contours, const Size &size)
    {
        Mat mask = Mat::zeros(size, CV_8UC1);
        for (const Contour &contour : contours)
        {
            for (const Point &p : contour)
            {
                if (p.x >= 0 && p.y >= 0 && p.x < size.width && p.y < size.height)
                {
                    mask.at<uchar>(p) = 255;
                }
            }
        }
        return mask;
    }

} // namespace contour_processing
