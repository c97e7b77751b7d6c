#pragma once

#include <opencv2/core.hpp>
#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace math
{
    // Euclidean distance between two points
    inline double distanceToPoint(const Point2f &p1, const Point2f &p2)
    {
        double dx = p1.x - p2.x;
        double dy = p1.y - p2.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    // Arithmetic mean of a pixel set, (0,0) for an empty set
    inline Point2f centroid(const vector<Point> &points)
    {
        if (points.empty())
        {
            return Point2f(0, 0);
        }

        double sum_x = 0.0;
        double sum_y = 0.0;
        for (const Point &p : points)
        {
            sum_x += p.x;
            sum_y += p.y;
        }
        return Point2f(static_cast<float>(sum_x / points.size()), static_cast<float>(sum_y / points.size()));
    }

    // Mean distance of a pixel set from a centre
    inline double meanDistance(const vector<Point> &points, const Point2f &center)
    {
        if (points.empty())
        {
            return 0.0;
        }

        double sum = 0.0;
        for (const Point &p : points)
        {
            sum += distanceToPoint(Point2f(p), center);
        }
        return sum / points.size();
    }

    inline double clamp01(double value)
    {
        return std::min(1.0, std::max(0.0, value));
    }

    // Degrees in [0, 360)
    inline double normalizeDegrees(double angle)
    {
        double result = std::fmod(angle, 360.0);
        if (result < 0)
        {
            result += 360.0;
        }
        return result;
    }

} // namespace math
