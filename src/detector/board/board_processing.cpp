#include "board_processing.hpp"
#include "contour_processing.hpp"
#include "utils/logging.hpp"
#include "utils/math.hpp"
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace board_processing
{
    BoardParams enhancedBoardParams()
    {
        return BoardParams();
    }

    BoardParams basicBoardParams()
    {
        BoardParams params;
        params.use_white_segments = false;
        params.use_red_rings = false;
        params.min_segment_size = 51; // strictly more than 50 pixels
        params.expected_segments = 15.0;
        params.segment_weight = 0.4;
        params.fit_weight = 0.4;
        params.size_weight = 0.2;
        params.red_bonus_max = 0.0;
        return params;
    }

    CircleFit initialCircle(const vector<Point> &points)
    {
        CircleFit circle;
        if (points.empty())
        {
            return circle;
        }

        circle.center = math::centroid(points);
        circle.radius = math::meanDistance(points, circle.center);
        circle.valid = circle.radius > 0.0;
        return circle;
    }

    double refineRadiusWithRedRings(const vector<Point> &red_points, const Point2f &center, double radius, const BoardParams &params)
    {
        if (radius <= 0.0 || static_cast<int>(red_points.size()) <= params.min_red_points)
        {
            return radius;
        }

        double sum_radius = 0.0;
        int count = 0;

        for (const Point &p : red_points)
        {
            double dist = math::distanceToPoint(Point2f(p), center);
            double normalized = dist / radius;

            if (normalized >= TRIPLE_RING_INNER && normalized <= TRIPLE_RING_OUTER)
            {
                sum_radius += dist / TRIPLE_RING_MID;
                count++;
            }
            else if (normalized >= DOUBLE_RING_INNER && normalized <= DOUBLE_RING_OUTER)
            {
                sum_radius += dist / DOUBLE_RING_MID;
                count++;
            }
        }

        if (count == 0)
        {
            return radius;
        }

        log_debug("Red ring refinement from " + log_string(count) + " anchor pixels");
        return sum_radius / count;
    }

    Point2f refineCenter(const vector<Point> &points, const Point2f &center, double radius, int iterations)
    {
        double cx = center.x;
        double cy = center.y;

        for (int iter = 0; iter < iterations; iter++)
        {
            double sum_dx = 0.0, sum_dy = 0.0;
            int n = 0;

            for (const Point &p : points)
            {
                double dx = p.x - cx;
                double dy = p.y - cy;
                double d = std::sqrt(dx * dx + dy * dy);
                if (d > 0)
                {
                    double error = d - radius;
                    sum_dx += (dx / d) * error;
                    sum_dy += (dy / d) * error;
                    n++;
                }
            }

            if (n > 0)
            {
                cx += sum_dx / n;
                cy += sum_dy / n;
            }
        }

        return Point2f(static_cast<float>(cx), static_cast<float>(cy));
    }

    double fitScore(const vector<Point> &points, const Point2f &center, double radius)
    {
        if (points.empty() || radius <= 0.0)
        {
            return 0.0;
        }

        double total_error = 0.0;
        for (const Point &p : points)
        {
            total_error += std::abs(math::distanceToPoint(Point2f(p), center) - radius);
        }

        double normalized_error = (total_error / points.size()) / radius;
        return std::max(0.0, 1.0 - normalized_error * 2.0);
    }

    double calculateConfidence(size_t segment_count, size_t red_count, double fit_score, double radius, const BoardParams &params)
    {
        double confidence = 0.0;

        double segment_score = std::min(1.0, segment_count / params.expected_segments);
        confidence += segment_score * params.segment_weight;

        if (params.use_red_rings && red_count > 0)
        {
            confidence += std::min(params.red_bonus_max, red_count * params.red_bonus_per_contour);
        }

        confidence += fit_score * params.fit_weight;

        double size_score = (radius >= params.min_radius && radius <= params.max_radius) ? 1.0 : 0.5;
        confidence += size_score * params.size_weight;

        return math::clamp01(confidence);
    }

    BoardDetection detectBoard(const Mat &frame, const BoardParams &params)
    {
        BoardDetection result;

        if (frame.empty() || frame.type() != CV_8UC4)
        {
            log_debug("Board detection needs a non-empty RGBA frame");
            return result;
        }

        // 1. Segment
        color_processing::BoardMasks masks = color_processing::segmentBoard(frame, params.colors);

        // 2. Contours
        result.blue_contours = contour_processing::extractContours(masks.blue, params.min_segment_size);
        if (params.use_white_segments)
        {
            result.white_contours = contour_processing::extractContours(masks.white, params.min_segment_size);
        }
        if (params.use_red_rings)
        {
            result.red_contours = contour_processing::extractContours(masks.red, params.min_red_size);
        }

        size_t segment_count = result.blue_contours.size() + result.white_contours.size();
        if (static_cast<int>(segment_count) < params.min_segments)
        {
            log_debug("Only " + log_string(segment_count) + " board segments visible");
            return result;
        }

        vector<Point> segment_points = contour_processing::flattenContours(result.blue_contours);
        vector<Point> white_points = contour_processing::flattenContours(result.white_contours);
        segment_points.insert(segment_points.end(), white_points.begin(), white_points.end());

        if (static_cast<int>(segment_points.size()) < params.min_fit_points)
        {
            return result;
        }

        // 3. Fit
        CircleFit circle = initialCircle(segment_points);
        if (!circle.valid)
        {
            return result;
        }

        if (params.use_red_rings)
        {
            vector<Point> red_points = contour_processing::flattenContours(result.red_contours);
            circle.radius = refineRadiusWithRedRings(red_points, circle.center, circle.radius, params);
        }
        circle.center = refineCenter(segment_points, circle.center, circle.radius, params.refine_iterations);

        // 4. Validate
        if (circle.radius < params.min_radius || circle.radius > params.max_radius)
        {
            log_debug("Board radius " + log_string(circle.radius) + " outside accepted range");
            return result;
        }

        double fit = fitScore(segment_points, circle.center, circle.radius);
        double confidence = calculateConfidence(segment_count, result.red_contours.size(), fit, circle.radius, params);
        if (confidence < params.min_confidence)
        {
            log_debug("Board confidence " + log_string(confidence) + " below threshold");
            return result;
        }

        result.found = true;
        result.geometry.center = circle.center;
        result.geometry.radius = circle.radius;
        result.geometry.confidence = confidence;
        return result;
    }

    BoardSmoother::BoardSmoother(size_t max_history) : max_history_(std::max<size_t>(1, max_history)) {}

    void BoardSmoother::addDetection(const BoardDetection &detection)
    {
        if (!detection.found)
        {
            return;
        }

        history_.push_back(detection);
        while (history_.size() > max_history_)
        {
            history_.pop_front();
        }
    }

    BoardDetection BoardSmoother::getSmoothed() const
    {
        BoardDetection smoothed;
        if (history_.empty())
        {
            return smoothed;
        }

        double sum_x = 0.0, sum_y = 0.0, sum_r = 0.0, sum_conf = 0.0;
        for (const BoardDetection &det : history_)
        {
            sum_x += det.geometry.center.x;
            sum_y += det.geometry.center.y;
            sum_r += det.geometry.radius;
            sum_conf += det.geometry.confidence;
        }

        double n = static_cast<double>(history_.size());
        const BoardDetection &latest = history_.back();

        smoothed.found = true;
        smoothed.geometry.center = Point2f(static_cast<float>(sum_x / n), static_cast<float>(sum_y / n));
        smoothed.geometry.radius = sum_r / n;
        smoothed.geometry.confidence = sum_conf / n;
        smoothed.blue_contours = latest.blue_contours;
        smoothed.white_contours = latest.white_contours;
        smoothed.red_contours = latest.red_contours;
        return smoothed;
    }

    void BoardSmoother::reset()
    {
        history_.clear();
    }

} // namespace board_processing
