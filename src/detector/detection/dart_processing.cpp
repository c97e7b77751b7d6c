#include "dart_processing.hpp"
#include "utils/logging.hpp"
#include "utils/math.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace cv;
using namespace std;

namespace dart_processing
{
    DartParams motionValidatorParams()
    {
        return DartParams();
    }

    DartParams smartValidatorParams()
    {
        DartParams params;
        params.base_confidence = 0.0;
        params.ideal_aspect_min = 2.0;
        params.ideal_aspect_max = 10.0;
        params.ideal_aspect_bonus = 0.3;
        params.position_from_tip = true;
        params.position_bonus_ratio = 1.1;
        params.position_bonus = 0.2;
        params.max_contrast_bonus = 0.3;
        params.edge_bonus = 0.2;
        params.min_confidence = 0.4;
        return params;
    }

    DartParams validatorParamsByName(const string &name)
    {
        if (name == "smart")
            return smartValidatorParams();
        if (name != "motion")
            log_warning("Unknown dart validator: " + name + ", using motion");
        return motionValidatorParams();
    }

    double calculateAspectRatio(const Contour &contour)
    {
        if (contour.size() < 4)
            return 0.0;

        int min_x = numeric_limits<int>::max(), max_x = numeric_limits<int>::min();
        int min_y = numeric_limits<int>::max(), max_y = numeric_limits<int>::min();
        for (const Point &p : contour)
        {
            min_x = std::min(min_x, p.x);
            max_x = std::max(max_x, p.x);
            min_y = std::min(min_y, p.y);
            max_y = std::max(max_y, p.y);
        }

        double width = max_x - min_x;
        double height = max_y - min_y;
        if (width == 0 || height == 0)
            return 0.0;

        return std::max(width / height, height / width);
    }

    double calculateContrast(const Contour &contour, const Mat &current_gray, const Mat &reference_gray)
    {
        double total = 0.0;
        int count = 0;
        Rect bounds(0, 0, current_gray.cols, current_gray.rows);

        for (const Point &p : contour)
        {
            if (!bounds.contains(p))
                continue;
            total += std::abs(static_cast<int>(current_gray.at<uchar>(p)) - static_cast<int>(reference_gray.at<uchar>(p)));
            count++;
        }

        return count > 0 ? total / count : 0.0;
    }

    LinearEdge findLinearEdge(const Contour &contour, const DartParams &params)
    {
        LinearEdge edge;
        if (contour.size() < 10 || params.edge_run < 2)
            return edge;

        // Pixel set -> padded mask -> ordered outer boundary
        Rect box = boundingRect(contour);
        Mat mask = Mat::zeros(box.height + 2, box.width + 2, CV_8UC1);
        for (const Point &p : contour)
        {
            mask.at<uchar>(p.y - box.y + 1, p.x - box.x + 1) = 255;
        }

        vector<vector<Point>> boundaries;
        findContours(mask, boundaries, RETR_EXTERNAL, CHAIN_APPROX_NONE);
        if (boundaries.empty())
            return edge;

        const vector<Point> &boundary = *max_element(boundaries.begin(), boundaries.end(),
                                                     [](const vector<Point> &a, const vector<Point> &b)
                                                     { return a.size() < b.size(); });

        const size_t n = boundary.size();
        const size_t run = static_cast<size_t>(params.edge_run);
        if (n <= run)
            return edge;

        // walked[k] = boundary length from point 0 to point k, two laps
        vector<double> walked(2 * n + 1, 0.0);
        for (size_t k = 0; k < 2 * n; k++)
        {
            const Point &a = boundary[k % n];
            const Point &b = boundary[(k + 1) % n];
            walked[k + 1] = walked[k] + math::distanceToPoint(Point2f(a), Point2f(b));
        }

        for (size_t i = 0; i < n; i++)
        {
            const Point &start = boundary[i];
            const Point &end = boundary[(i + run) % n];
            double chord = math::distanceToPoint(Point2f(start), Point2f(end));
            double path = walked[i + run] - walked[i];

            if (chord < params.min_edge_length || path <= 0 || chord < params.min_edge_straightness * path)
                continue;

            if (chord > edge.length)
            {
                edge.found = true;
                edge.length = chord;
                edge.angle = std::atan2(end.y - start.y, end.x - start.x) * 180.0 / CV_PI;
            }
        }

        return edge;
    }

    Point2f findTipClosestToCenter(const Contour &contour, const Point2f &center)
    {
        Point2f tip(-1, -1);
        double best = numeric_limits<double>::max();
        for (const Point &p : contour)
        {
            double d = math::distanceToPoint(Point2f(p), center);
            if (d < best)
            {
                best = d;
                tip = Point2f(p);
            }
        }
        return tip;
    }

    Contour findDarkPixels(const Contour &contour, const Mat &frame, const color_processing::ColorParams &colors)
    {
        Contour dark;
        Rect bounds(0, 0, frame.cols, frame.rows);

        for (const Point &p : contour)
        {
            if (!bounds.contains(p))
                continue;
            const Vec4b &px = frame.at<Vec4b>(p);
            color_processing::Hsv hsv = color_processing::rgbToHsv(px[0], px[1], px[2]);
            if (color_processing::matchesRange(hsv, colors.dart_black, colors.wrap_hue_start))
            {
                dark.push_back(p);
            }
        }

        return dark;
    }

    DartCandidate validateDartCandidate(const Contour &contour, const BoardGeometry &board, const Mat &current, const Mat &reference, const DartParams &params)
    {
        DartCandidate candidate;
        candidate.contour = contour;
        candidate.area = static_cast<int>(contour.size());

        if (board.radius <= 0.0)
        {
            candidate.rejection = "no board geometry";
            return candidate;
        }

        // 1. Size
        if (candidate.area < params.min_dart_area || candidate.area > params.max_dart_area)
        {
            candidate.rejection = "area " + to_string(candidate.area);
            return candidate;
        }

        // 2. Position
        candidate.centroid = math::centroid(contour);
        double center_distance = math::distanceToPoint(candidate.centroid, board.center) / board.radius;
        if (center_distance > params.max_center_distance_ratio)
        {
            candidate.rejection = "outside board";
            return candidate;
        }

        // 3. Shape
        candidate.aspect_ratio = calculateAspectRatio(contour);
        if (candidate.aspect_ratio < params.min_aspect_ratio || candidate.aspect_ratio > params.max_aspect_ratio)
        {
            candidate.rejection = "aspect ratio " + to_string(candidate.aspect_ratio);
            return candidate;
        }

        // Scoring end of the dart faces the bull
        candidate.tip = findTipClosestToCenter(contour, board.center);
        if (params.refine_tip_with_dark_pixels)
        {
            Contour dark = findDarkPixels(contour, current, params.colors);
            if (static_cast<int>(dark.size()) >= params.min_dark_pixels)
            {
                candidate.tip = findTipClosestToCenter(dark, board.center);
            }
        }

        double confidence = params.base_confidence;

        if (candidate.aspect_ratio >= params.ideal_aspect_min && candidate.aspect_ratio <= params.ideal_aspect_max)
        {
            confidence += params.ideal_aspect_bonus;
        }

        if (params.position_from_tip)
        {
            double tip_distance = math::distanceToPoint(candidate.tip, board.center) / board.radius;
            if (tip_distance <= params.position_bonus_ratio)
                confidence += params.position_bonus;
        }
        else if (center_distance < params.position_bonus_ratio)
        {
            confidence += params.position_bonus;
        }

        if (params.use_contrast && !current.empty() && !reference.empty())
        {
            candidate.contrast = calculateContrast(contour, diff_processing::toGrayscale(current), diff_processing::toGrayscale(reference));
            if (candidate.contrast >= params.min_contrast)
            {
                confidence += std::min(params.max_contrast_bonus, candidate.contrast / params.contrast_scale);
            }
        }

        if (params.use_linear_edge)
        {
            candidate.edge = findLinearEdge(contour, params);
            if (candidate.edge.found)
            {
                confidence += params.edge_bonus;
            }
        }

        candidate.confidence = math::clamp01(confidence);
        if (candidate.confidence < params.min_confidence)
        {
            candidate.rejection = "confidence " + to_string(candidate.confidence);
            return candidate;
        }

        candidate.found = true;
        return candidate;
    }

    DartCandidate detectNewDart(const Mat &current, const Mat &reference, const BoardGeometry &board, const DartParams &params, diff_processing::DiffResult *diff_out)
    {
        diff_processing::DiffResult diff = diff_processing::detectFrameDifference(current, reference, params.diff);

        DartCandidate candidate;
        if (diff.found)
        {
            candidate = validateDartCandidate(diff.largest_contour, board, current, reference, params);
            if (!candidate.found)
            {
                log_debug("Dart candidate rejected: " + candidate.rejection);
            }
        }
        else
        {
            candidate.rejection = diff.input_valid ? "no significant difference" : "invalid frames";
        }

        if (diff_out)
        {
            *diff_out = std::move(diff);
        }
        return candidate;
    }

} // namespace dart_processing
