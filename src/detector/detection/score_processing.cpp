#include "score_processing.hpp"
#include "utils/logging.hpp"
#include "utils/math.hpp"
#include <cmath>

using namespace cv;
using namespace std;

namespace score_processing
{
    Point2f normalizePoint(const Point2f &point, const BoardGeometry &board)
    {
        if (board.radius <= 0.0)
        {
            return Point2f(0, 0);
        }
        return Point2f(static_cast<float>((point.x - board.center.x) / board.radius),
                       static_cast<float>((point.y - board.center.y) / board.radius));
    }

    PolarPoint toPolar(const Point2f &normalized)
    {
        PolarPoint polar;
        polar.distance = std::sqrt(static_cast<double>(normalized.x) * normalized.x + static_cast<double>(normalized.y) * normalized.y);

        // atan2(x, -y): 0 at the top, growing clockwise in image coordinates
        polar.angle = math::normalizeDegrees(std::atan2(normalized.x, -normalized.y) * 180.0 / CV_PI);
        return polar;
    }

    Ring getRing(double distance)
    {
        if (distance <= BULLSEYE_RADIUS)
            return Ring::BULLSEYE;
        if (distance <= BULL_RADIUS)
            return Ring::BULL;
        if (distance <= INNER_SINGLE_RADIUS)
            return Ring::INNER_SINGLE;
        if (distance <= TRIPLE_RADIUS)
            return Ring::TRIPLE;
        if (distance <= OUTER_SINGLE_RADIUS)
            return Ring::OUTER_SINGLE;
        if (distance <= DOUBLE_RADIUS)
            return Ring::DOUBLE;
        return Ring::MISS;
    }

    int getMultiplier(Ring ring)
    {
        switch (ring)
        {
        case Ring::TRIPLE:
            return 3;
        case Ring::DOUBLE:
            return 2;
        default:
            return 1;
        }
    }

    int getSegmentFromAngle(double angle)
    {
        // Segment 20 spans [351, 9)
        double adjusted = math::normalizeDegrees(angle + SEGMENT_ANGLE / 2.0);
        int index = static_cast<int>(std::floor(adjusted / SEGMENT_ANGLE));
        if (index < 0 || index > 19)
        {
            index = 0;
        }
        return SEGMENT_ORDER[index];
    }

    ScoreResult mapToSegment(const Point2f &normalized, const Point2f &dart_position, double confidence)
    {
        ScoreResult result;
        result.confidence = math::clamp01(confidence);
        result.dart_position = dart_position;
        result.normalized_position = normalized;

        PolarPoint polar = toPolar(normalized);
        result.ring = getRing(polar.distance);

        switch (result.ring)
        {
        case Ring::MISS:
            result.segment = 0;
            result.multiplier = 1;
            result.points = 0;
            break;

        case Ring::BULLSEYE:
            result.segment = BULLSEYE_POINTS;
            result.multiplier = 1;
            result.points = BULLSEYE_POINTS;
            break;

        case Ring::BULL:
            result.segment = BULL_POINTS;
            result.multiplier = 1;
            result.points = BULL_POINTS;
            break;

        default:
            result.segment = getSegmentFromAngle(polar.angle);
            result.multiplier = getMultiplier(result.ring);
            result.points = result.segment * result.multiplier;
            break;
        }

        return result;
    }

    string formatScore(const ScoreResult &score)
    {
        if (score.points == 0)
            return "MISS";
        if (score.segment == BULLSEYE_POINTS)
            return "BULL";
        if (score.segment == BULL_POINTS)
            return "OUTER";

        string prefix = score.multiplier == 3 ? "T" : score.multiplier == 2 ? "D" : "S";
        return prefix + to_string(score.segment);
    }

    bool validateScore(const ScoreResult &score)
    {
        bool bull = score.segment == BULL_POINTS || score.segment == BULLSEYE_POINTS;

        if (score.segment < 0 || (score.segment > 20 && !bull))
            return false;

        if (score.multiplier < 1 || score.multiplier > 3)
            return false;

        if (score.segment > 0 && score.segment <= 20 && score.points != score.segment * score.multiplier)
            return false;

        if (bull && (score.multiplier != 1 || score.points != score.segment))
            return false;

        return true;
    }

    string getRingName(Ring ring)
    {
        switch (ring)
        {
        case Ring::BULLSEYE:
            return "bullseye";
        case Ring::BULL:
            return "bull";
        case Ring::INNER_SINGLE:
            return "inner single";
        case Ring::TRIPLE:
            return "triple";
        case Ring::OUTER_SINGLE:
            return "outer single";
        case Ring::DOUBLE:
            return "double";
        case Ring::MISS:
        default:
            return "miss";
        }
    }

} // namespace score_processing
