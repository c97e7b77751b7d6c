#pragma once

#include <opencv2/core.hpp>
#include <string>
#include "detector/detector_interface.hpp"

using namespace cv;
using namespace std;

namespace score_processing
{
    // Clockwise from the top
    const int SEGMENT_ORDER[20] = {20, 1, 18, 4, 13, 6, 10, 15, 2, 17, 3, 19, 7, 16, 8, 11, 14, 9, 12, 5};
    const double SEGMENT_ANGLE = 18.0;

    // Outer edge of each ring, board radius = 1.0
    const double BULLSEYE_RADIUS = 0.037;
    const double BULL_RADIUS = 0.093;
    const double INNER_SINGLE_RADIUS = 0.582;
    const double TRIPLE_RADIUS = 0.629;
    const double OUTER_SINGLE_RADIUS = 0.953;
    const double DOUBLE_RADIUS = 1.0;

    const int BULLSEYE_POINTS = 50;
    const int BULL_POINTS = 25;

    enum class Ring
    {
        BULLSEYE,
        BULL,
        INNER_SINGLE,
        TRIPLE,
        OUTER_SINGLE,
        DOUBLE,
        MISS
    };

    struct PolarPoint
    {
        double angle = 0.0;    // Degrees [0,360), 0 at 12 o'clock, clockwise
        double distance = 0.0; // Board radii
    };

    // Score result for a single dart
    struct ScoreResult
    {
        int segment = 0;    // 1..20, 25, 50, 0 for a miss
        int multiplier = 1; // 1, 2 or 3
        int points = 0;
        double confidence = 0.0;
        Ring ring = Ring::MISS;
        Point2f dart_position{-1, -1};       // Pixels
        Point2f normalized_position{0, 0};   // Board radii
    };

    // Pixel -> board radii relative to the centre
    Point2f normalizePoint(const Point2f &point, const BoardGeometry &board);

    PolarPoint toPolar(const Point2f &normalized);

    Ring getRing(double distance);

    int getMultiplier(Ring ring);

    int getSegmentFromAngle(double angle);

    ScoreResult mapToSegment(const Point2f &normalized, const Point2f &dart_position, double confidence);

    // S20, D16, T20, OUTER, BULL, MISS
    string formatScore(const ScoreResult &score);

    // Self-consistency of segment, multiplier and points
    bool validateScore(const ScoreResult &score);

    string getRingName(Ring ring);

} // namespace score_processing
