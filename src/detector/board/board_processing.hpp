#pragma once

#include <opencv2/core.hpp>
#include <deque>
#include <vector>
#include "detector/detector_interface.hpp"
#include "color_processing.hpp"

using namespace cv;
using namespace std;

namespace board_processing
{
    // Normalized ring bands used as radius anchors
    const double TRIPLE_RING_INNER = 0.582;
    const double TRIPLE_RING_OUTER = 0.629;
    const double TRIPLE_RING_MID = 0.605;
    const double DOUBLE_RING_INNER = 0.953;
    const double DOUBLE_RING_OUTER = 1.0;
    const double DOUBLE_RING_MID = 0.9765;

    struct BoardParams
    {
        color_processing::ColorParams colors;

        // Segmentation
        bool use_white_segments = true; // Blue-only when false
        bool use_red_rings = true;      // Red ring refinement and bonus
        int min_segment_size = 30;      // Blue/white contour minimum, pixels
        int min_red_size = 20;          // Red contour minimum, pixels
        int min_segments = 5;           // Visible segments needed to trust a fit

        // Circle fit
        int min_fit_points = 10;
        int min_red_points = 20; // Red refinement only above this many red pixels
        int refine_iterations = 5;
        double min_radius = MIN_BOARD_RADIUS;
        double max_radius = MAX_BOARD_RADIUS;

        // Confidence
        double expected_segments = 20.0;
        double segment_weight = 0.3;
        double fit_weight = 0.3;
        double size_weight = 0.1;
        double red_bonus_max = 0.3;
        double red_bonus_per_contour = 0.1;
        double min_confidence = 0.5;
    };

    // Blue, white and red segmentation with red ring refinement
    BoardParams enhancedBoardParams();

    // Blue segments only, no red anchors
    BoardParams basicBoardParams();

    struct CircleFit
    {
        Point2f center{0, 0};
        double radius = 0.0;
        bool valid = false;
    };

    // Centroid and mean distance
    CircleFit initialCircle(const vector<Point> &points);

    // Radius re-estimated from red pixels inside the triple or double band
    double refineRadiusWithRedRings(const vector<Point> &red_points, const Point2f &center, double radius, const BoardParams &params);

    // Iterative centre correction at fixed radius
    Point2f refineCenter(const vector<Point> &points, const Point2f &center, double radius, int iterations);

    // 1 for a perfect fit, 0 once the mean residual reaches half the radius
    double fitScore(const vector<Point> &points, const Point2f &center, double radius);

    double calculateConfidence(size_t segment_count, size_t red_count, double fit_score, double radius, const BoardParams &params);

    BoardDetection detectBoard(const Mat &frame, const BoardParams &params = enhancedBoardParams());

    // Running average over the last few accepted detections
    class BoardSmoother
    {
    public:
        explicit BoardSmoother(size_t max_history = 5);

        // Ignores detections that were not found
        void addDetection(const BoardDetection &detection);

        // Averaged geometry plus the newest contour sets, found=false when empty
        BoardDetection getSmoothed() const;

        void reset();
        size_t size() const { return history_.size(); }

    private:
        size_t max_history_;
        deque<BoardDetection> history_;
    };

} // namespace board_processing
