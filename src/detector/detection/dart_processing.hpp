#pragma once

#include <opencv2/core.hpp>
#include <string>
#include "detector/detector_interface.hpp"
#include "detector/board/color_processing.hpp"
#include "diff_processing.hpp"

using namespace cv;
using namespace std;

namespace dart_processing
{
    // Parameters for dart candidate validation
    struct DartParams
    {
        // Hard gates
        int min_dart_area = 100;                // Pixels
        int max_dart_area = 5000;               // Pixels
        double max_center_distance_ratio = 1.2; // Centroid distance from board centre, in radii
        double min_aspect_ratio = 2.0;          // Longest / shortest bounding box side
        double max_aspect_ratio = 15.0;

        // Confidence accrual
        double base_confidence = 0.3;
        double ideal_aspect_min = 3.0;
        double ideal_aspect_max = 10.0;
        double ideal_aspect_bonus = 0.2;

        bool position_from_tip = false;  // Position bonus measured at the tip instead of the centroid
        double position_bonus_ratio = 0.8; // Strictly inside this many radii (inclusive when measured at the tip)
        double position_bonus = 0.15;

        bool use_contrast = true;
        double min_contrast = 30.0;     // Mean grey difference along the candidate
        double max_contrast_bonus = 0.2;
        double contrast_scale = 100.0;  // bonus = contrast / scale, capped

        bool use_linear_edge = true;
        int edge_run = 30;               // Boundary steps spanned by one chord
        double min_edge_length = 25.0;   // Chord length, pixels
        double min_edge_straightness = 0.9; // Chord over walked boundary length
        double edge_bonus = 0.15;

        double min_confidence = 0.5;

        // Tip search restricted to dart-coloured pixels when enough exist
        bool refine_tip_with_dark_pixels = false;
        int min_dark_pixels = 5;
        color_processing::ColorParams colors;

        diff_processing::DiffParams diff; // Candidate against the long-lived reference
    };

    // Shape, position, contrast and edge scoring (default)
    DartParams motionValidatorParams();

    // Feature-sum scoring with a lower acceptance threshold
    DartParams smartValidatorParams();

    // "motion" or "smart", anything else falls back to motion
    DartParams validatorParamsByName(const string &name);

    struct LinearEdge
    {
        bool found = false;
        double length = 0.0; // Longest straight chord, pixels
        double angle = 0.0;  // Degrees, image coordinates
    };

    struct DartCandidate
    {
        bool found = false;
        Point2f tip{-1, -1};
        Point2f centroid{-1, -1};
        Contour contour;
        int area = 0;
        double aspect_ratio = 0.0;
        double contrast = 0.0;
        LinearEdge edge;
        double confidence = 0.0;
        string rejection = ""; // Why the candidate was refused

        // Easy boolean check
        operator bool() const { return found; }
    };

    // Bounding box longest over shortest side, 0 for degenerate shapes
    double calculateAspectRatio(const Contour &contour);

    // Mean absolute grey difference over the contour pixels
    double calculateContrast(const Contour &contour, const Mat &current_gray, const Mat &reference_gray);

    // Straight run along the ordered outer boundary of the pixel set
    LinearEdge findLinearEdge(const Contour &contour, const DartParams &params = DartParams());

    Point2f findTipClosestToCenter(const Contour &contour, const Point2f &center);

    // Contour pixels whose colour in frame is dart-black
    Contour findDarkPixels(const Contour &contour, const Mat &frame, const color_processing::ColorParams &colors);

    DartCandidate validateDartCandidate(const Contour &contour, const BoardGeometry &board, const Mat &current, const Mat &reference, const DartParams &params = DartParams());

    // Difference current against reference and validate the largest region
    DartCandidate detectNewDart(const Mat &current, const Mat &reference, const BoardGeometry &board, const DartParams &params = DartParams(), diff_processing::DiffResult *diff_out = nullptr);

} // namespace dart_processing
