#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>

using namespace cv;
using namespace std;

// Pixel set of one connected component, order carries no meaning
typedef vector<Point> Contour;

const double MIN_BOARD_RADIUS = 100.0;
const double MAX_BOARD_RADIUS = 2000.0;

// Board circle in pixels
struct BoardGeometry
{
    Point2f center{0, 0};
    double radius = 0.0;
    double confidence = 0.0; // [0,1]
};

// Result of one board detection pass
struct BoardDetection
{
    bool found = false;
    BoardGeometry geometry;

    // Segmented contours, kept for display and debug images
    vector<Contour> blue_contours;
    vector<Contour> white_contours;
    vector<Contour> red_contours;

    // Easy boolean check
    operator bool() const { return found; }
};

// Abstract interface for board geometry estimation
class BoardDetectorInterface
{
public:
    virtual ~BoardDetectorInterface() = default;

    // Estimate the board from a single RGBA frame
    virtual BoardDetection detect(const Mat &frame) = 0;

    virtual string name() const = 0;
};
