#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <string>
#include <vector>

// Rendered dartboards and darts for the tests, all RGBA
namespace synthetic
{
    const int FRAME_SIZE = 480;
    const cv::Point2f BOARD_CENTER(240, 240);
    const double BOARD_RADIUS = 200.0; // Outer edge of the double ring as drawn

    // Pixel-space radius the detector reports for this drawing (mean distance, red refined)
    const double DETECTED_RADIUS_MIN = 110.0;
    const double DETECTED_RADIUS_MAX = 145.0;

    const cv::Vec4b BACKGROUND(40, 40, 40, 255);
    const cv::Vec4b BLUE(0, 80, 255, 255);
    const cv::Vec4b WHITE(255, 255, 255, 255);
    const cv::Vec4b RED(255, 0, 0, 255);
    const cv::Scalar DART(20, 20, 20, 255);

    inline cv::Mat blankFrame(const cv::Vec4b &color = BACKGROUND)
    {
        return cv::Mat(FRAME_SIZE, FRAME_SIZE, CV_8UC4, cv::Scalar(color[0], color[1], color[2], color[3]));
    }

    // 20 alternating blue/white wedges, red bull, triple and double rings
    inline cv::Mat boardFrame(double radius = BOARD_RADIUS)
    {
        cv::Mat frame = blankFrame();
        for (int y = 0; y < frame.rows; y++)
        {
            for (int x = 0; x < frame.cols; x++)
            {
                double dx = x - BOARD_CENTER.x;
                double dy = y - BOARD_CENTER.y;
                double n = std::sqrt(dx * dx + dy * dy) / radius;
                if (n > 1.0)
                    continue;

                cv::Vec4b &px = frame.at<cv::Vec4b>(y, x);
                if (n <= 0.093 || (n > 0.582 && n <= 0.629) || n > 0.953)
                {
                    px = RED;
                    continue;
                }

                double angle = std::fmod(std::atan2(dx, -dy) * 180.0 / CV_PI + 360.0, 360.0);
                int wedge = static_cast<int>(std::fmod(angle + 9.0, 360.0) / 18.0);
                px = wedge % 2 == 0 ? BLUE : WHITE;
            }
        }
        return frame;
    }

    // Axis-aligned dart shaft, 5 px wide and 41 px long
    enum class Direction
    {
        UP,    // segment 20
        RIGHT, // segment 6
        DOWN,  // segment 3
        LEFT   // segment 11
    };

    // Shaft from 45 to 85 px out of the centre
    inline cv::Rect dartRect(Direction direction)
    {
        const int cx = static_cast<int>(BOARD_CENTER.x);
        const int cy = static_cast<int>(BOARD_CENTER.y);
        switch (direction)
        {
        case Direction::UP:
            return cv::Rect(cx - 2, cy - 85, 5, 41);
        case Direction::RIGHT:
            return cv::Rect(cx + 45, cy - 2, 41, 5);
        case Direction::DOWN:
            return cv::Rect(cx - 2, cy + 45, 5, 41);
        case Direction::LEFT:
        default:
            return cv::Rect(cx - 85, cy - 2, 41, 5);
        }
    }

    inline cv::Mat withDart(const cv::Mat &frame, Direction direction)
    {
        cv::Mat out = frame.clone();
        cv::rectangle(out, dartRect(direction), DART, cv::FILLED);
        return out;
    }

    inline cv::Mat withDarts(const cv::Mat &frame, const std::vector<Direction> &directions)
    {
        cv::Mat out = frame.clone();
        for (Direction direction : directions)
        {
            cv::rectangle(out, dartRect(direction), DART, cv::FILLED);
        }
        return out;
    }

    inline cv::Mat withBlob(const cv::Mat &frame, const cv::Point &center, int radius, const cv::Scalar &color = DART)
    {
        cv::Mat out = frame.clone();
        cv::circle(out, center, radius, color, cv::FILLED, cv::LINE_8);
        return out;
    }

    inline double distance(const cv::Point2f &a, const cv::Point2f &b)
    {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

} // namespace synthetic
