/**
 * test_diff.cpp - Frame differencing
 */
#include "detector/detection/diff_processing.hpp"
#include "synthetic_board.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace diff_processing;

int main()
{
    std::cout << "Frame differencing tests" << std::endl;
    cv::Mat board = synthetic::boardFrame();

    // Identical frames
    DiffResult same = detectFrameDifference(board, board.clone());
    assert(same.input_valid);
    assert(!same.found);
    assert(same.change_area == 0);
    std::cout << "[PASS] Identical frames have no difference" << std::endl;

    // One dart: 5x41 shaft dilated by one pixel on every side
    cv::Mat dart = synthetic::withDart(board, synthetic::Direction::UP);
    DiffResult one = detectFrameDifference(dart, board);
    assert(one.found);
    assert(one.change_area == 7 * 43);
    assert(static_cast<int>(one.largest_contour.size()) == one.change_area);
    assert(std::abs(one.centroid.x - 240.0f) < 0.5f && std::abs(one.centroid.y - 175.0f) < 0.5f);
    // Farthest point from the centroid sits at one end of the shaft
    assert(std::abs(one.tip.y - 175.0f) >= 20.0f);
    assert(one.mask.type() == CV_8UC1 && one.mask.size() == board.size());
    std::cout << "[PASS] Dart region, centroid and tip" << std::endl;

    // Difference is symmetric in its inputs
    DiffResult reversed = detectFrameDifference(board, dart);
    assert(reversed.change_area == one.change_area);
    std::cout << "[PASS] Swapping the frames gives the same area" << std::endl;

    // Small change: counted, but no region qualifies
    cv::Mat speck = synthetic::withBlob(board, cv::Point(100, 100), 1);
    DiffResult small = detectFrameDifference(speck, board);
    assert(!small.found);
    assert(small.change_area > 0 && small.change_area < 50);
    std::cout << "[PASS] Sub-50 px change is reported but not found" << std::endl;

    // Below the grey threshold
    cv::Mat dim = board.clone();
    cv::rectangle(dim, cv::Rect(10, 10, 30, 30), cv::Scalar(60, 60, 60, 255), cv::FILLED); // grey 40 -> 60
    assert(detectFrameDifference(dim, board).change_area == 0);
    std::cout << "[PASS] Changes of 30 grey levels or less are ignored" << std::endl;

    // Whole-frame lighting change exceeds the region maximum
    cv::Mat bright = synthetic::blankFrame(cv::Vec4b(200, 200, 200, 255));
    DiffResult lighting = detectFrameDifference(bright, synthetic::blankFrame());
    assert(!lighting.found);
    assert(lighting.change_area == bright.rows * bright.cols);
    std::cout << "[PASS] Regions over 10000 px are lighting, not darts" << std::endl;

    // Largest of several
    cv::Mat two = synthetic::withDarts(board, {synthetic::Direction::UP, synthetic::Direction::RIGHT});
    cv::rectangle(two, cv::Rect(400, 400, 20, 20), cv::Scalar(255, 255, 255, 255), cv::FILLED); // Off the board, on background
    DiffResult largest = detectFrameDifference(two, board);
    assert(largest.found);
    assert(largest.largest_contour.size() == 22 * 22);
    std::cout << "[PASS] Largest region wins" << std::endl;

    // Invalid inputs
    cv::Mat bgr(board.size(), CV_8UC3, cv::Scalar(0, 0, 0));
    assert(!detectFrameDifference(bgr, board).input_valid);
    assert(!detectFrameDifference(cv::Mat(), board).input_valid);
    cv::Mat smaller = synthetic::blankFrame()(cv::Rect(0, 0, 100, 100)).clone();
    assert(!detectFrameDifference(smaller, board).input_valid);
    assert(isValidFrame(board) && !isValidFrame(bgr));
    assert(!haveSameDimensions(smaller, board));
    std::cout << "[PASS] Invalid frames are refused" << std::endl;

    // Grey weights
    cv::Mat pixel(1, 1, CV_8UC4, cv::Scalar(0, 80, 255, 255));
    int grey = toGrayscale(pixel).at<uchar>(0, 0);
    assert(grey >= 75 && grey <= 77);
    std::cout << "[PASS] Luminance conversion" << std::endl;

    std::cout << std::endl
              << "All tests passed!" << std::endl;
    return 0;
}
