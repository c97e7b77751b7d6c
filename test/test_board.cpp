/**
 * test_board.cpp - Board geometry estimation on rendered boards
 */
#include "detector/board/board_processing.hpp"
#include "detector/detector_factory.hpp"
#include "synthetic_board.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace board_processing;

int main()
{
    std::cout << "Board geometry tests" << std::endl;
    cv::Mat board = synthetic::boardFrame();

    // Enhanced: blue, white and red
    BoardDetection enhanced = detectBoard(board, enhancedBoardParams());
    assert(enhanced.found);
    assert(synthetic::distance(enhanced.geometry.center, synthetic::BOARD_CENTER) < 2.0);
    assert(enhanced.geometry.radius >= synthetic::DETECTED_RADIUS_MIN && enhanced.geometry.radius <= synthetic::DETECTED_RADIUS_MAX);
    assert(enhanced.geometry.confidence >= 0.7 && enhanced.geometry.confidence <= 1.0);
    assert(enhanced.blue_contours.size() == 20);
    assert(enhanced.white_contours.size() == 20);
    assert(enhanced.red_contours.size() == 3);
    std::cout << "[PASS] Enhanced detector finds the board: r=" << enhanced.geometry.radius
              << " conf=" << enhanced.geometry.confidence << std::endl;

    // Basic: blue only
    BoardDetection basic = detectBoard(board, basicBoardParams());
    assert(basic.found);
    assert(synthetic::distance(basic.geometry.center, synthetic::BOARD_CENTER) < 2.0);
    assert(basic.geometry.radius >= synthetic::DETECTED_RADIUS_MIN && basic.geometry.radius <= synthetic::DETECTED_RADIUS_MAX);
    assert(basic.white_contours.empty() && basic.red_contours.empty());
    assert(basic.geometry.confidence >= 0.5);
    std::cout << "[PASS] Basic detector finds the board from blue segments" << std::endl;

    // Nothing to see
    assert(!detectBoard(synthetic::blankFrame()));
    assert(!detectBoard(cv::Mat()));
    cv::Mat bgr(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    assert(!detectBoard(bgr));
    std::cout << "[PASS] Blank, empty and non-RGBA frames report no board" << std::endl;

    // Four blue patches are below the five segment minimum
    cv::Mat few = synthetic::blankFrame();
    cv::Scalar blue(synthetic::BLUE[0], synthetic::BLUE[1], synthetic::BLUE[2], 255);
    cv::rectangle(few, cv::Rect(50, 50, 40, 40), blue, cv::FILLED);
    cv::rectangle(few, cv::Rect(350, 50, 40, 40), blue, cv::FILLED);
    cv::rectangle(few, cv::Rect(50, 350, 40, 40), blue, cv::FILLED);
    cv::rectangle(few, cv::Rect(350, 350, 40, 40), blue, cv::FILLED);
    BoardDetection too_few = detectBoard(few);
    assert(!too_few.found);
    assert(too_few.blue_contours.size() == 4);
    std::cout << "[PASS] Fewer than 5 segments is not a board" << std::endl;

    // A board drawn too small fails the radius bounds
    assert(!detectBoard(synthetic::boardFrame(80.0)));
    std::cout << "[PASS] Radius below the minimum is rejected" << std::endl;

    // Red anchors below the point threshold leave the radius alone
    BoardParams params = enhancedBoardParams();
    std::vector<cv::Point> ring;
    for (int i = 0; i < 20; i++)
    {
        double a = i * CV_PI / 10.0;
        ring.push_back(cv::Point(cvRound(1000 + 605 * std::cos(a)), cvRound(1000 + 605 * std::sin(a))));
    }
    assert(refineRadiusWithRedRings(ring, cv::Point2f(1000, 1000), 1000.0, params) == 1000.0);
    ring.push_back(cv::Point(1605, 1000));
    double refined = refineRadiusWithRedRings(ring, cv::Point2f(1000, 1000), 980.0, params);
    assert(std::abs(refined - 1000.0) < 2.0);
    std::cout << "[PASS] Red ring refinement needs more than 20 points" << std::endl;

    // Perfect circle fits perfectly, offset centre converges back
    std::vector<cv::Point> circle;
    for (int i = 0; i < 360; i++)
    {
        double a = i * CV_PI / 180.0;
        circle.push_back(cv::Point(cvRound(500 + 300 * std::cos(a)), cvRound(500 + 300 * std::sin(a))));
    }
    assert(fitScore(circle, cv::Point2f(500, 500), 300.0) > 0.99);
    assert(fitScore(circle, cv::Point2f(500, 500), 0.0) == 0.0);
    cv::Point2f recovered = refineCenter(circle, cv::Point2f(510, 495), 300.0, 5);
    assert(synthetic::distance(recovered, cv::Point2f(500, 500)) < 1.0);
    CircleFit initial = initialCircle(circle);
    assert(initial.valid && std::abs(initial.radius - 300.0) < 1.0);
    assert(!initialCircle({}).valid);
    std::cout << "[PASS] Circle fit helpers" << std::endl;

    // Confidence weights
    assert(std::abs(calculateConfidence(20, 3, 1.0, 150.0, params) - 1.0) < 1e-9);
    assert(std::abs(calculateConfidence(10, 0, 0.5, 150.0, params) - 0.4) < 1e-9);
    assert(std::abs(calculateConfidence(10, 0, 0.5, 50.0, params) - 0.35) < 1e-9);
    assert(std::abs(calculateConfidence(15, 0, 1.0, 150.0, basicBoardParams()) - 1.0) < 1e-9);
    std::cout << "[PASS] Confidence formula" << std::endl;

    // Smoother averages the last detections
    BoardSmoother smoother(5);
    assert(!smoother.getSmoothed().found);
    for (int i = 0; i < 7; i++)
    {
        BoardDetection d;
        d.found = true;
        d.geometry.center = cv::Point2f(100.0f + i, 200.0f);
        d.geometry.radius = 150.0 + i;
        d.geometry.confidence = 0.8;
        smoother.addDetection(d);
    }
    smoother.addDetection(BoardDetection());
    assert(smoother.size() == 5);
    BoardDetection smoothed = smoother.getSmoothed();
    assert(smoothed.found);
    assert(std::abs(smoothed.geometry.center.x - 104.0f) < 1e-4);
    assert(std::abs(smoothed.geometry.radius - 154.0) < 1e-9);
    smoother.reset();
    assert(smoother.size() == 0);
    std::cout << "[PASS] BoardSmoother keeps the last 5" << std::endl;

    // Factory
    auto enhanced_detector = DetectorFactory::createBoardDetector("enhanced");
    auto basic_detector = DetectorFactory::createBoardDetector("basic");
    auto fallback = DetectorFactory::createBoardDetector("nonsense");
    assert(enhanced_detector->name() == "enhanced");
    assert(basic_detector->name() == "basic");
    assert(fallback->name() == "enhanced");
    assert(enhanced_detector->detect(board).found);
    std::cout << "[PASS] DetectorFactory" << std::endl;

    std::cout << std::endl
              << "All tests passed!" << std::endl;
    return 0;
}
