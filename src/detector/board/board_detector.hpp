#pragma once
#include <string>
#include "detector/detector_interface.hpp"
#include "board_processing.hpp"

// Board detector built on colour segmentation and a circle fit
class BoardDetector : public BoardDetectorInterface
{
public:
    BoardDetector(const std::string &name, const board_processing::BoardParams &params, bool debug_mode = false);

    BoardDetection detect(const Mat &frame) override;

    std::string name() const override { return name_; }
    const board_processing::BoardParams &params() const { return params_; }

private:
    void saveDebugImage(const Mat &frame, const BoardDetection &detection);

    std::string name_;
    board_processing::BoardParams params_;
    bool debug_mode_;
    int frame_count_ = 0;
};
