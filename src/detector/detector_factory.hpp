#pragma once
#include "detector_interface.hpp"
#include "board/board_detector.hpp"
#include "utils/logging.hpp"
#include <memory>
#include <string>

enum class BoardDetectorType
{
    ENHANCED,
    BASIC,
    UNKNOWN
};

class DetectorFactory
{
private:
    static BoardDetectorType stringToDetectorType(const std::string &detector_type)
    {
        if (detector_type == "enhanced")
            return BoardDetectorType::ENHANCED;
        if (detector_type == "basic")
            return BoardDetectorType::BASIC;
        return BoardDetectorType::UNKNOWN;
    }

public:
    static std::unique_ptr<BoardDetectorInterface> createBoardDetector(const std::string &detector_type, bool debug_mode = false)
    {
        log_debug("Creating board detector: " + detector_type);

        switch (stringToDetectorType(detector_type))
        {
        case BoardDetectorType::ENHANCED:
            log_info("Loading multi-colour board detector with red ring refinement");
            return std::make_unique<BoardDetector>("enhanced", board_processing::enhancedBoardParams(), debug_mode);

        case BoardDetectorType::BASIC:
            log_info("Loading blue-segment board detector");
            return std::make_unique<BoardDetector>("basic", board_processing::basicBoardParams(), debug_mode);

        case BoardDetectorType::UNKNOWN:
        default:
            log_warning("Unknown board detector type: " + detector_type + ", using enhanced");
            return std::make_unique<BoardDetector>("enhanced", board_processing::enhancedBoardParams(), debug_mode);
        }
    }
};
