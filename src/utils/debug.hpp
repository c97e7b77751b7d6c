#pragma once
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include "logging.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(int width, int height, int fps,
                            const std::string &cam,
                            const std::string &board,
                            const std::string &validator,
                            const std::string &calibration,
                            int port)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Resolution: " << width << "x" << height << "\n";
        std::cout << "  - FPS: " << fps << "\n";
        std::cout << "  - Camera: " << cam << "\n";
        std::cout << "  - Board detector: " << board << "\n";
        std::cout << "  - Dart validator: " << validator << "\n";
        std::cout << "  - Calibration: " << calibration << "\n";
        if (port > 0)
            std::cout << "  - Event service: http://0.0.0.0:" << port << "\n";
        else
            std::cout << "  - Event service: disabled\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "DartSight runtime version: " << version << std::endl;
        exit(0);
    }

    inline void printHelpAndExit()
    {
        std::cout << "Usage: dartsight [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --cam <device|file>      Camera device or video file (default: /dev/video0)\n";
        std::cout << "  --width <width>          Frame width (default: 640)\n";
        std::cout << "  --height <height>        Frame height (default: 480)\n";
        std::cout << "  --fps <fps>              Frames per second (default: 30)\n";
        std::cout << "  --board <type>           Board detector: enhanced, basic (default: enhanced)\n";
        std::cout << "  --validator <type>       Dart validator: motion, smart (default: motion)\n";
        std::cout << "  --calibration <path>     Calibration file (default: cache/calibration.json)\n";
        std::cout << "  --port <port>            Event service port (default: 13520)\n";
        std::cout << "  --no-server              Do not start the event service\n";
        std::cout << "  --debounce <ms>          Minimum time between two darts (default: 1000)\n";
        std::cout << "  --debug, -d              Enable debug mode (saves frames to debug_frames/ directory)\n";
        std::cout << "  --quiet, -q              Quiet mode (only show errors)\n";
        std::cout << "  --version                Show version information\n";
        std::cout << "  --help                   Show this help message\n";
        exit(0);
    }

    // Create a debug output directory, false if it cannot be created
    inline bool ensureDirectory(const std::string &path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            log_warning("Cannot create debug directory " + path + ": " + ec.message());
            return false;
        }
        return true;
    }

    // Write an RGBA, BGR or single channel image as JPEG
    inline void saveImage(const std::string &path, const cv::Mat &image)
    {
        if (image.empty())
            return;

        cv::Mat output = image;
        if (image.type() == CV_8UC4)
            cv::cvtColor(image, output, cv::COLOR_RGBA2BGR);

        if (!cv::imwrite(path, output))
            log_warning("Failed to write debug image " + path);
    }

} // namespace debug
