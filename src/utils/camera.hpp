#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "logging.hpp"
#include "tracker/tracker_interface.hpp"

using namespace cv;
using namespace std;

namespace camera
{
    // Determine if a given path is a video file based on its extension
    inline bool isVideoFile(const string &path)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), ::tolower);

        const vector<string> video_extensions = {".mp4", ".avi", ".mkv", ".mov", ".wmv"};
        for (const auto &ext : video_extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    inline string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = (fourcc & 0xFF);
        code[1] = (fourcc >> 8) & 0xFF;
        code[2] = (fourcc >> 16) & 0xFF;
        code[3] = (fourcc >> 24) & 0xFF;
        code[4] = '\0';
        return string(code);
    }

    // Opens a V4L2 device (MJPEG) or a video file
    inline bool openCapture(VideoCapture &cap, const string &source, int width, int height, int fps)
    {
        log_debug("Opening camera: " + source);

        if (isVideoFile(source))
        {
            log_debug("Detected video file: " + source);
            cap.open(source);
        }
        else
        {
            cap.open(source, CAP_V4L2);
            cap.set(CAP_PROP_FRAME_WIDTH, width);
            cap.set(CAP_PROP_FRAME_HEIGHT, height);
            cap.set(CAP_PROP_FPS, fps);
            int fourcc = VideoWriter::fourcc('M', 'J', 'P', 'G');
            cap.set(CAP_PROP_FOURCC, fourcc);
        }

        if (!cap.isOpened())
        {
            log_error("Failed to open camera/video " + source);
            return false;
        }

        if (!isVideoFile(source))
        {
            double actual_width = cap.get(CAP_PROP_FRAME_WIDTH);
            double actual_height = cap.get(CAP_PROP_FRAME_HEIGHT);
            double actual_fps = cap.get(CAP_PROP_FPS);
            int fourcc = static_cast<int>(cap.get(CAP_PROP_FOURCC));

            log_debug("Camera verification:");
            log_debug("  Resolution: " + log_string((int)actual_width) + "x" + log_string((int)actual_height) + " (expected: " + log_string(width) + "x" + log_string(height) + ")");
            log_debug("  FPS: " + log_string((int)actual_fps) + " (expected: " + log_string(fps) + ")");
            log_debug("  FOURCC: " + decodeFourCC(fourcc) + ", backend: " + cap.getBackendName());
        }

        log_info("Camera/video initialized: " + source);
        return true;
    }

} // namespace camera

// Single camera (or video file) delivering RGBA frames to the tracker
class CameraFrameSource : public FrameSource
{
public:
    CameraFrameSource(const string &source, int width, int height, int fps)
        : source_(source), fps_(fps), is_video_file_(camera::isVideoFile(source))
    {
        camera::openCapture(capture_, source_, width, height, fps_);
    }

    bool captureFrame(Mat &frame) override
    {
        if (!capture_.isOpened())
        {
            return false;
        }

        Mat bgr;
        if (!capture_.read(bgr) || bgr.empty())
        {
            log_debug("Failed to capture frame from " + source_);
            return false;
        }

        // Files decode faster than real time
        if (is_video_file_ && fps_ > 0)
        {
            this_thread::sleep_for(chrono::milliseconds(1000 / fps_));
        }

        cvtColor(bgr, frame, COLOR_BGR2RGBA);
        return true;
    }

    bool isOpened() const override { return capture_.isOpened(); }

private:
    string source_;
    int fps_;
    bool is_video_file_;
    VideoCapture capture_;
};
