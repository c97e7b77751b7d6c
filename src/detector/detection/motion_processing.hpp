#pragma once

#include <opencv2/core.hpp>
#include <string>
#include "diff_processing.hpp"

using namespace cv;
using namespace std;

namespace motion_processing
{
    struct MotionParams
    {
        int motion_threshold = 500;          // Changed pixels between consecutive frames that count as motion
        int stability_frames_required = 15;  // About half a second at 30 fps
        diff_processing::DiffParams diff;    // Frame-to-frame differencing
    };

    struct MotionState
    {
        bool is_stable = false;
        int stability_frames = 0;  // Consecutive frames without motion
        int last_motion_area = 0;  // Changed pixels of the latest comparison
        bool has_motion = false;
    };

    // Status labels for callers that report motion
    const string STATUS_MOTION = "Motion detected...";
    const string STATUS_LANDED = "Dart landed!";
    const string STATUS_WAITING = "Waiting for dart...";

    // Next state after one comparison that changed motion_area pixels
    MotionState updateMotionState(const MotionState &state, int motion_area, const MotionParams &params = MotionParams());

    string getMotionStatus(const MotionState &state);

    // Decides when things stopped moving by comparing each frame with the previous one
    class MotionStabilizer
    {
    public:
        explicit MotionStabilizer(const MotionParams &params = MotionParams());

        // Compare with the previous frame and advance the stability counter
        const MotionState &update(const Mat &frame);

        const MotionState &state() const { return state_; }

        // Restart the stability count, keep the previous frame
        void reset();

        // Forget everything including the previous frame
        void clear();

    private:
        MotionParams params_;
        MotionState state_;
        Mat previous_frame_;
    };

} // namespace motion_processing
