#include "motion_processing.hpp"
#include "utils/logging.hpp"

using namespace cv;
using namespace std;

namespace motion_processing
{
    MotionState updateMotionState(const MotionState &state, int motion_area, const MotionParams &params)
    {
        MotionState next = state;
        next.last_motion_area = motion_area;
        next.has_motion = motion_area > params.motion_threshold;

        if (next.has_motion)
        {
            next.stability_frames = 0;
        }
        else
        {
            next.stability_frames = state.stability_frames + 1;
        }

        next.is_stable = next.stability_frames >= params.stability_frames_required;
        return next;
    }

    string getMotionStatus(const MotionState &state)
    {
        if (state.has_motion)
            return STATUS_MOTION;
        if (state.is_stable)
            return STATUS_LANDED;
        return STATUS_WAITING;
    }

    MotionStabilizer::MotionStabilizer(const MotionParams &params) : params_(params) {}

    const MotionState &MotionStabilizer::update(const Mat &frame)
    {
        if (!diff_processing::isValidFrame(frame))
        {
            log_debug("Ignoring invalid frame");
            return state_;
        }

        int motion_area = 0;
        if (!previous_frame_.empty())
        {
            if (diff_processing::haveSameDimensions(frame, previous_frame_))
            {
                motion_area = diff_processing::detectFrameDifference(frame, previous_frame_, params_.diff).change_area;
            }
            else
            {
                // A resized feed is a different scene
                log_debug("Frame size changed, treating as motion");
                motion_area = params_.motion_threshold + 1;
            }
        }

        bool was_stable = state_.is_stable;
        state_ = updateMotionState(state_, motion_area, params_);
        previous_frame_ = frame.clone();

        if (state_.is_stable && !was_stable)
        {
            log_debug("Motion settled after " + log_string(state_.stability_frames) + " quiet frames");
        }

        return state_;
    }

    void MotionStabilizer::reset()
    {
        state_ = MotionState();
    }

    void MotionStabilizer::clear()
    {
        state_ = MotionState();
        previous_frame_.release();
    }

} // namespace motion_processing
