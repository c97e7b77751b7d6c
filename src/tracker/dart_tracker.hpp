#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "tracker_interface.hpp"
#include "detector/detector_interface.hpp"
#include "detector/board/board_processing.hpp"
#include "detector/detection/motion_processing.hpp"
#include "detector/detection/dart_processing.hpp"
#include "detector/detection/score_processing.hpp"

using namespace std;

enum class TrackerState
{
    IDLE,            // Between turns
    NO_BOARD,        // Turn running, board geometry missing
    WAITING_DART_1,
    WAITING_DART_2,
    WAITING_DART_3,
    TURN_COMPLETE,   // Third dart scored, holding before removal check
    WAITING_REMOVAL  // Comparing against the empty board
};

enum class TrackerError
{
    NONE,
    NO_FRAME,                 // Capture failed, retried next tick
    NO_REFERENCE_FRAME,       // Nothing to compare against yet
    NO_BOARD_GEOMETRY,        // Board not visible
    LOW_CONFIDENCE_DETECTION, // A change was seen but did not look like a dart
    INVALID_FRAME_DIMENSIONS  // Frame empty, not RGBA, or a different size than the reference
};

string getTrackerStateName(TrackerState state);
string getTrackerErrorName(TrackerError error);

bool isWaitingForDart(TrackerState state);

// WAITING_DART_n for n in 1..3
TrackerState waitingStateFor(int dart_number);

// One scored dart
struct DartDetection
{
    int segment = 0;
    int multiplier = 1;
    int points = 0;
    double confidence = 0.0;
    Point2f dart_position{-1, -1}; // Tip in pixels
};

struct TrackerCallbacks
{
    function<void(const DartDetection &, int)> onDartDetected; // dart number 1..3
    function<void(const vector<DartDetection> &)> onTurnComplete;
    function<void(TrackerState)> onStateChange;
    function<void(bool)> onBoardDetected;
    function<void(const string &)> onMotionStatus;
};

struct TrackerParams
{
    int settle_delay_ms = 500;         // Before capturing the turn reference
    int turn_complete_delay_ms = 1000; // Hold on TURN_COMPLETE before watching for removal
    int rearm_delay_ms = 1000;         // IDLE -> next turn after removal
    int detection_debounce_ms = 1000;  // Minimum time between two accepted darts
    int removal_threshold = 100;       // Changed pixels against the empty board that still count as empty
    int board_lost_frames = 3;         // Consecutive misses before the board counts as lost
    double snapshot_quality = 0.9;     // JPEG quality of the persisted reference
    bool auto_rearm = true;            // Start the next turn by itself after removal
    bool debug_mode = false;           // Write detection images to debug_frames/tracker

    motion_processing::MotionParams motion;
    dart_processing::DartParams dart;
    diff_processing::DiffParams removal_diff;
};

struct TickResult
{
    TrackerState state = TrackerState::IDLE; // After the tick
    TrackerError error = TrackerError::NONE;
    bool board_visible = false;
    bool dart_detected = false;
    int dart_number = 0;
    DartDetection dart;
};

// Turn lifecycle: reference capture, dart detection, scoring and removal
class DartTracker
{
public:
    using Clock = function<chrono::steady_clock::time_point()>;

    DartTracker(FrameSource &source,
                unique_ptr<BoardDetectorInterface> board_detector,
                TrackerCallbacks callbacks,
                const TrackerParams &params = TrackerParams(),
                CalibrationStore *store = nullptr,
                Clock clock = chrono::steady_clock::now);

    // Adopt a calibration and rehydrate its snapshot as fallback reference
    void initialize(const CalibrationData &calibration);

    // Load from the store, false when nothing usable is stored
    bool loadCalibration();

    // Request a new turn, safe to call from any thread
    void startTurn();

    // One loop iteration, never throws for recoverable conditions
    TickResult tick();

    // Back to IDLE with every per-turn buffer cleared, persisted calibration untouched
    void reset();

    TrackerState getState() const;
    vector<DartDetection> getDetectedDarts() const;
    bool hasBoard() const;
    BoardGeometry getBoardGeometry() const;
    motion_processing::MotionState getMotionState() const;
    CalibrationData getCalibration() const;
    bool hasReferenceFrame() const;

private:
    using TimePoint = chrono::steady_clock::time_point;

    // Callbacks are queued under the lock and run after it is released
    using Notification = function<void()>;

    void updateBoard(const Mat &frame, vector<Notification> &notifications);
    void beginTurn(const Mat &reference, bool persist, vector<Notification> &notifications);
    void processDart(const Mat &frame, TimePoint now, TickResult &result, vector<Notification> &notifications);
    void checkRemoval(const Mat &frame, TimePoint now, TickResult &result, vector<Notification> &notifications);
    void persistSnapshot(const Mat &reference);
    void setState(TrackerState state, vector<Notification> &notifications);
    void setMotionStatus(const string &status, vector<Notification> &notifications);
    void saveDebugImages(const Mat &frame, const diff_processing::DiffResult &diff, const dart_processing::DartCandidate &candidate, const score_processing::ScoreResult &score, int dart_number);
    bool deadlinePassed(TimePoint deadline, TimePoint now) const { return now >= deadline; }

    // Collaborators
    FrameSource &source_;
    unique_ptr<BoardDetectorInterface> board_detector_;
    TrackerCallbacks callbacks_;
    TrackerParams params_;
    CalibrationStore *store_;
    Clock clock_;

    mutable mutex mutex_;
    atomic<bool> turn_requested_{false};

    // Lifecycle
    TrackerState state_ = TrackerState::IDLE;
    vector<DartDetection> darts_;

    // Board
    board_processing::BoardSmoother smoother_;
    BoardDetection board_;
    bool board_visible_ = false;
    int board_misses_ = 0;

    // References, replaced whole, never written in place
    Mat reference_frame_;          // Board plus darts landed so far
    Mat original_reference_;       // Empty board of this turn
    Mat persisted_reference_;      // Decoded snapshot from the calibration
    CalibrationData calibration_;

    motion_processing::MotionStabilizer motion_;
    string motion_status_;

    // Timers
    bool turn_start_pending_ = false;
    TimePoint turn_start_deadline_;
    TimePoint turn_complete_deadline_;
    bool rearm_pending_ = false;
    TimePoint rearm_deadline_;
    bool has_last_detection_ = false;
    TimePoint last_detection_time_;
};
