#include "dart_tracker.hpp"
#include "calibration.hpp"
#include "utils.hpp"
#include "utils/encoding.hpp"
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

string getTrackerStateName(TrackerState state)
{
    switch (state)
    {
    case TrackerState::IDLE:
        return "idle";
    case TrackerState::NO_BOARD:
        return "no-board";
    case TrackerState::WAITING_DART_1:
        return "waiting-dart-1";
    case TrackerState::WAITING_DART_2:
        return "waiting-dart-2";
    case TrackerState::WAITING_DART_3:
        return "waiting-dart-3";
    case TrackerState::TURN_COMPLETE:
        return "turn-complete";
    case TrackerState::WAITING_REMOVAL:
        return "waiting-removal";
    default:
        return "unknown";
    }
}

string getTrackerErrorName(TrackerError error)
{
    switch (error)
    {
    case TrackerError::NONE:
        return "none";
    case TrackerError::NO_FRAME:
        return "no-frame";
    case TrackerError::NO_REFERENCE_FRAME:
        return "no-reference-frame";
    case TrackerError::NO_BOARD_GEOMETRY:
        return "no-board-geometry";
    case TrackerError::LOW_CONFIDENCE_DETECTION:
        return "low-confidence-detection";
    case TrackerError::INVALID_FRAME_DIMENSIONS:
        return "invalid-frame-dimensions";
    default:
        return "unknown";
    }
}

bool isWaitingForDart(TrackerState state)
{
    return state == TrackerState::WAITING_DART_1 ||
           state == TrackerState::WAITING_DART_2 ||
           state == TrackerState::WAITING_DART_3;
}

TrackerState waitingStateFor(int dart_number)
{
    if (dart_number <= 1)
        return TrackerState::WAITING_DART_1;
    if (dart_number == 2)
        return TrackerState::WAITING_DART_2;
    return TrackerState::WAITING_DART_3;
}

DartTracker::DartTracker(FrameSource &source,
                         unique_ptr<BoardDetectorInterface> board_detector,
                         TrackerCallbacks callbacks,
                         const TrackerParams &params,
                         CalibrationStore *store,
                         Clock clock)
    : source_(source),
      board_detector_(std::move(board_detector)),
      callbacks_(std::move(callbacks)),
      params_(params),
      store_(store),
      clock_(std::move(clock)),
      motion_(params.motion)
{
    log_debug("Tracker created with board detector '" + board_detector_->name() + "'");
}

void DartTracker::initialize(const CalibrationData &calibration)
{
    lock_guard<mutex> lock(mutex_);
    calibration_ = calibration;
    persisted_reference_.release();

    if (!calibration.hasReferenceFrame())
    {
        log_debug("Calibration carries no reference snapshot");
        return;
    }

    Mat decoded;
    if (encoding::decodeDataURL(calibration.reference_frame, decoded))
    {
        persisted_reference_ = decoded;
        log_info("Stored reference snapshot loaded (" + log_string(decoded.cols) + "x" + log_string(decoded.rows) + ")");
    }
    else
    {
        log_warning("Stored reference snapshot is malformed, ignoring it");
    }
}

bool DartTracker::loadCalibration()
{
    if (!store_)
        return false;

    CalibrationData data;
    if (!store_->load(data))
        return false;

    initialize(data);
    return true;
}

void DartTracker::startTurn()
{
    turn_requested_ = true;
}

TickResult DartTracker::tick()
{
    vector<Notification> notifications;
    TickResult result;

    {
        lock_guard<mutex> lock(mutex_);
        TimePoint now = clock_();

        if (turn_requested_.exchange(false))
        {
            turn_start_pending_ = true;
            turn_start_deadline_ = now + chrono::milliseconds(params_.settle_delay_ms);
            log_info("Turn requested, capturing reference in " + log_string(params_.settle_delay_ms) + "ms");
        }

        if (rearm_pending_ && deadlinePassed(rearm_deadline_, now))
        {
            rearm_pending_ = false;
            turn_start_pending_ = true;
            turn_start_deadline_ = now + chrono::milliseconds(params_.settle_delay_ms);
            log_debug("Re-arming for the next turn");
        }

        Mat frame;
        bool captured = source_.captureFrame(frame) && !frame.empty();

        if (!captured)
        {
            result.error = TrackerError::NO_FRAME;
            log_debug("No frame available");

            if (turn_start_pending_ && deadlinePassed(turn_start_deadline_, now) && !persisted_reference_.empty())
            {
                log_warning("Capture failed at turn start, using the stored snapshot as reference");
                beginTurn(persisted_reference_, false, notifications);
            }
        }
        else if (!diff_processing::isValidFrame(frame))
        {
            result.error = TrackerError::INVALID_FRAME_DIMENSIONS;
            log_debug("Frame is not RGBA, skipping");
        }
        else
        {
            updateBoard(frame, notifications);

            if (turn_start_pending_ && deadlinePassed(turn_start_deadline_, now))
            {
                beginTurn(frame, true, notifications);
            }
            else
            {
                switch (state_)
                {
                case TrackerState::IDLE:
                    break;

                case TrackerState::NO_BOARD:
                    if (board_visible_)
                    {
                        setState(waitingStateFor(static_cast<int>(darts_.size()) + 1), notifications);
                    }
                    else
                    {
                        result.error = TrackerError::NO_BOARD_GEOMETRY;
                    }
                    break;

                case TrackerState::WAITING_DART_1:
                case TrackerState::WAITING_DART_2:
                case TrackerState::WAITING_DART_3:
                    if (!board_visible_)
                    {
                        // Geometry is required to score, resume once it returns
                        motion_.clear();
                        setState(TrackerState::NO_BOARD, notifications);
                        result.error = TrackerError::NO_BOARD_GEOMETRY;
                    }
                    else
                    {
                        processDart(frame, now, result, notifications);
                    }
                    break;

                case TrackerState::TURN_COMPLETE:
                    if (deadlinePassed(turn_complete_deadline_, now))
                    {
                        log_info("Waiting for darts to be removed...");
                        setState(TrackerState::WAITING_REMOVAL, notifications);
                    }
                    break;

                case TrackerState::WAITING_REMOVAL:
                    checkRemoval(frame, now, result, notifications);
                    break;
                }
            }
        }

        result.state = state_;
        result.board_visible = board_visible_;
    }

    for (const Notification &notify : notifications)
    {
        notify();
    }

    return result;
}

void DartTracker::updateBoard(const Mat &frame, vector<Notification> &notifications)
{
    BoardDetection detection = board_detector_->detect(frame);

    bool visible;
    if (detection.found)
    {
        smoother_.addDetection(detection);
        board_ = smoother_.getSmoothed();
        board_misses_ = 0;
        visible = true;
    }
    else
    {
        board_misses_++;
        visible = board_visible_ && board_misses_ < params_.board_lost_frames;
    }

    if (visible == board_visible_)
        return;

    board_visible_ = visible;
    if (visible)
    {
        log_info("Board detected at (" + log_string((int)board_.geometry.center.x) + "," + log_string((int)board_.geometry.center.y) + ") r=" + log_string((int)board_.geometry.radius));
    }
    else
    {
        log_info("Board lost");
    }

    function<void(bool)> callback = callbacks_.onBoardDetected;
    notifications.push_back([callback, visible]()
                            { if (callback) callback(visible); });
}

void DartTracker::beginTurn(const Mat &reference, bool persist, vector<Notification> &notifications)
{
    // Two independent buffers: one follows the darts, one stays empty
    reference_frame_ = reference.clone();
    original_reference_ = reference.clone();

    if (persist)
    {
        persistSnapshot(original_reference_);
    }

    darts_.clear();
    has_last_detection_ = false;
    motion_.clear();
    motion_status_.clear();
    turn_start_pending_ = false;
    rearm_pending_ = false;

    TrackerState next = board_visible_ ? TrackerState::WAITING_DART_1 : TrackerState::NO_BOARD;
    log_info("Turn started, " + string(board_visible_ ? "waiting for dart 1" : "waiting for the board"));
    setState(next, notifications);
}

void DartTracker::persistSnapshot(const Mat &reference)
{
    persisted_reference_ = reference;

    string data_url;
    if (!encoding::encodeDataURL(reference, params_.snapshot_quality, data_url))
    {
        return;
    }

    calibration_ = calibration::setReferenceFrame(calibration_, data_url, calibration::currentTimestampMs());
    if (board_visible_)
    {
        calibration_.center = board_.geometry.center;
        calibration_.radius = board_.geometry.radius;
    }

    if (store_ && !store_->save(calibration_))
    {
        log_warning("Failed to persist reference snapshot");
    }
}

void DartTracker::processDart(const Mat &frame, TimePoint now, TickResult &result, vector<Notification> &notifications)
{
    if (reference_frame_.empty())
    {
        result.error = TrackerError::NO_REFERENCE_FRAME;
        log_debug("No reference frame, skipping detection");
        return;
    }

    if (!diff_processing::haveSameDimensions(frame, reference_frame_))
    {
        result.error = TrackerError::INVALID_FRAME_DIMENSIONS;
        log_debug("Frame size differs from the reference, skipping detection");
        return;
    }

    const motion_processing::MotionState &motion = motion_.update(frame);
    setMotionStatus(motion_processing::getMotionStatus(motion), notifications);

    if (!motion.is_stable)
        return;

    if (has_last_detection_ && now - last_detection_time_ < chrono::milliseconds(params_.detection_debounce_ms))
        return;

    diff_processing::DiffResult diff;
    dart_processing::DartCandidate candidate = dart_processing::detectNewDart(frame, reference_frame_, board_.geometry, params_.dart, &diff);
    if (!candidate)
    {
        if (diff.found)
            result.error = TrackerError::LOW_CONFIDENCE_DETECTION;
        return;
    }

    Point2f normalized = score_processing::normalizePoint(candidate.tip, board_.geometry);
    score_processing::ScoreResult score = score_processing::mapToSegment(normalized, candidate.tip, candidate.confidence);
    if (!score_processing::validateScore(score))
    {
        log_warning("Inconsistent score " + score_processing::formatScore(score));
    }

    DartDetection dart;
    dart.segment = score.segment;
    dart.multiplier = score.multiplier;
    dart.points = score.points;
    dart.confidence = score.confidence;
    dart.dart_position = candidate.tip;

    darts_.push_back(dart);
    int dart_number = static_cast<int>(darts_.size());

    has_last_detection_ = true;
    last_detection_time_ = now;

    // The next dart is compared against the board with this one in it
    reference_frame_ = frame.clone();
    motion_.reset();

    result.dart_detected = true;
    result.dart_number = dart_number;
    result.dart = dart;

    log_info("Dart " + log_string(dart_number) + ": " + score_processing::formatScore(score) +
             " (" + to_string(dart.points) + " pts) at (" + to_string((int)dart.dart_position.x) + "," + to_string((int)dart.dart_position.y) + ")" +
             " confidence " + to_string(dart.confidence));

    if (params_.debug_mode)
    {
        saveDebugImages(frame, diff, candidate, score, dart_number);
    }

    function<void(const DartDetection &, int)> on_dart = callbacks_.onDartDetected;
    notifications.push_back([on_dart, dart, dart_number]()
                            { if (on_dart) on_dart(dart, dart_number); });

    if (dart_number >= 3)
    {
        turn_complete_deadline_ = now + chrono::milliseconds(params_.turn_complete_delay_ms);

        vector<DartDetection> turn = darts_;
        function<void(const vector<DartDetection> &)> on_turn = callbacks_.onTurnComplete;
        notifications.push_back([on_turn, turn]()
                                { if (on_turn) on_turn(turn); });

        log_info("Turn complete: " + to_string(turn[0].points + turn[1].points + turn[2].points) + " pts");
        setState(TrackerState::TURN_COMPLETE, notifications);
    }
    else
    {
        setState(waitingStateFor(dart_number + 1), notifications);
    }
}

void DartTracker::checkRemoval(const Mat &frame, TimePoint now, TickResult &result, vector<Notification> &notifications)
{
    if (original_reference_.empty())
    {
        result.error = TrackerError::NO_REFERENCE_FRAME;
        return;
    }

    if (!diff_processing::haveSameDimensions(frame, original_reference_))
    {
        result.error = TrackerError::INVALID_FRAME_DIMENSIONS;
        return;
    }

    diff_processing::DiffResult diff = diff_processing::detectFrameDifference(frame, original_reference_, params_.removal_diff);
    if (diff.change_area >= params_.removal_threshold)
        return;

    log_info("Darts removed, ready for next turn");
    setState(TrackerState::IDLE, notifications);

    if (params_.auto_rearm)
    {
        rearm_pending_ = true;
        rearm_deadline_ = now + chrono::milliseconds(params_.rearm_delay_ms);
    }
}

void DartTracker::reset()
{
    vector<Notification> notifications;

    {
        lock_guard<mutex> lock(mutex_);

        turn_requested_ = false;
        turn_start_pending_ = false;
        rearm_pending_ = false;
        has_last_detection_ = false;

        darts_.clear();
        reference_frame_.release();
        original_reference_.release();

        motion_.clear();
        motion_status_.clear();
        smoother_.reset();
        board_ = BoardDetection();
        board_visible_ = false;
        board_misses_ = 0;

        state_ = TrackerState::IDLE;
        log_info("Tracker reset");

        function<void(TrackerState)> callback = callbacks_.onStateChange;
        notifications.push_back([callback]()
                                { if (callback) callback(TrackerState::IDLE); });
    }

    for (const Notification &notify : notifications)
    {
        notify();
    }
}

void DartTracker::setState(TrackerState state, vector<Notification> &notifications)
{
    if (state == state_)
        return;

    log_debug("State " + getTrackerStateName(state_) + " -> " + getTrackerStateName(state));
    state_ = state;

    function<void(TrackerState)> callback = callbacks_.onStateChange;
    notifications.push_back([callback, state]()
                            { if (callback) callback(state); });
}

void DartTracker::setMotionStatus(const string &status, vector<Notification> &notifications)
{
    if (status == motion_status_)
        return;

    motion_status_ = status;

    function<void(const string &)> callback = callbacks_.onMotionStatus;
    notifications.push_back([callback, status]()
                            { if (callback) callback(status); });
}

void DartTracker::saveDebugImages(const Mat &frame, const diff_processing::DiffResult &diff, const dart_processing::DartCandidate &candidate, const score_processing::ScoreResult &score, int dart_number)
{
    const string dir = "debug_frames/tracker";
    if (!debug::ensureDirectory(dir))
        return;

    debug::saveImage(dir + "/diff_dart_" + to_string(dart_number) + ".jpg", diff.mask);

    Mat annotated;
    cvtColor(frame, annotated, COLOR_RGBA2BGR);

    const BoardGeometry &g = board_.geometry;
    circle(annotated, g.center, cvRound(g.radius), Scalar(0, 255, 0), 2);
    for (const Point &p : candidate.contour)
    {
        annotated.at<Vec3b>(p) = Vec3b(255, 0, 255);
    }
    circle(annotated, candidate.tip, 5, Scalar(0, 0, 255), FILLED);
    putText(annotated, score_processing::formatScore(score), Point(10, 30), FONT_HERSHEY_SIMPLEX, 1.0, Scalar(0, 255, 255), 2);

    debug::saveImage(dir + "/dart_" + to_string(dart_number) + ".jpg", annotated);
}

TrackerState DartTracker::getState() const
{
    lock_guard<mutex> lock(mutex_);
    return state_;
}

vector<DartDetection> DartTracker::getDetectedDarts() const
{
    lock_guard<mutex> lock(mutex_);
    return darts_;
}

bool DartTracker::hasBoard() const
{
    lock_guard<mutex> lock(mutex_);
    return board_visible_;
}

BoardGeometry DartTracker::getBoardGeometry() const
{
    lock_guard<mutex> lock(mutex_);
    return board_.geometry;
}

motion_processing::MotionState DartTracker::getMotionState() const
{
    lock_guard<mutex> lock(mutex_);
    return motion_.state();
}

CalibrationData DartTracker::getCalibration() const
{
    lock_guard<mutex> lock(mutex_);
    return calibration_;
}

bool DartTracker::hasReferenceFrame() const
{
    lock_guard<mutex> lock(mutex_);
    return !reference_frame_.empty();
}
