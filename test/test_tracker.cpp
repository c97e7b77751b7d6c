/**
 * test_tracker.cpp - Turn lifecycle driven by synthetic frames and a manual clock
 */
#include "tracker/dart_tracker.hpp"
#include "tracker/tracker_runner.hpp"
#include "detector/detector_factory.hpp"
#include "utils/encoding.hpp"
#include "synthetic_board.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using synthetic::Direction;

static chrono::steady_clock::time_point g_now;
static const chrono::milliseconds FRAME_INTERVAL(33);

static chrono::steady_clock::time_point manualClock()
{
    return g_now;
}

class FakeFrameSource : public FrameSource
{
public:
    bool captureFrame(Mat &frame) override
    {
        if (fail || current.empty())
            return false;
        frame = current.clone();
        return true;
    }

    bool isOpened() const override { return true; }

    Mat current;
    bool fail = false;
};

class MemoryCalibrationStore : public CalibrationStore
{
public:
    bool load(CalibrationData &data) override
    {
        if (!has_data)
            return false;
        data = stored;
        return true;
    }

    bool save(const CalibrationData &data) override
    {
        stored = data;
        has_data = true;
        saves++;
        return true;
    }

    CalibrationData stored;
    bool has_data = false;
    int saves = 0;
};

struct Recorder
{
    vector<pair<DartDetection, int>> darts;
    vector<vector<DartDetection>> turns;
    vector<TrackerState> states;
    vector<bool> boards;
    vector<string> motion;
    DartTracker *tracker = nullptr;

    TrackerCallbacks callbacks()
    {
        TrackerCallbacks cb;
        cb.onDartDetected = [this](const DartDetection &dart, int number)
        {
            // Runs outside the tracker lock
            if (tracker)
                assert(static_cast<int>(tracker->getDetectedDarts().size()) == number);
            darts.push_back({dart, number});
        };
        cb.onTurnComplete = [this](const vector<DartDetection> &turn)
        { turns.push_back(turn); };
        cb.onStateChange = [this](TrackerState state)
        { states.push_back(state); };
        cb.onBoardDetected = [this](bool visible)
        { boards.push_back(visible); };
        cb.onMotionStatus = [this](const string &status)
        { motion.push_back(status); };
        return cb;
    }
};

// Feed one frame for a number of ticks, 33 ms apart
static vector<TickResult> feed(DartTracker &tracker, FakeFrameSource &source, const Mat &frame, int ticks)
{
    source.current = frame;
    vector<TickResult> results;
    for (int i = 0; i < ticks; i++)
    {
        g_now += FRAME_INTERVAL;
        results.push_back(tracker.tick());
    }
    return results;
}

static int countDetections(const vector<TickResult> &results)
{
    int count = 0;
    for (const TickResult &r : results)
        count += r.dart_detected ? 1 : 0;
    return count;
}

static unique_ptr<BoardDetectorInterface> detector()
{
    return DetectorFactory::createBoardDetector("enhanced");
}

static void testFullTurn()
{
    Mat empty = synthetic::boardFrame();
    FakeFrameSource source;
    MemoryCalibrationStore store;
    Recorder recorder;
    DartTracker tracker(source, detector(), recorder.callbacks(), TrackerParams(), &store, manualClock);
    recorder.tracker = &tracker;

    assert(tracker.getState() == TrackerState::IDLE);
    tracker.startTurn();

    feed(tracker, source, empty, 40);
    assert(tracker.getState() == TrackerState::WAITING_DART_1);
    assert(recorder.boards.size() == 1 && recorder.boards[0]);
    assert(tracker.hasBoard() && tracker.hasReferenceFrame());
    assert(store.saves == 1 && store.stored.hasReferenceFrame());
    assert(synthetic::distance(store.stored.center, synthetic::BOARD_CENTER) < 2.0);
    assert(store.stored.radius >= synthetic::DETECTED_RADIUS_MIN && store.stored.radius <= synthetic::DETECTED_RADIUS_MAX);
    assert(recorder.darts.empty());
    std::cout << "[PASS] startTurn settles, captures and persists the reference" << std::endl;

    vector<TickResult> first = feed(tracker, source, synthetic::withDart(empty, Direction::UP), 40);
    assert(countDetections(first) == 1 && first[0].dart_detected);
    assert(tracker.getState() == TrackerState::WAITING_DART_2);

    vector<TickResult> second = feed(tracker, source, synthetic::withDarts(empty, {Direction::UP, Direction::RIGHT}), 40);
    assert(countDetections(second) == 1);
    assert(tracker.getState() == TrackerState::WAITING_DART_3);

    vector<TickResult> third = feed(tracker, source, synthetic::withDarts(empty, {Direction::UP, Direction::RIGHT, Direction::DOWN}), 40);
    assert(countDetections(third) == 1);

    assert(recorder.darts.size() == 3);
    const int expected_segments[3] = {20, 6, 3};
    for (int i = 0; i < 3; i++)
    {
        const DartDetection &dart = recorder.darts[i].first;
        assert(recorder.darts[i].second == i + 1);
        assert(dart.segment == expected_segments[i]);
        assert(dart.multiplier == 1 && dart.points == expected_segments[i]);
        assert(dart.confidence >= 0.5);
        assert(synthetic::distance(dart.dart_position, synthetic::BOARD_CENTER) < 50.0);
    }
    std::cout << "[PASS] Three darts scored S20, S6, S3 in order" << std::endl;

    assert(recorder.turns.size() == 1);
    assert(recorder.turns[0].size() == 3);
    assert(recorder.turns[0][0].points + recorder.turns[0][1].points + recorder.turns[0][2].points == 29);
    assert(tracker.getState() == TrackerState::WAITING_REMOVAL);
    std::cout << "[PASS] Turn complete, then waiting for removal" << std::endl;

    // Darts still in the board: stays put
    feed(tracker, source, synthetic::withDarts(empty, {Direction::UP, Direction::RIGHT, Direction::DOWN}), 5);
    assert(tracker.getState() == TrackerState::WAITING_REMOVAL);

    feed(tracker, source, empty, 1);
    assert(tracker.getState() == TrackerState::IDLE);

    const vector<TrackerState> expected = {
        TrackerState::WAITING_DART_1,
        TrackerState::WAITING_DART_2,
        TrackerState::WAITING_DART_3,
        TrackerState::TURN_COMPLETE,
        TrackerState::WAITING_REMOVAL,
        TrackerState::IDLE};
    assert(recorder.states == expected);
    std::cout << "[PASS] Empty board returns to idle" << std::endl;

    // Re-arm after 1 s, settle 0.5 s
    feed(tracker, source, empty, 60);
    assert(tracker.getState() == TrackerState::WAITING_DART_1);
    assert(tracker.getDetectedDarts().empty());
    assert(recorder.darts.size() == 3);
    std::cout << "[PASS] Next turn starts by itself" << std::endl;

    assert(!recorder.motion.empty());
    assert(std::find(recorder.motion.begin(), recorder.motion.end(), motion_processing::STATUS_LANDED) != recorder.motion.end());
}

static void testDebounce()
{
    Mat empty = synthetic::boardFrame();
    FakeFrameSource source;
    Recorder recorder;
    DartTracker tracker(source, detector(), recorder.callbacks(), TrackerParams(), nullptr, manualClock);

    tracker.startTurn();
    feed(tracker, source, empty, 40);
    assert(tracker.getState() == TrackerState::WAITING_DART_1);

    // Second dart shows up on the very next frame
    vector<TickResult> first = feed(tracker, source, synthetic::withDart(empty, Direction::UP), 1);
    assert(first[0].dart_detected);
    vector<TickResult> next = feed(tracker, source, synthetic::withDarts(empty, {Direction::UP, Direction::LEFT}), 60);

    int detected_at = -1;
    for (size_t i = 0; i < next.size(); i++)
    {
        if (next[i].dart_detected)
        {
            detected_at = static_cast<int>(i) + 1;
            break;
        }
    }
    assert(detected_at > 0);
    assert(detected_at * FRAME_INTERVAL.count() >= 1000);
    assert(detected_at * FRAME_INTERVAL.count() < 1000 + 2 * FRAME_INTERVAL.count());
    assert(recorder.darts.size() == 2 && recorder.darts[1].first.segment == 11);
    std::cout << "[PASS] Second dart waits out the 1 s debounce" << std::endl;
}

static void testBoardLoss()
{
    Mat empty = synthetic::boardFrame();
    FakeFrameSource source;
    Recorder recorder;
    DartTracker tracker(source, detector(), recorder.callbacks(), TrackerParams(), nullptr, manualClock);

    tracker.startTurn();
    feed(tracker, source, empty, 40);
    assert(tracker.getState() == TrackerState::WAITING_DART_1);

    // Two misses are tolerated
    feed(tracker, source, synthetic::blankFrame(), 2);
    assert(tracker.hasBoard());
    feed(tracker, source, empty, 1);

    vector<TickResult> lost = feed(tracker, source, synthetic::blankFrame(), 3);
    assert(!tracker.hasBoard());
    assert(tracker.getState() == TrackerState::NO_BOARD);
    assert(lost.back().error == TrackerError::NO_BOARD_GEOMETRY);
    assert(recorder.boards.size() == 2 && recorder.boards[0] && !recorder.boards[1]);
    std::cout << "[PASS] Board lost after 3 missed frames" << std::endl;

    feed(tracker, source, empty, 1);
    assert(tracker.hasBoard());
    assert(tracker.getState() == TrackerState::WAITING_DART_1);
    assert(recorder.boards.size() == 3 && recorder.boards[2]);
    std::cout << "[PASS] Board back, waiting for dart 1 again" << std::endl;

    // A turn started without a board waits for it
    DartTracker blind(source, detector(), TrackerCallbacks(), TrackerParams(), nullptr, manualClock);
    blind.startTurn();
    feed(blind, source, synthetic::blankFrame(), 20);
    assert(blind.getState() == TrackerState::NO_BOARD);
    feed(blind, source, synthetic::blankFrame(), 1);
    assert(blind.getState() == TrackerState::NO_BOARD);
    std::cout << "[PASS] Turn without a board stays in NO_BOARD" << std::endl;
}

static void testSnapshotFallback()
{
    Mat empty = synthetic::boardFrame();
    string url;
    assert(encoding::encodeDataURL(empty, 0.9, url));

    FakeFrameSource source;
    MemoryCalibrationStore store;
    store.has_data = true;
    store.stored.center = synthetic::BOARD_CENTER;
    store.stored.radius = 130.0;
    store.stored.reference_frame = url;

    Recorder recorder;
    DartTracker tracker(source, detector(), recorder.callbacks(), TrackerParams(), &store, manualClock);
    assert(tracker.loadCalibration());
    assert(tracker.getCalibration().hasReferenceFrame());

    source.fail = true;
    tracker.startTurn();
    vector<TickResult> results = feed(tracker, source, Mat(), 20);
    for (const TickResult &r : results)
        assert(r.error == TrackerError::NO_FRAME);
    assert(tracker.hasReferenceFrame());
    assert(tracker.getState() == TrackerState::NO_BOARD);
    assert(store.saves == 0);
    std::cout << "[PASS] Failed capture at turn start falls back to the stored snapshot" << std::endl;

    source.fail = false;
    feed(tracker, source, empty, 1);
    assert(tracker.getState() == TrackerState::WAITING_DART_1);
    std::cout << "[PASS] Board seen, turn continues on the stored reference" << std::endl;

    // Malformed snapshot is ignored
    CalibrationData broken;
    broken.center = synthetic::BOARD_CENTER;
    broken.radius = 130.0;
    broken.reference_frame = "data:image/jpeg;base64,@@@@";
    DartTracker fresh(source, detector(), TrackerCallbacks(), TrackerParams(), nullptr, manualClock);
    fresh.initialize(broken);
    source.fail = true;
    fresh.startTurn();
    feed(fresh, source, Mat(), 20);
    assert(fresh.getState() == TrackerState::IDLE);
    assert(!fresh.hasReferenceFrame());
    assert(!fresh.loadCalibration());
    std::cout << "[PASS] Malformed snapshot and missing store" << std::endl;
}

static void testResetAndInvalidFrames()
{
    Mat empty = synthetic::boardFrame();
    FakeFrameSource source;
    Recorder recorder;
    DartTracker tracker(source, detector(), recorder.callbacks(), TrackerParams(), nullptr, manualClock);

    tracker.startTurn();
    feed(tracker, source, empty, 40);
    feed(tracker, source, synthetic::withDart(empty, Direction::UP), 5);
    assert(tracker.getDetectedDarts().size() == 1);

    Mat bgr(empty.size(), CV_8UC3, Scalar(0, 0, 0));
    vector<TickResult> invalid = feed(tracker, source, bgr, 1);
    assert(invalid[0].error == TrackerError::INVALID_FRAME_DIMENSIONS);
    Mat smaller = synthetic::blankFrame()(Rect(0, 0, 100, 100)).clone();
    invalid = feed(tracker, source, smaller, 1);
    assert(invalid[0].error == TrackerError::INVALID_FRAME_DIMENSIONS);
    assert(tracker.getState() == TrackerState::WAITING_DART_2);
    std::cout << "[PASS] Invalid frames are skipped" << std::endl;

    size_t before = recorder.states.size();
    tracker.reset();
    assert(tracker.getState() == TrackerState::IDLE);
    assert(tracker.getDetectedDarts().empty());
    assert(!tracker.hasReferenceFrame() && !tracker.hasBoard());
    assert(recorder.states.size() == before + 1 && recorder.states.back() == TrackerState::IDLE);

    // Reset while idle still reports idle
    tracker.reset();
    assert(recorder.states.size() == before + 2);

    // Nothing happens without a new turn
    feed(tracker, source, empty, 30);
    assert(tracker.getState() == TrackerState::IDLE);
    std::cout << "[PASS] reset clears the turn and reports idle" << std::endl;

    assert(getTrackerStateName(TrackerState::WAITING_DART_2) == "waiting-dart-2");
    assert(getTrackerErrorName(TrackerError::NO_FRAME) == "no-frame");
    assert(waitingStateFor(3) == TrackerState::WAITING_DART_3);
    assert(isWaitingForDart(TrackerState::WAITING_DART_1) && !isWaitingForDart(TrackerState::TURN_COMPLETE));
}

static void testRunner()
{
    FakeFrameSource source;
    source.current = synthetic::boardFrame();
    DartTracker tracker(source, detector(), TrackerCallbacks());
    TrackerRunner runner(tracker);

    tracker.startTurn();
    runner.start();
    assert(runner.isRunning());
    this_thread::sleep_for(chrono::milliseconds(200));
    runner.stop();
    assert(!runner.isRunning());
    assert(runner.tickCount() > 0);
    unsigned long long ticks = runner.tickCount();
    this_thread::sleep_for(chrono::milliseconds(50));
    assert(runner.tickCount() == ticks);

    // No frames: loop keeps going without a busy spin
    source.current = Mat();
    runner.start();
    this_thread::sleep_for(chrono::milliseconds(100));
    runner.reset();
    assert(!runner.isRunning());
    assert(tracker.getState() == TrackerState::IDLE);
    std::cout << "[PASS] Runner starts, stops and resets" << std::endl;
}

int main()
{
    std::cout << "Dart tracker tests" << std::endl;
    g_now = chrono::steady_clock::now();

    testFullTurn();
    testDebounce();
    testBoardLoss();
    testSnapshotFallback();
    testResetAndInvalidFrames();
    testRunner();

    std::cout << std::endl
              << "All tests passed!" << std::endl;
    return 0;
}
