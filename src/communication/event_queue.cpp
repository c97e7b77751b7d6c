#include "event_queue.hpp"
#include "utils/logging.hpp"
#include "detector/detection/score_processing.hpp"
#include <chrono>

string getTrackerEventTypeName(TrackerEventType type)
{
    switch (type)
    {
    case TrackerEventType::DART_DETECTED:
        return "dart";
    case TrackerEventType::TURN_COMPLETE:
        return "turn-complete";
    case TrackerEventType::STATE_CHANGE:
        return "state";
    case TrackerEventType::BOARD_DETECTED:
        return "board";
    case TrackerEventType::MOTION_STATUS:
        return "motion";
    default:
        return "unknown";
    }
}

json toJson(const DartDetection &dart)
{
    score_processing::ScoreResult score;
    score.segment = dart.segment;
    score.multiplier = dart.multiplier;
    score.points = dart.points;

    json j;
    j["segment"] = dart.segment;
    j["multiplier"] = dart.multiplier;
    j["points"] = dart.points;
    j["label"] = score_processing::formatScore(score);
    j["confidence"] = dart.confidence;
    j["position"] = {{"x", dart.dart_position.x}, {"y", dart.dart_position.y}};
    return j;
}

json toJson(const TrackerEvent &event)
{
    json j;
    j["id"] = event.id;
    j["type"] = getTrackerEventTypeName(event.type);
    j["timestamp"] = event.timestamp;

    switch (event.type)
    {
    case TrackerEventType::DART_DETECTED:
        j["dart"] = toJson(event.dart);
        j["dart_number"] = event.dart_number;
        break;

    case TrackerEventType::TURN_COMPLETE:
    {
        json darts = json::array();
        int total = 0;
        for (const auto &dart : event.darts)
        {
            darts.push_back(toJson(dart));
            total += dart.points;
        }
        j["darts"] = darts;
        j["total"] = total;
        break;
    }

    case TrackerEventType::STATE_CHANGE:
        j["state"] = getTrackerStateName(event.state);
        break;

    case TrackerEventType::BOARD_DETECTED:
        j["visible"] = event.board_visible;
        break;

    case TrackerEventType::MOTION_STATUS:
        j["status"] = event.motion_status;
        break;
    }

    return j;
}

json trackerSnapshot(const DartTracker &tracker)
{
    json j;
    j["state"] = getTrackerStateName(tracker.getState());
    j["board_visible"] = tracker.hasBoard();

    BoardGeometry geometry = tracker.getBoardGeometry();
    if (tracker.hasBoard())
    {
        j["board"] = {{"center", {{"x", geometry.center.x}, {"y", geometry.center.y}}},
                      {"radius", geometry.radius},
                      {"confidence", geometry.confidence}};
    }
    else
    {
        j["board"] = nullptr;
    }

    json darts = json::array();
    for (const auto &dart : tracker.getDetectedDarts())
    {
        darts.push_back(toJson(dart));
    }
    j["darts"] = darts;

    motion_processing::MotionState motion = tracker.getMotionState();
    j["motion"] = {{"stable", motion.is_stable},
                   {"stability_frames", motion.stability_frames},
                   {"last_area", motion.last_motion_area}};
    j["has_reference"] = tracker.hasReferenceFrame();
    return j;
}

EventQueue::EventQueue(size_t max_history)
    : max_history_(max_history > 0 ? max_history : 1)
{
}

uint64_t EventQueue::push(TrackerEvent event)
{
    uint64_t id;
    TrackerEventType type = event.type;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.id = next_id_++;
        event.timestamp = chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
        id = event.id;

        history_.push_back(std::move(event));
        while (history_.size() > max_history_)
        {
            history_.pop_front();
        }
    }
    condition_.notify_all();
    log_debug("Event " + log_string(id) + " " + getTrackerEventTypeName(type));
    return id;
}

void EventQueue::collect(uint64_t after_id, vector<TrackerEvent> &events) const
{
    for (const auto &event : history_)
    {
        if (event.id > after_id)
        {
            events.push_back(event);
        }
    }
}

vector<TrackerEvent> EventQueue::since(uint64_t after_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    vector<TrackerEvent> events;
    collect(after_id, events);
    return events;
}

bool EventQueue::waitSince(uint64_t after_id, vector<TrackerEvent> &events, int timeout_ms) const
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this, after_id]
                            { return !history_.empty() && history_.back().id > after_id; }))
    {
        collect(after_id, events);
        return true;
    }
    return false;
}

uint64_t EventQueue::lastId() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

size_t EventQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

TrackerCallbacks EventQueue::makeCallbacks()
{
    TrackerCallbacks callbacks;

    callbacks.onDartDetected = [this](const DartDetection &dart, int dart_number)
    {
        TrackerEvent event;
        event.type = TrackerEventType::DART_DETECTED;
        event.dart = dart;
        event.dart_number = dart_number;
        push(std::move(event));
    };

    callbacks.onTurnComplete = [this](const vector<DartDetection> &darts)
    {
        TrackerEvent event;
        event.type = TrackerEventType::TURN_COMPLETE;
        event.darts = darts;
        push(std::move(event));
    };

    callbacks.onStateChange = [this](TrackerState state)
    {
        TrackerEvent event;
        event.type = TrackerEventType::STATE_CHANGE;
        event.state = state;
        push(std::move(event));
    };

    callbacks.onBoardDetected = [this](bool visible)
    {
        TrackerEvent event;
        event.type = TrackerEventType::BOARD_DETECTED;
        event.board_visible = visible;
        push(std::move(event));
    };

    callbacks.onMotionStatus = [this](const string &status)
    {
        TrackerEvent event;
        event.type = TrackerEventType::MOTION_STATUS;
        event.motion_status = status;
        push(std::move(event));
    };

    return callbacks;
}
