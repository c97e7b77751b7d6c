#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tracker/dart_tracker.hpp"

using json = nlohmann::json;

enum class TrackerEventType
{
    DART_DETECTED,
    TURN_COMPLETE,
    STATE_CHANGE,
    BOARD_DETECTED,
    MOTION_STATUS
};

// One tracker callback, as delivered to remote listeners
struct TrackerEvent
{
    uint64_t id = 0;        // Assigned by the queue, strictly increasing
    int64_t timestamp = 0;  // Wall clock ms, assigned by the queue
    TrackerEventType type = TrackerEventType::STATE_CHANGE;

    DartDetection dart;           // DART_DETECTED
    int dart_number = 0;          // DART_DETECTED
    vector<DartDetection> darts;  // TURN_COMPLETE
    TrackerState state = TrackerState::IDLE; // STATE_CHANGE
    bool board_visible = false;   // BOARD_DETECTED
    string motion_status;         // MOTION_STATUS
};

string getTrackerEventTypeName(TrackerEventType type);

json toJson(const DartDetection &dart);
json toJson(const TrackerEvent &event);

// Current state, board and darts of the running turn
json trackerSnapshot(const DartTracker &tracker);

// Bounded event history shared between the tracker thread and any number of readers
class EventQueue
{
public:
    explicit EventQueue(size_t max_history = 256);

    // Returns the id given to the event
    uint64_t push(TrackerEvent event);

    // Events with id > after_id still in the history
    vector<TrackerEvent> since(uint64_t after_id) const;

    // Block until an event newer than after_id exists or the timeout passes
    bool waitSince(uint64_t after_id, vector<TrackerEvent> &events, int timeout_ms = 1000) const;

    uint64_t lastId() const;
    size_t size() const;

    // Callbacks that forward every tracker notification into this queue
    TrackerCallbacks makeCallbacks();

private:
    void collect(uint64_t after_id, vector<TrackerEvent> &events) const;

    size_t max_history_;
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
    std::deque<TrackerEvent> history_;
    uint64_t next_id_ = 1;
};
