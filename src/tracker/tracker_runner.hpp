#pragma once
#include <atomic>
#include <thread>
#include "dart_tracker.hpp"

// Owns the thread that calls DartTracker::tick() once per frame
class TrackerRunner
{
public:
    explicit TrackerRunner(DartTracker &tracker, int idle_backoff_ms = 10);
    ~TrackerRunner();

    void start();

    // Finish the current tick, then join
    void stop();

    // Only clears the running flag, safe from a signal handler
    void requestStop() { running_ = false; }

    // Stop the loop and clear per-turn state
    void reset();

    // Start and block until the loop ends
    void run();

    bool isRunning() const { return running_; }
    unsigned long long tickCount() const { return tick_count_; }

private:
    DartTracker &tracker_;
    int idle_backoff_ms_; // Sleep after a tick without a frame
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<unsigned long long> tick_count_{0};
};
