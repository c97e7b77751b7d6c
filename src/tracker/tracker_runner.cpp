#include "tracker_runner.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <exception>

using namespace std;

TrackerRunner::TrackerRunner(DartTracker &tracker, int idle_backoff_ms)
    : tracker_(tracker), idle_backoff_ms_(idle_backoff_ms)
{
}

TrackerRunner::~TrackerRunner()
{
    stop();
}

void TrackerRunner::start()
{
    if (running_.exchange(true))
        return;

    worker_thread_ = thread([this]()
                            {
                                log_info("Tracker loop running");
                                while (running_)
                                {
                                    bool idle = false;
                                    try
                                    {
                                        TickResult result = tracker_.tick();
                                        idle = result.error == TrackerError::NO_FRAME;
                                    }
                                    catch (const exception &e)
                                    {
                                        // One bad frame must not end the loop
                                        log_error("Tick failed: " + string(e.what()));
                                    }
                                    tick_count_++;

                                    if (idle && idle_backoff_ms_ > 0)
                                    {
                                        this_thread::sleep_for(chrono::milliseconds(idle_backoff_ms_));
                                    }
                                }
                                log_info("Tracker loop stopped"); });
}

void TrackerRunner::run()
{
    start();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

void TrackerRunner::stop()
{
    running_ = false;
    if (worker_thread_.joinable() && worker_thread_.get_id() != this_thread::get_id())
    {
        worker_thread_.join();
    }
}

void TrackerRunner::reset()
{
    stop();
    tracker_.reset();
}
