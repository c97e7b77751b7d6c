#pragma once
#include "event_queue.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <httplib.h>

// Local HTTP endpoint for tracker events: JSON polling and server-sent events
class EventService
{
public:
    using StateProvider = std::function<json()>;
    using TurnStarter = std::function<void()>;

    EventService(std::shared_ptr<EventQueue> queue, StateProvider state_provider, TurnStarter turn_starter, int port = 13520);
    ~EventService();

    void start();
    void stop();
    bool isRunning() const { return running_; }
    int port() const { return port_; }

private:
    void run();
    void setupRoutes();
    static std::string formatStreamMessage(const TrackerEvent &event);

    std::shared_ptr<EventQueue> event_queue_;
    StateProvider state_provider_;
    TurnStarter turn_starter_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listen_finished_{false};
    std::unique_ptr<httplib::Server> server_;
    int port_;
};
