#include "event_service.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <exception>

EventService::EventService(shared_ptr<EventQueue> queue, StateProvider state_provider, TurnStarter turn_starter, int port)
    : event_queue_(queue), state_provider_(state_provider), turn_starter_(turn_starter), port_(port)
{
    server_ = make_unique<httplib::Server>();
    setupRoutes();
}

EventService::~EventService()
{
    stop();
}

void EventService::start()
{
    if (running_)
        return;

    if (!server_->bind_to_port("0.0.0.0", port_))
    {
        log_error("Event service cannot bind port " + to_string(port_));
        return;
    }

    running_ = true;
    listen_finished_ = false;
    worker_thread_ = thread(&EventService::run, this);
    log_debug("Event service starting on port " + to_string(port_));
}

void EventService::stop()
{
    // Open streams notice within one wait period and close
    running_ = false;

    if (!worker_thread_.joinable())
        return;

    // stop() is a no-op until the accept loop is up
    while (!server_->is_running() && !listen_finished_)
    {
        this_thread::sleep_for(chrono::milliseconds(1));
    }
    server_->stop();
    worker_thread_.join();
    log_info("Event service stopped");
}

void EventService::run()
{
    log_info("Event service listening on http://0.0.0.0:" + to_string(port_));
    if (!server_->listen_after_bind())
    {
        log_error("Event service on port " + to_string(port_) + " stopped listening");
    }
    listen_finished_ = true;
}

string EventService::formatStreamMessage(const TrackerEvent &event)
{
    return "id: " + to_string(event.id) + "\n" +
           "event: " + getTrackerEventTypeName(event.type) + "\n" +
           "data: " + toJson(event).dump() + "\n\n";
}

void EventService::setupRoutes()
{
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { res.set_content("{\"status\":\"ok\",\"service\":\"DartSight\"}", "application/json"); });

    server_->Get("/state", [this](const httplib::Request &, httplib::Response &res)
                 {
        try {
            res.set_content(state_provider_().dump(), "application/json");
        } catch (const exception &e) {
            log_error("State request failed: " + string(e.what()));
            res.status = 500;
            res.set_content("{\"error\":\"state unavailable\"}", "application/json");
        } });

    server_->Get("/events", [this](const httplib::Request &req, httplib::Response &res)
                 {
        uint64_t since = 0;
        if (req.has_param("since")) {
            try {
                since = stoull(req.get_param_value("since"));
            } catch (const exception &) {
                res.status = 400;
                res.set_content("{\"error\":\"since must be an event id\"}", "application/json");
                return;
            }
        }

        json events = json::array();
        for (const auto &event : event_queue_->since(since)) {
            events.push_back(toJson(event));
        }
        res.set_content(events.dump(), "application/json"); });

    server_->Get("/events/stream", [this](const httplib::Request &req, httplib::Response &res)
                 {
        // Resume after Last-Event-ID, otherwise only new events
        auto last_id = make_shared<uint64_t>(event_queue_->lastId());
        string resume = req.get_header_value("Last-Event-ID");
        if (!resume.empty()) {
            try {
                *last_id = stoull(resume);
            } catch (const exception &) {
                log_debug("Ignoring bad Last-Event-ID " + resume);
            }
        }

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, last_id](size_t, httplib::DataSink &sink) -> bool {
                if (!running_ || !sink.is_writable())
                    return false;

                vector<TrackerEvent> events;
                if (!event_queue_->waitSince(*last_id, events, 1000)) {
                    const string keepalive = ": keepalive\n\n";
                    return sink.write(keepalive.data(), keepalive.size());
                }

                for (const auto &event : events) {
                    string message = formatStreamMessage(event);
                    if (!sink.write(message.data(), message.size()))
                        return false;
                    *last_id = event.id;
                }
                return true;
            });
        log_debug("Event stream client connected"); });

    server_->Post("/turn/start", [this](const httplib::Request &, httplib::Response &res)
                  {
        turn_starter_();
        res.set_content("{\"status\":\"turn_requested\"}", "application/json"); });

    server_->Options(".*", [](const httplib::Request &, httplib::Response &res)
                     { res.status = 204; });
}
