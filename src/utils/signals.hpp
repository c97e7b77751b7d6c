#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include "logging.hpp"

namespace signals
{
    // Callback run once on SIGINT/SIGTERM
    inline std::function<void()> shutdownCallback;
    inline std::atomic<bool> shutdownRequested{false};

    inline void signalHandler(int signal)
    {
        // Second signal while shutting down: give up waiting
        if (shutdownRequested.exchange(true))
        {
            std::_Exit(signal);
        }

        log_warning("Received signal " + std::to_string(signal) + ", shutting down...");

        if (shutdownCallback)
        {
            shutdownCallback();
        }
    }

    inline void setupSignalHandlers(std::function<void()> callback)
    {
        shutdownCallback = std::move(callback);
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

    inline bool isShutdownRequested()
    {
        return shutdownRequested.load();
    }

} // namespace signals
