#pragma once
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include "logging.hpp"

namespace signals
{
    inline std::atomic<int> &receivedSignal()
    {
        static std::atomic<int> value{0};
        return value;
    }

    // Only records the signal, shutdown runs on the main thread
    inline void signalHandler(int signal)
    {
        receivedSignal() = signal;
    }

    inline void setupSignalHandlers()
    {
        receivedSignal() = 0;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Stream clients vanish mid-write, that must not kill the process
        std::signal(SIGPIPE, SIG_IGN);
        log_info("Signal handlers registered for graceful shutdown");
    }

    // Block until SIGINT or SIGTERM arrives, returns the signal number
    inline int waitForShutdown(int poll_ms = 200)
    {
        while (receivedSignal() == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));

        int signal = receivedSignal();
        log_warning("Received signal " + std::to_string(signal) + ", shutting down...");
        return signal;
    }

} // namespace signals
