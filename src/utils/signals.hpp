#pragma once
#include <csignal>
#include "logging.hpp"

namespace signals
{

    // Set from the signal handler, polled by the main loop
    inline volatile std::sig_atomic_t shutdownFlag = 0;
    inline volatile std::sig_atomic_t lastSignal = 0;

    // Only async-signal-safe work here; the main loop releases the camera and stops the service
    inline void signalHandler(int signal)
    {
        lastSignal = signal;
        shutdownFlag = 1;
    }

    inline bool shutdownRequested()
    {
        return shutdownFlag != 0;
    }

    inline int receivedSignal()
    {
        return lastSignal;
    }

    // Register SIGINT/SIGTERM handlers; SIGPIPE is ignored so a dropped stream client cannot kill us
    inline void setupSignalHandlers()
    {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);
        log_info("Signal handlers registered for graceful shutdown");
    }

} // namespace signals
