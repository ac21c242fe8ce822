#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace voxcap::app {

// Flags written by the signal handler and polled by the main loop.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        received = 0;
    }
};

// Turns pending signal flags into an orderly shutdown. Testable without real signals.
class ShutdownController {
   public:
    // Ends an active recording before the process exits
    using FinalizeCallback = std::function<void()>;
    using QuitCallback = std::function<void()>;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setFinalizeCallback(FinalizeCallback cb) {
        finalizeCallback_ = std::move(cb);
    }
    void setQuitCallback(QuitCallback cb) {
        quitCallback_ = std::move(cb);
    }

    // Returns true if a shutdown signal was consumed
    bool processPendingSignals();

    // Shutdown requested by a trigger source instead of a signal
    void requestShutdown();

    bool isRunning() const {
        return running_.load();
    }

    int getLastSignal() const {
        return lastSignal_;
    }

   private:
    void shutdownOnce();

    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> finalized_{false};
    FinalizeCallback finalizeCallback_;
    QuitCallback quitCallback_;
    int lastSignal_ = 0;
};

// Async-signal-safe: only sets flags in the global SignalState
void signalHandler(int sig);

SignalState& getGlobalSignalState();

void installSignalHandlers();

}  // namespace voxcap::app
