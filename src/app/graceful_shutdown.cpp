#include "app/graceful_shutdown.h"

#include "logging/logger.h"

namespace voxcap::app {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

bool ShutdownController::processPendingSignals() {
    if (!signalState_ || !signalState_->shutdown) {
        return false;
    }
    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;
    LOG_INFO("Received signal {}, shutting down", lastSignal_);
    shutdownOnce();
    return true;
}

void ShutdownController::requestShutdown() {
    LOG_INFO("Shutdown requested");
    shutdownOnce();
}

void ShutdownController::shutdownOnce() {
    // A second signal while finalizing only re-issues the quit request
    if (!finalized_.exchange(true) && finalizeCallback_) {
        finalizeCallback_();
    }
    if (quitCallback_) {
        quitCallback_();
    }
    running_ = false;
}

}  // namespace voxcap::app
