#pragma once

#include "control/control_plane.h"

#include <chrono>
#include <string>
#include <vector>

namespace voxcap::app {

struct TriggerCommand {
    enum class Kind {
        Intent,  // forwarded to the control plane
        ListenOn,
        ListenOff,
        Status,
        Help,
        Quit,
        Invalid,
    };

    Kind kind = Kind::Invalid;
    control::Intent intent = control::Intent::Start;
    std::string text;
};

// Parses one line typed on stdin ("start", "stop", "cancel", "toggle", "tap",
// "listen on|off", "status", "help", "quit"). Surrounding whitespace and case are ignored.
TriggerCommand parseTriggerCommand(const std::string& line);

/**
 * Non-blocking line reader over a file descriptor (stdin by default), polled from the
 * main loop so signals are noticed between reads.
 */
class StdinTriggerSource {
   public:
    explicit StdinTriggerSource(int fd = 0) : fd_(fd) {}

    // Appends complete lines that arrived within timeout. Returns false once the input
    // reached EOF or failed.
    bool poll(std::chrono::milliseconds timeout, std::vector<std::string>& lines);

    // Stops reading; unread input is ignored and poll() returns false from now on
    void close();

    bool eof() const {
        return eof_;
    }

   private:
    int fd_;
    bool eof_ = false;
    std::string partial_;
};

}  // namespace voxcap::app
