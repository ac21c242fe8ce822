#include "app/stdin_trigger_source.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace voxcap::app {

namespace {

std::string normalize(const std::string& line) {
    std::istringstream in(line);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) {
            out += ' ';
        }
        out += word;
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

TriggerCommand parseTriggerCommand(const std::string& line) {
    TriggerCommand cmd;
    cmd.text = normalize(line);

    if (cmd.text == "listen on") {
        cmd.kind = TriggerCommand::Kind::ListenOn;
    } else if (cmd.text == "listen off") {
        cmd.kind = TriggerCommand::Kind::ListenOff;
    } else if (cmd.text == "status") {
        cmd.kind = TriggerCommand::Kind::Status;
    } else if (cmd.text == "help" || cmd.text == "?") {
        cmd.kind = TriggerCommand::Kind::Help;
    } else if (cmd.text == "quit" || cmd.text == "exit") {
        cmd.kind = TriggerCommand::Kind::Quit;
    } else if (control::parseIntent(cmd.text, cmd.intent)) {
        cmd.kind = TriggerCommand::Kind::Intent;
    }
    return cmd;
}

bool StdinTriggerSource::poll(std::chrono::milliseconds timeout, std::vector<std::string>& lines) {
    if (eof_) {
        return false;
    }

    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno == EINTR) {
            return true;
        }
        LOG_ERROR("StdinTriggerSource: poll failed: {}", std::strerror(errno));
        eof_ = true;
        return false;
    }
    if (ret == 0) {
        return true;
    }

    char buf[512];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return true;
        }
        LOG_ERROR("StdinTriggerSource: read failed: {}", std::strerror(errno));
        eof_ = true;
        return false;
    }
    if (n == 0) {
        if (!partial_.empty()) {
            lines.push_back(partial_);
            partial_.clear();
        }
        eof_ = true;
        return false;
    }

    partial_.append(buf, static_cast<size_t>(n));
    size_t pos;
    while ((pos = partial_.find('\n')) != std::string::npos) {
        lines.push_back(partial_.substr(0, pos));
        partial_.erase(0, pos + 1);
    }
    return true;
}

void StdinTriggerSource::close() {
    eof_ = true;
    partial_.clear();
}

}  // namespace voxcap::app
