#include "console_input.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <exception>
#include <poll.h>
#include <unistd.h>

namespace luna_voice {

ConsoleInput::ConsoleInput(int fd, int poll_interval_ms)
    : fd_(fd)
    , poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 100)
    , stop_requested_(false)
    , running_(false) {}

ConsoleInput::~ConsoleInput() {
    stop();
}

bool ConsoleInput::start(LineHandler handler) {
    if (thread_.joinable()) {
        return false;
    }
    handler_ = std::move(handler);
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&ConsoleInput::read_loop, this);
    return true;
}

void ConsoleInput::stop() {
    stop_requested_ = true;
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    running_ = false;
}

void ConsoleInput::read_loop() {
    std::string pending;
    char buffer[256];

    while (!stop_requested_.load()) {
        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, poll_interval_ms_);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::warn(std::string("[Console] poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }
        if ((pfd.revents & (POLLIN | POLLHUP)) == 0) {
            Logger::warn("[Console] input descriptor is no longer readable");
            break;
        }

        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::warn(std::string("[Console] read failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while (!stop_requested_.load() && (newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            deliver(line);
        }
    }

    if (!stop_requested_.load() && !pending.empty()) {
        deliver(pending);
    }
    running_ = false;
}

void ConsoleInput::deliver(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    try {
        handler_(text);
    } catch (const std::exception& e) {
        Logger::error(std::string("[Console] command handler threw: ") + e.what());
    }
}

} // namespace luna_voice
