#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace luna_voice {

/**
 * @brief Line reader for a file descriptor (stdin by default)
 *
 * A worker thread waits on the descriptor with poll() and a short timeout,
 * so stop() returns within one interval even when no input ever arrives.
 * Each complete line, without its newline, is passed to the handler on the
 * worker thread. End of input ends the reader; a final unterminated line
 * is still delivered.
 *
 * Thread Safety:
 * - start()/stop() from the owning thread
 * - The handler runs on the worker thread and must be thread-safe
 */
class ConsoleInput {
public:
    using LineHandler = std::function<void(const std::string& line)>;

    explicit ConsoleInput(int fd = 0, int poll_interval_ms = 100);
    ~ConsoleInput();

    ConsoleInput(const ConsoleInput&) = delete;
    ConsoleInput& operator=(const ConsoleInput&) = delete;

    /**
     * @brief Start the worker thread
     * @return false if already started
     */
    bool start(LineHandler handler);

    /**
     * @brief Ask the worker to exit and join it
     *
     * Once stop() returns the handler is not running and will not run again.
     */
    void stop();

    /// False once stopped or after end of input
    bool running() const { return running_.load(); }

private:
    void read_loop();
    void deliver(const std::string& line);

    int fd_;
    int poll_interval_ms_;
    LineHandler handler_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> running_;
    std::thread thread_;
};

} // namespace luna_voice
