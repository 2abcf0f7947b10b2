#pragma once

#include "common.h"
#include "clock.h"
#include <functional>
#include <memory>

namespace luna_voice {

using Task = std::function<void()>;
using TimerId = uint64_t;

/**
 * @brief Single-threaded cooperative event loop
 *
 * All session state is mutated from tasks running on this loop, so the
 * conversation state machine is never re-entered concurrently.
 *
 * Thread Safety:
 * - post(), post_delayed(), cancel() and stop() may be called from any thread
 * - Tasks always run on the thread that calls run() / run_pending()
 */
class EventLoop {
public:
    explicit EventLoop(Clock& clock);
    ~EventLoop();

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Queue a task to run on the loop thread as soon as possible
     */
    void post(Task task);

    /**
     * @brief Queue a task to run once `delay` has elapsed on the loop clock
     * @return Timer id usable with cancel()
     */
    TimerId post_delayed(Duration delay, Task task);

    /**
     * @brief Cancel a delayed task that has not run yet
     * @return True if the timer was still pending
     */
    bool cancel(TimerId id);

    /**
     * @brief Run tasks until stop() is called
     */
    void run();

    /**
     * @brief Run every task that is due now, including tasks they post
     * @return Number of tasks executed
     */
    size_t run_pending();

    /**
     * @brief Request run() to return after the current task
     */
    void stop();

    bool is_running() const;

    /// Number of queued immediate tasks plus pending timers
    size_t pending() const;

    Clock& clock() { return clock_; }

private:
    Clock& clock_;
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
