#pragma once

#include <functional>
#include <memory>

namespace luna_voice {

using Job = std::function<void()>;

/**
 * @brief Runs blocking provider work off the event loop thread
 *
 * Jobs must not touch session state; they hand their result back by
 * posting to the EventLoop.
 */
class Executor {
public:
    virtual ~Executor() = default;
    virtual void submit(Job job) = 0;
    virtual void shutdown() = 0;
};

/**
 * @brief Fixed pool of worker threads draining a FIFO job queue
 */
class ThreadExecutor : public Executor {
public:
    explicit ThreadExecutor(size_t workers = 2);
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void submit(Job job) override;

    /// Drains queued jobs and joins the workers
    void shutdown() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Runs each job immediately on the submitting thread (tests)
 */
class InlineExecutor : public Executor {
public:
    void submit(Job job) override;
    void shutdown() override {}
};

} // namespace luna_voice
