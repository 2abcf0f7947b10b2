#include "event_loop.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <exception>

namespace luna_voice {

class EventLoop::Impl {
public:
    explicit Impl(Clock& clock) : clock_(clock), next_timer_id_(1), running_(false), stop_requested_(false) {}

    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    TimerId post_delayed(Duration delay, Task task) {
        TimerId id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_timer_id_++;
            TimerKey key{clock_.now() + delay, id};
            timers_.emplace(key, std::move(task));
            timer_index_.emplace(id, key);
        }
        cv_.notify_one();
        return id;
    }

    bool cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timer_index_.find(id);
        if (it == timer_index_.end()) {
            return false;
        }
        timers_.erase(it->second);
        timer_index_.erase(it);
        return true;
    }

    void run() {
        running_ = true;
        stop_requested_ = false;
        while (!stop_requested_) {
            run_pending();

            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_requested_) break;
            if (!tasks_.empty()) continue;

            // Sleep until the next timer is due; capped so a ManualClock
            // advanced from another thread is still noticed.
            Duration wait = Duration(50);
            if (!timers_.empty()) {
                auto until_due = std::chrono::duration_cast<Duration>(
                    timers_.begin()->first.due - clock_.now());
                if (until_due < wait) wait = until_due;
            }
            if (wait.count() > 0) {
                cv_.wait_for(lock, wait, [this] {
                    return stop_requested_.load() || !tasks_.empty();
                });
            }
        }
        running_ = false;
    }

    size_t run_pending() {
        size_t executed = 0;
        while (true) {
            std::deque<Task> batch;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                batch.swap(tasks_);
                TimePoint now = clock_.now();
                while (!timers_.empty() && timers_.begin()->first.due <= now) {
                    auto it = timers_.begin();
                    timer_index_.erase(it->first.id);
                    batch.push_back(std::move(it->second));
                    timers_.erase(it);
                }
            }
            if (batch.empty()) {
                break;
            }
            for (auto& task : batch) {
                execute(task);
                executed++;
            }
        }
        return executed;
    }

    void stop() {
        stop_requested_ = true;
        cv_.notify_all();
    }

    bool is_running() const {
        return running_;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size() + timers_.size();
    }

private:
    struct TimerKey {
        TimePoint due;
        TimerId id;
        bool operator<(const TimerKey& other) const {
            if (due != other.due) return due < other.due;
            return id < other.id;
        }
    };

    void execute(Task& task) {
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("[EventLoop] task threw: ") + e.what());
        }
    }

    Clock& clock_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimerKey> timer_index_;
    TimerId next_timer_id_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
};

EventLoop::EventLoop(Clock& clock) : clock_(clock), pimpl_(std::make_unique<Impl>(clock)) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    pimpl_->post(std::move(task));
}

TimerId EventLoop::post_delayed(Duration delay, Task task) {
    return pimpl_->post_delayed(delay, std::move(task));
}

bool EventLoop::cancel(TimerId id) {
    return pimpl_->cancel(id);
}

void EventLoop::run() {
    pimpl_->run();
}

size_t EventLoop::run_pending() {
    return pimpl_->run_pending();
}

void EventLoop::stop() {
    pimpl_->stop();
}

bool EventLoop::is_running() const {
    return pimpl_->is_running();
}

size_t EventLoop::pending() const {
    return pimpl_->pending();
}

} // namespace luna_voice
