#include "executor.h"
#include "logger.h"
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace luna_voice {

namespace {

void run_job(Job& job) {
    try {
        job();
    } catch (const std::exception& e) {
        Logger::error(std::string("[Executor] job threw: ") + e.what());
    }
}

} // namespace

class ThreadExecutor::Impl {
public:
    explicit Impl(size_t workers) : shutdown_(false) {
        if (workers == 0) workers = 1;
        for (size_t i = 0; i < workers; i++) {
            threads_.emplace_back(&Impl::worker_loop, this);
        }
    }

    ~Impl() {
        shutdown();
    }

    void submit(Job job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                Logger::warn("[Executor] job submitted after shutdown, dropping");
                return;
            }
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ && threads_.empty()) return;
            shutdown_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

private:
    void worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });
                if (jobs_.empty()) break;  // shutdown and drained
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            run_job(job);
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    std::vector<std::thread> threads_;
    bool shutdown_;
};

ThreadExecutor::ThreadExecutor(size_t workers) : pimpl_(std::make_unique<Impl>(workers)) {}

ThreadExecutor::~ThreadExecutor() = default;

void ThreadExecutor::submit(Job job) {
    pimpl_->submit(std::move(job));
}

void ThreadExecutor::shutdown() {
    pimpl_->shutdown();
}

void InlineExecutor::submit(Job job) {
    run_job(job);
}

} // namespace luna_voice
