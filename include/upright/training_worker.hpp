#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>

namespace upright {

/**
 * Single background thread running training jobs in FIFO order, so fits
 * never block the frame loop and never overlap each other.
 *
 * Usage:
 *   TrainingWorker worker;
 *   worker.enqueue([net, samples] { train(net, samples); });
 *   worker.wait();  // block until the queue drains (tests, shutdown)
 *
 * The destructor finishes queued jobs before joining.
 */
class TrainingWorker {
public:
    TrainingWorker()
        : stop_(false), active_(false) {
        thread_ = std::thread([this] {
            while (true) {
                std::function<void()> job;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !jobs_.empty();
                    });

                    if (stop_ && jobs_.empty()) return;

                    job = std::move(jobs_.front());
                    jobs_.pop();
                    active_ = true;
                }

                job();

                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    active_ = false;
                    idle_condition_.notify_all();
                }
            }
        });
    }

    ~TrainingWorker() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    TrainingWorker(const TrainingWorker&) = delete;
    TrainingWorker& operator=(const TrainingWorker&) = delete;

    // Jobs must not throw; wrap their body and report failures through their own result
    template<class F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped TrainingWorker");
            jobs_.emplace(std::forward<F>(f));
        }
        condition_.notify_one();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_condition_.wait(lock, [this] {
            return jobs_.empty() && !active_;
        });
    }

private:
    std::thread thread_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    bool stop_;
    bool active_;
};

} // namespace upright
