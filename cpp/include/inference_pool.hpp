#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "classifier_adapter.hpp"

namespace CropDoctor {

// Set by the caller (e.g. on client disconnect); the pipeline checks it between stages.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Thread-safe bounded queue. push blocks while full, pop blocks while empty.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t max_items) : max_items_(max_items) {}

    // False when the deadline passed or the queue was stopped before space freed up.
    template <typename Clock, typename Duration>
    bool push_until(const T& item, const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_full_.wait_until(lock, deadline, [&] { return queue_.size() < max_items_ || stopped_; })) {
            return false;
        }
        if (stopped_) return false;
        queue_.push(item);
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_empty_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (stopped_ && queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

private:
    size_t max_items_;
    std::queue<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

/**
 * Fixed set of worker threads that run classifier calls off the request
 * thread, so a slow inference only occupies one worker. run() waits for the
 * result until the request deadline; a job whose caller gave up (timeout or
 * cancellation) is skipped when a worker reaches it.
 */
class InferencePool {
public:
    using Clock = std::chrono::steady_clock;

    InferencePool(ClassifierAdapter& adapter, int workers, size_t queue_capacity);
    ~InferencePool();

    InferencePool(const InferencePool&) = delete;
    InferencePool& operator=(const InferencePool&) = delete;

    // Throws TimeoutError, CancelledError, or whatever the classifier raised.
    std::vector<float> run(Tensor tensor, Clock::time_point deadline,
                           const CancellationToken* token = nullptr);

    void shutdown();

    size_t workerCount() const { return workers_.size(); }

private:
    struct Job {
        Tensor tensor;
        std::promise<std::vector<float>> result;
        std::atomic<bool> abandoned{false};
    };

    void workerLoop();

    ClassifierAdapter& adapter_;
    BoundedQueue<std::shared_ptr<Job>> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{true};
};

} // namespace CropDoctor
