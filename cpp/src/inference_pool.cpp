#include "inference_pool.hpp"

#include <algorithm>

#include "errors.hpp"

namespace CropDoctor {

using namespace std::chrono_literals;

InferencePool::InferencePool(ClassifierAdapter& adapter, int workers, size_t queue_capacity)
    : adapter_(adapter), queue_(std::max<size_t>(1, queue_capacity)) {
    const int count = std::max(1, workers);
    workers_.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back(&InferencePool::workerLoop, this);
    }
}

InferencePool::~InferencePool() {
    shutdown();
}

void InferencePool::shutdown() {
    if (!running_.exchange(false)) return;
    queue_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void InferencePool::workerLoop() {
    std::shared_ptr<Job> job;
    while (queue_.pop(job)) {
        if (job->abandoned.load()) {
            job->result.set_exception(std::make_exception_ptr(CancelledError("Request abandoned before inference")));
            job.reset();
            continue;
        }
        try {
            job->result.set_value(adapter_.classify(job->tensor));
        } catch (...) {
            // Handed to the waiting request thread, which rethrows it.
            job->result.set_exception(std::current_exception());
        }
        job.reset();
    }
}

std::vector<float> InferencePool::run(Tensor tensor, Clock::time_point deadline,
                                      const CancellationToken* token) {
    if (!running_.load()) {
        throw ClassifierError("Inference pool is shut down");
    }

    auto job = std::make_shared<Job>();
    job->tensor = std::move(tensor);
    std::future<std::vector<float>> result = job->result.get_future();

    if (!queue_.push_until(job, deadline)) {
        if (!running_.load()) {
            throw ClassifierError("Inference pool is shut down");
        }
        throw TimeoutError("Timed out waiting for a free inference worker");
    }

    // Poll in short slices so a cancellation is noticed while the job waits in the queue.
    while (true) {
        if (token && token->isCancelled()) {
            job->abandoned.store(true);
            throw CancelledError("Request cancelled while waiting for inference");
        }
        auto slice = std::min(deadline, Clock::now() + 50ms);
        if (result.wait_until(slice) == std::future_status::ready) {
            return result.get();
        }
        if (Clock::now() >= deadline) {
            job->abandoned.store(true);
            throw TimeoutError("Inference did not finish before the request deadline");
        }
    }
}

} // namespace CropDoctor
