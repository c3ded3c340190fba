#include "task_executor.h"

#include <exception>

#include <glog/logging.h>

namespace Sluice {

TaskExecutor::TaskExecutor(size_t num_threads, size_t queue_capacity, std::string name)
    : name_(std::move(name)),
      tasks_(queue_capacity == 0 ? 1 : queue_capacity) {
    if (num_threads == 0) {
        LOG(WARNING) << "TaskExecutor " << name_ << ": 0 threads requested, using 1";
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&TaskExecutor::WorkerThread, this);
    }
    VLOG(1) << "TaskExecutor " << name_ << " started with " << num_threads << " workers";
}

TaskExecutor::~TaskExecutor() {
    Stop();
}

void TaskExecutor::Stop() {
    bool expected = false;
    if (!stop_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    // One empty task per worker; each worker exits on the first one it reads,
    // after everything queued ahead of it has run.
    for (size_t i = 0; i < workers_.size(); ++i) {
        tasks_.blockingWrite(std::function<void()>());
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    VLOG(1) << "TaskExecutor " << name_ << " stopped";
}

void TaskExecutor::WorkerThread() {
    while (true) {
        std::function<void()> task;
        tasks_.blockingRead(task);
        if (!task) {
            return;
        }

        try {
            task();
        } catch (const std::exception& e) {
            // packaged_task stores exceptions in the future; this only sees
            // failures of the wrapper itself.
            LOG(ERROR) << "TaskExecutor " << name_ << ": task threw: " << e.what();
        }
        pending_.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace Sluice
