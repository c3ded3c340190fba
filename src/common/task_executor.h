#ifndef SLUICE_TASK_EXECUTOR_H_
#define SLUICE_TASK_EXECUTOR_H_

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "folly/MPMCQueue.h"

namespace Sluice {

/**
 * Fixed worker pool that keeps CPU-bound engine execution and instance
 * construction off the callers' threads.
 *
 * Tasks go through a bounded lock-free MPMC queue; Submit blocks only when
 * the queue is full. Stop() drains already queued tasks before joining.
 */
class TaskExecutor {
public:
    /**
     * @param num_threads Worker count (at least 1)
     * @param queue_capacity Bound of the pending task queue
     */
    explicit TaskExecutor(size_t num_threads = 4, size_t queue_capacity = 1024,
                          std::string name = "sluice-exec");
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * Queue |callback| for execution.
     * After Stop() the task is dropped and the returned future reports
     * std::future_errc::broken_promise.
     */
    template<typename Callback>
    auto Submit(Callback&& callback) -> std::future<std::invoke_result_t<std::decay_t<Callback>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<Callback>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::forward<Callback>(callback));
        auto future = task->get_future();

        if (stop_.load(std::memory_order_acquire)) {
            return future;
        }
        pending_.fetch_add(1, std::memory_order_relaxed);
        tasks_.blockingWrite(std::function<void()>([task]() { (*task)(); }));
        return future;
    }

    void Stop();

    bool IsRunning() const { return !stop_.load(std::memory_order_acquire); }
    size_t NumThreads() const { return workers_.size(); }
    size_t Pending() const { return pending_.load(std::memory_order_relaxed); }

private:
    void WorkerThread();

    std::string name_;
    folly::MPMCQueue<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> pending_{0};
};

} // namespace Sluice

#endif // SLUICE_TASK_EXECUTOR_H_
