/**
 * Fixed-size worker pool for concurrent quote fetches
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace pricewatch {
namespace common {

/**
 * At most size() tasks run at once; the rest wait in a FIFO queue.
 * Tasks must not block on other tasks of the same pool.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stopping_) {
                throw std::runtime_error("submit on stopped WorkerPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    size_t size() const { return workers_.size(); }

    // Stop accepting work, finish queued tasks and join
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

} // namespace common
} // namespace pricewatch
