#ifndef PLUGSEC_WORKER_POOL_H
#define PLUGSEC_WORKER_POOL_H

#include <vector>
#include <deque>
#include <thread>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace plugsec {
namespace utils {

/**
 * @brief Fixed-size pool of worker threads running sandboxed operations
 *
 * Features:
 * - Future-based result retrieval
 * - Exception propagation through futures
 * - Graceful shutdown with pending task completion
 *
 * A task that is abandoned by its caller (for example after a timeout)
 * keeps its worker busy until it returns. Long-running tasks should
 * poll a cancellation token.
 *
 * Example Usage:
 * @code
 * WorkerPool pool(4);
 * auto future = pool.submit([]() { return 42; });
 * int result = future.get();
 * @endcode
 */
class WorkerPool {
public:
    /**
     * @brief Construct a pool with the given number of threads
     * @throws std::invalid_argument if numThreads is 0
     */
    explicit WorkerPool(size_t numThreads);

    /**
     * @brief Destructor - calls shutdown() and joins all workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Submit a callable for execution
     * @return Future for the callable's result
     * @throws std::runtime_error if the pool is shut down
     */
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using ReturnType = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                throw std::runtime_error("Cannot submit task: worker pool is shut down");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        notEmpty_.notify_one();

        return result;
    }

    /**
     * @brief Stop accepting tasks; queued tasks still run
     */
    void shutdown();

    /**
     * @brief Join all worker threads. Call after shutdown().
     */
    void wait();

    bool isShutdown() const;

    size_t getThreadCount() const {
        return workers_.size();
    }

    size_t getPendingTaskCount() const;

private:
    using Task = std::function<void()>;

    void workerThread();
    std::optional<Task> nextTask();

    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    bool shutdown_;
};

} // namespace utils
} // namespace plugsec

#endif // PLUGSEC_WORKER_POOL_H
