#include "utils/worker_pool.h"

namespace plugsec {
namespace utils {

WorkerPool::WorkerPool(size_t numThreads)
    : shutdown_(false)
{
    if (numThreads == 0) {
        throw std::invalid_argument("Worker pool must have at least one thread");
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&WorkerPool::workerThread, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
    wait();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    notEmpty_.notify_all();
}

void WorkerPool::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

size_t WorkerPool::getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::optional<WorkerPool::Task> WorkerPool::nextTask() {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait(lock, [this]() { return shutdown_ || !tasks_.empty(); });

    if (tasks_.empty()) {
        // Shut down and drained
        return std::nullopt;
    }

    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    return task;
}

void WorkerPool::workerThread() {
    while (auto task = nextTask()) {
        // packaged_task stores any exception in the shared state
        (*task)();
    }
}

} // namespace utils
} // namespace plugsec
