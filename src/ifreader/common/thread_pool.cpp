#include <ifreader/common/logging.h>
#include <ifreader/common/thread_pool.h>

#include <stdexcept>

namespace ifreader {

ThreadPool::ThreadPool(std::size_t num_threads) : should_terminate_(false) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 2;
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_thread, this, i);
    }
    IFREADER_LOG_DEBUG("ThreadPool initialized with {} threads", num_threads);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_terminate_ = true;
    }
    cv_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    IFREADER_LOG_DEBUG("ThreadPool shutdown complete");
}

ThreadPool &ThreadPool::shared() {
    static ThreadPool pool;
    return pool;
}

void ThreadPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (should_terminate_) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void ThreadPool::worker_thread(std::size_t thread_id) {
    IFREADER_LOG_TRACE("Worker {} started", thread_id);
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock,
                     [this] { return should_terminate_ || !queue_.empty(); });
            // Drain remaining jobs before exiting
            if (queue_.empty()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop();
        }
        try {
            job();
        } catch (const std::exception &e) {
            IFREADER_LOG_ERROR("Worker {} job failed: {}", thread_id, e.what());
        }
    }
    IFREADER_LOG_TRACE("Worker {} exiting", thread_id);
}

}  // namespace ifreader
