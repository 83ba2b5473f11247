#ifndef IFREADER_COMMON_THREAD_POOL_H
#define IFREADER_COMMON_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace ifreader {

/**
 * Result handle of a task forked onto a ThreadPool.
 *
 * The task runs exactly once, either on a worker or on the thread calling
 * join() if no worker has claimed it yet. A join never blocks on a task that
 * is still sitting in the queue, so fork/join recursion deeper than the
 * number of workers cannot deadlock.
 */
template <typename R>
class ForkedTask {
   public:
    explicit ForkedTask(std::function<R()> func)
        : func_(std::move(func)), future_(promise_.get_future()) {}

    ForkedTask(const ForkedTask &) = delete;
    ForkedTask &operator=(const ForkedTask &) = delete;

    /**
     * Run the task if nobody has claimed it yet
     * @return true if this call executed the task
     */
    bool run() {
        if (claimed_.exchange(true)) {
            return false;
        }
        try {
            promise_.set_value(func_());
        } catch (...) {
            promise_.set_exception(std::current_exception());
        }
        return true;
    }

    /**
     * Wait for the result, running the task inline if it has not started.
     * Rethrows any exception raised by the task.
     */
    R join() {
        run();
        return future_.get();
    }

    bool is_claimed() const { return claimed_.load(); }

   private:
    std::function<R()> func_;
    std::promise<R> promise_;
    std::future<R> future_;
    std::atomic<bool> claimed_{false};
};

class ThreadPool {
   public:
    /**
     * Start a pool of worker threads
     * @param num_threads Number of workers; 0 selects the hardware
     *                    concurrency (2 if unknown)
     */
    explicit ThreadPool(std::size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /**
     * Process-wide pool, created on first use and kept for the lifetime of
     * the process
     */
    static ThreadPool &shared();

    /**
     * Queue a job for execution on a worker
     * @throws std::runtime_error if the pool is shutting down
     */
    void submit(std::function<void()> job);

    /**
     * Fork a task onto the pool; call join() on the returned handle to
     * obtain its result
     */
    template <typename F>
    auto fork(F &&func)
        -> std::shared_ptr<ForkedTask<std::invoke_result_t<std::decay_t<F>>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<ForkedTask<R>>(
            std::function<R()>(std::forward<F>(func)));
        submit([task]() { task->run(); });
        return task;
    }

    std::size_t size() const { return workers_.size(); }

   private:
    void worker_thread(std::size_t thread_id);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool should_terminate_;
};

}  // namespace ifreader

#endif  // IFREADER_COMMON_THREAD_POOL_H
