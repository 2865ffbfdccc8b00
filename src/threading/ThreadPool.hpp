#pragma once

// ============================================================================
// ThreadPool — fixed set of workers draining one FIFO task queue
// ============================================================================
//
// Used by every parallel stage: staging row shards, loading partitions,
// reading snapshot files.
//
//   ThreadPool pool(4);
//   auto f = pool.submit([] { return load_partition(); });
//   f.get();          // rethrows whatever the task threw
//
// A task's exception is captured in its future; it never kills a worker.
// The destructor drains the queue before joining.
// ============================================================================

#include <algorithm>
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

namespace BulkBridge
{

    class ThreadPool
    {
    public:
        explicit ThreadPool(size_t num_threads)
        {
            num_threads = std::max<size_t>(1, num_threads);
            workers_.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
                workers_.emplace_back(&ThreadPool::worker_loop, this);
        }

        ~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                shutdown_ = true;
            }
            task_cv_.notify_all();

            for (auto &worker : workers_)
            {
                if (worker.joinable())
                    worker.join();
            }
        }

        template <typename F, typename... Args>
        auto submit(F &&f, Args &&...args)
            -> std::future<std::invoke_result_t<F, Args...>>
        {
            using ReturnType = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<ReturnType()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...));
            std::future<ReturnType> future = task->get_future();

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (shutdown_)
                    throw std::runtime_error("[THREADPOOL] submit() on a pool that is shutting down");

                task_queue_.push([task]()
                                 { (*task)(); });
            }
            task_cv_.notify_one();

            return future;
        }

        size_t thread_count() const { return workers_.size(); }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;
        ThreadPool(ThreadPool &&) = delete;
        ThreadPool &operator=(ThreadPool &&) = delete;

    private:
        void worker_loop()
        {
            while (true)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    task_cv_.wait(lock, [this]
                                  { return shutdown_ || !task_queue_.empty(); });

                    if (shutdown_ && task_queue_.empty())
                        return;

                    task = std::move(task_queue_.front());
                    task_queue_.pop();
                }

                // packaged_task stores any exception in the future
                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> task_queue_;
        std::mutex queue_mutex_;
        std::condition_variable task_cv_;
        bool shutdown_ = false;
    };

    // Waits for every future, then rethrows the first stored exception.
    // No future is abandoned while another one is still running.
    template <typename T>
    std::vector<T> join_all(std::vector<std::future<T>> &futures)
    {
        for (auto &f : futures)
            f.wait();

        std::vector<T> results;
        results.reserve(futures.size());
        for (auto &f : futures)
            results.push_back(f.get());
        return results;
    }

    inline void join_all(std::vector<std::future<void>> &futures)
    {
        for (auto &f : futures)
            f.wait();
        for (auto &f : futures)
            f.get();
    }

} // namespace BulkBridge
