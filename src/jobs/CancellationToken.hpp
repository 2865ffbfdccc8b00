#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace BulkBridge
{

    /**
     * @brief Interrupts blocking job polls.
     * cancel() wakes every thread sleeping in wait_for(); it does not cancel
     * jobs already submitted to the warehouse.
     */
    class CancellationToken
    {
    public:
        void cancel()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled_.store(true, std::memory_order_release);
            }
            cv_.notify_all();
        }

        bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

        // Sleeps up to `timeout`. Returns true when woken by cancel().
        template <typename Rep, typename Period>
        bool wait_for(std::chrono::duration<Rep, Period> timeout) const
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [this]
                                { return is_cancelled(); });
        }

    private:
        std::atomic<bool> cancelled_{false};
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
    };

} // namespace BulkBridge
