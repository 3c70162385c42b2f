#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

/// @brief Queue shared between producer thread (upstream reader) and consumer (http writer).
template <typename taStoredType, typename taQueueType = std::queue<taStoredType>>
class SafeQueue
{
  public:
    using size_type = typename taQueueType::size_type;
    using value_type = taStoredType;
    using queue_type = taQueueType;

    /// @brief Pushes new element to the underlaying queue and wakes up one waiting consumer.
    void push(taStoredType item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            dataQueue.push(std::move(item));
        }
        conditional_queue.notify_one();
    }

    /// @brief Pops element from the queue without waiting.
    /// @returns std::nullopt if queue is empty, value otherwise.
    [[nodiscard]]
    std::optional<taStoredType> pop()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return PopLocked();
    }

    /// @brief Pops element from the queue, waits up to @p timeout for it to appear.
    /// @returns std::nullopt if nothing was pushed during timeout or wake() was called.
    template <typename taRep, typename taPeriod>
    [[nodiscard]]
    std::optional<taStoredType> wait_pop(const std::chrono::duration<taRep, taPeriod> &timeout)
    {
        std::unique_lock<std::mutex> lock(mutex);
        conditional_queue.wait_for(lock, timeout, [this]() {
            return !dataQueue.empty() || woken;
        });
        woken = false;
        return PopLocked();
    }

    /// @brief Releases consumer blocked in wait_pop() even if nothing was pushed.
    void wake()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            woken = true;
        }
        conditional_queue.notify_all();
    }

    /// @brief Checks if queue is empty.
    [[nodiscard]]
    bool empty()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return dataQueue.empty();
    }

    [[nodiscard]]
    size_type size()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return dataQueue.size();
    }

  private:
    std::optional<taStoredType> PopLocked()
    {
        if (dataQueue.empty())
        {
            return std::nullopt;
        }
        auto item = std::move(dataQueue.front());
        dataQueue.pop();
        return item;
    }

    taQueueType dataQueue;
    std::mutex mutex;
    std::condition_variable conditional_queue;
    bool woken{false};
};
