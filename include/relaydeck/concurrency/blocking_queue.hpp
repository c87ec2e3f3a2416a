#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace relaydeck
{
namespace concurrency
{
/**
 * @brief A FIFO queue that lets consumer threads wait for items.
 * @remark An optional capacity bounds the queue.  Once closed, the queue accepts no new items,
 * but the items already queued may still be drained.
 */
template <typename T>
class BlockingQueue
{
public:
    /**
     * @param capacity The most items the queue holds at once.  `0` means unbounded.
     */
    explicit BlockingQueue(size_t capacity = 0) : _capacity(capacity) { };

    /**
     * @brief Appends an item to the queue.
     * @returns False if the queue is full or closed, true otherwise.
     */
    bool tryPush(T item)
    {
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            if (this->_isClosed || (this->_capacity > 0 && this->_items.size() >= this->_capacity))
            {
                return false;
            }
            this->_items.push_back(std::move(item));
        }
        this->_available.notify_one();
        return true;
    };

    /**
     * @brief Waits up to the given timeout for an item.
     * @returns True if an item was popped into `item`, false on timeout or if the queue is closed
     * and empty.
     */
    template <typename Rep, typename Period>
    bool popFor(T& item, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(this->_mutex);
        bool isReady = this->_available.wait_for(lock, timeout, [this]()
        {
            return !this->_items.empty() || this->_isClosed;
        });

        if (!isReady || this->_items.empty())
        {
            return false;
        }

        item = std::move(this->_items.front());
        this->_items.pop_front();
        return true;
    };

    /**
     * @brief Waits until an item is available or the queue is closed.
     * @returns True if an item was popped into `item`, false if the queue is closed and empty.
     */
    bool pop(T& item)
    {
        std::unique_lock<std::mutex> lock(this->_mutex);
        this->_available.wait(lock, [this]() { return !this->_items.empty() || this->_isClosed; });

        if (this->_items.empty())
        {
            return false;
        }

        item = std::move(this->_items.front());
        this->_items.pop_front();
        return true;
    };

    /**
     * @brief Pops an item without waiting.
     */
    bool tryPop(T& item)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        if (this->_items.empty())
        {
            return false;
        }

        item = std::move(this->_items.front());
        this->_items.pop_front();
        return true;
    };

    /**
     * @brief Stops the queue from accepting items and wakes every waiting consumer.
     */
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            this->_isClosed = true;
        }
        this->_available.notify_all();
    };

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_isClosed;
    };

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_items.size();
    };

private:
    size_t _capacity;
    bool _isClosed = false;
    std::deque<T> _items;
    mutable std::mutex _mutex;
    std::condition_variable _available;
};
} // namespace concurrency
} // namespace relaydeck
