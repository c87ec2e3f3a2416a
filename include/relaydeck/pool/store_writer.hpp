#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include <plog/Log.h>

#include "relaydeck/concurrency/blocking_queue.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/pool_types.hpp"
#include "relaydeck/store/event_store.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief Persists ingested events to the local store on a thread of its own.
 * @remark When the queue is full, the event is not persisted and a `StoreBackpressure` pool
 * event is raised.  A write that still fails after the configured retries is abandoned with an
 * `IngestionDegraded` pool event.
 */
class StoreWriter
{
public:
    StoreWriter(
        std::shared_ptr<store::IEventStore> store,
        size_t queueDepth,
        unsigned int retries,
        std::function<void(const PoolEvent&)> notify);

    ~StoreWriter();

    void start();

    /**
     * @brief Writes the events still queued, then stops the writer thread.
     */
    void stop();

    /**
     * @brief Queues an event to be written.
     * @returns False if the queue is full or the writer is stopped.
     */
    bool enqueue(std::shared_ptr<const data::Event> event);

    size_t pending() const { return this->_queue.size(); };

    size_t written() const { return this->_written.load(); };

    size_t abandoned() const { return this->_abandoned.load(); };

private:
    std::shared_ptr<store::IEventStore> _store;
    unsigned int _retries;
    std::function<void(const PoolEvent&)> _notify;

    concurrency::BlockingQueue<std::shared_ptr<const data::Event>> _queue;
    std::thread _thread;
    std::atomic<bool> _isRunning;
    std::atomic<size_t> _written;
    std::atomic<size_t> _abandoned;

    void _run();

    void _write(const data::Event& event);
};
} // namespace pool
} // namespace relaydeck
