#include <stdexcept>

#include "relaydeck/pool/store_writer.hpp"

using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace relaydeck::store;
using namespace std;

StoreWriter::StoreWriter(
    shared_ptr<IEventStore> store,
    size_t queueDepth,
    unsigned int retries,
    function<void(const PoolEvent&)> notify)
: _store(store), _retries(retries), _notify(notify), _queue(queueDepth), _isRunning(false), _written(0), _abandoned(0)
{
    if (this->_store == nullptr)
    {
        throw invalid_argument("StoreWriter: A store is required.");
    }
};

StoreWriter::~StoreWriter()
{
    this->stop();
};

void StoreWriter::start()
{
    if (this->_isRunning.exchange(true))
    {
        return;
    }

    this->_thread = thread([this]() { this->_run(); });
};

void StoreWriter::stop()
{
    if (!this->_isRunning.exchange(false))
    {
        return;
    }

    this->_queue.close();
    if (this->_thread.joinable())
    {
        this->_thread.join();
    }
};

bool StoreWriter::enqueue(shared_ptr<const Event> event)
{
    if (this->_queue.tryPush(event))
    {
        return true;
    }

    PLOG_WARNING << "Store queue is full; event " << event->id << " will not be persisted.";
    if (this->_notify)
    {
        PoolEvent backpressure;
        backpressure.type = PoolEventType::StoreBackpressure;
        backpressure.eventId = event->id;
        backpressure.message = "store queue is full";
        this->_notify(backpressure);
    }
    return false;
};

void StoreWriter::_run()
{
    shared_ptr<const Event> event;
    while (this->_queue.pop(event))
    {
        this->_write(*event);
    }
};

void StoreWriter::_write(const Event& event)
{
    string lastError;
    for (unsigned int attempt = 0; attempt <= this->_retries; attempt++)
    {
        try
        {
            this->_store->put(event);
            this->_written++;
            return;
        }
        catch (const StoreError& se)
        {
            lastError = se.what();
            PLOG_WARNING << "Failed to store event " << event.id << " (attempt " << attempt + 1 << "): " << lastError;
        }
        catch (const exception& e)
        {
            lastError = e.what();
            PLOG_ERROR << "Store threw unexpectedly for event " << event.id << " (attempt " << attempt + 1 << "): "
                       << lastError;
        }
    }

    this->_abandoned++;
    PLOG_ERROR << "Gave up storing event " << event.id << " after " << this->_retries + 1 << " attempts.";
    if (this->_notify)
    {
        PoolEvent degraded;
        degraded.type = PoolEventType::IngestionDegraded;
        degraded.eventId = event.id;
        degraded.message = lastError;
        this->_notify(degraded);
    }
};
