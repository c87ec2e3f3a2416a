#include <stdexcept>
#include <unordered_set>

#include "relaydeck/pool/ingestion_pipeline.hpp"

using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace relaydeck::store;
using namespace std;

IngestionPipeline::IngestionPipeline(
    shared_ptr<IEventForwarder> forwarder,
    shared_ptr<IEventStore> store,
    const PoolConfig& config,
    function<void(const PoolEvent&)> notify)
: _forwarder(forwarder), _store(store), _dedupCache(config.dedupCapacity)
{
    if (this->_forwarder == nullptr)
    {
        throw invalid_argument("IngestionPipeline: An event forwarder is required.");
    }

    if (this->_store != nullptr)
    {
        this->_storeWriter = make_shared<StoreWriter>(store, config.storeQueueDepth, config.storeRetries, notify);
    }
};

void IngestionPipeline::start()
{
    if (this->_storeWriter != nullptr)
    {
        this->_storeWriter->start();
    }
};

void IngestionPipeline::stop()
{
    if (this->_storeWriter != nullptr)
    {
        this->_storeWriter->stop();
    }
};

bool IngestionPipeline::accept(shared_ptr<const Event> event, const string& sourceRelay)
{
    if (!this->_dedupCache.markSeen(event->id))
    {
        // Subscriptions opened after the first copy arrived may still be waiting for it.
        size_t delivered = this->_forwarder->forward(event, sourceRelay);
        if (delivered > 0)
        {
            PLOG_VERBOSE << "Forwarded seen event " << event->id << " from " << sourceRelay << " to " << delivered
                         << " newer subscriptions.";
        }
        return false;
    }

    // A full store queue still lets the event through to subscribers.
    if (this->_storeWriter != nullptr)
    {
        this->_storeWriter->enqueue(event);
    }

    size_t delivered = this->_forwarder->forward(event, sourceRelay);
    PLOG_VERBOSE << "Ingested event " << event->id << " from " << sourceRelay << " for " << delivered << " subscriptions.";
    return true;
};

vector<shared_ptr<const Event>> IngestionPipeline::backfill(const vector<Filter>& filters, EventStream& stream)
{
    vector<shared_ptr<const Event>> backfilled;
    if (this->_store == nullptr)
    {
        return backfilled;
    }

    unordered_set<string> delivered;
    for (const Filter& filter : filters)
    {
        try
        {
            auto cursor = this->_store->query(filter);
            shared_ptr<const Event> event;
            while (cursor->next(event))
            {
                this->_dedupCache.markSeen(event->id);
                if (delivered.insert(event->id).second)
                {
                    stream.pushEvent(event, "");
                    backfilled.push_back(event);
                }
            }
        }
        catch (const StoreError& se)
        {
            PLOG_ERROR << "Failed to backfill from the local store: " << se.what();
        }
    }

    PLOG_VERBOSE << "Backfilled " << backfilled.size() << " stored events.";
    return backfilled;
};

bool IngestionPipeline::hasSeen(const string& eventId) const
{
    return this->_dedupCache.contains(eventId);
};
