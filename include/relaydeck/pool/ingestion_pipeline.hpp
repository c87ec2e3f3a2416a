#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/config.hpp"
#include "relaydeck/pool/dedup_cache.hpp"
#include "relaydeck/pool/event_stream.hpp"
#include "relaydeck/pool/pool_types.hpp"
#include "relaydeck/pool/store_writer.hpp"
#include "relaydeck/pool/subscription_router.hpp"
#include "relaydeck/store/event_store.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief Deduplicates validated events, persists them, and forwards them to subscribers.
 * @remark The pipeline is not thread-safe.  The pool only calls it from its ingress thread.
 */
class IngestionPipeline
{
public:
    /**
     * @param store The local store.  May be null, in which case events are neither persisted
     * nor backfilled.
     * @param notify Receives store health events.  It is called from the store writer's thread.
     */
    IngestionPipeline(
        std::shared_ptr<IEventForwarder> forwarder,
        std::shared_ptr<store::IEventStore> store,
        const PoolConfig& config,
        std::function<void(const PoolEvent&)> notify);

    void start();

    void stop();

    /**
     * @brief Takes in an event admitted by the router.
     * @returns False if the event was already seen.  A seen event is not stored again, and only
     * reaches subscriptions that have not received it yet.
     */
    bool accept(std::shared_ptr<const data::Event> event, const std::string& sourceRelay);

    /**
     * @brief Delivers stored events matching any of the filters to a new subscription's stream.
     * @returns The events delivered, each once.
     * @remark Each delivered event is marked seen, so later copies from relays are not stored again.
     */
    std::vector<std::shared_ptr<const data::Event>> backfill(
        const std::vector<data::Filter>& filters,
        EventStream& stream);

    bool hasSeen(const std::string& eventId) const;

    std::shared_ptr<StoreWriter> storeWriter() const { return this->_storeWriter; };

private:
    std::shared_ptr<IEventForwarder> _forwarder;
    std::shared_ptr<store::IEventStore> _store;
    std::shared_ptr<StoreWriter> _storeWriter;
    DedupCache _dedupCache;
};
} // namespace pool
} // namespace relaydeck
