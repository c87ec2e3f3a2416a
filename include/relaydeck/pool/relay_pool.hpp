#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <plog/Log.h>

#include "relaydeck/client/web_socket_client.hpp"
#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/concurrency/blocking_queue.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/actor_table.hpp"
#include "relaydeck/pool/config.hpp"
#include "relaydeck/pool/connection_actor.hpp"
#include "relaydeck/pool/event_stream.hpp"
#include "relaydeck/pool/ingestion_pipeline.hpp"
#include "relaydeck/pool/pool_types.hpp"
#include "relaydeck/pool/publish_tracker.hpp"
#include "relaydeck/pool/subscription_router.hpp"
#include "relaydeck/signer/signer.hpp"
#include "relaydeck/store/event_store.hpp"
#include "relaydeck/validation/event_validator.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief Maintains connections to a set of Nostr relays and multiplexes subscriptions across them.
 * @remark Events received from relays are validated on each relay's connection thread, then
 * routed, deduplicated, persisted, and delivered to subscribers on the pool's single ingress
 * thread, in the order they arrived.
 * @remark `publishEvent`, `queryRelays`, and `closeSubscription` block the calling thread.  They
 * must not be called from a pool event handler.
 * @remark A new subscription is backfilled from the local store on the ingress thread, so relay
 * traffic waits while the store answers the subscription's filters.  Stores behind slow media
 * should keep their queries short.
 */
class RelayPool : private IConnectionObserver
{
public:
    /**
     * @param verifier Checks the signatures of incoming events.
     * @param store The local event store.  May be null.
     * @param signer Signs unsigned events before publishing, and answers authentication
     * challenges.  May be null.
     */
    RelayPool(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::shared_ptr<signer::ISignatureVerifier> verifier,
        std::shared_ptr<store::IEventStore> store,
        std::shared_ptr<signer::ISigner> signer,
        PoolConfig config);

    /**
     * @param validator Validates incoming events in place of the default validator.
     * @param policy Chooses the relays that serve each subscription.
     */
    RelayPool(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::shared_ptr<validation::IEventValidator> validator,
        std::shared_ptr<store::IEventStore> store,
        std::shared_ptr<signer::ISigner> signer,
        PoolConfig config,
        std::shared_ptr<IRelaySelectionPolicy> policy);

    ~RelayPool();

    const PoolConfig& config() const { return this->_config; };

    /**
     * @brief Adds a relay to the pool and begins connecting to it.
     * @returns False if the URL is not a `ws://` or `wss://` URL, or the relay is already in the
     * pool.
     */
    bool addRelay(const std::string& url);

    /**
     * @brief Disconnects from a relay and removes it from the pool.
     * @returns False if the relay is not in the pool.
     * @remark Subscriptions served by the relay receive a `RelayClosed` notice.
     */
    bool removeRelay(const std::string& url);

    /**
     * @brief Adds the configured default relays to the pool.
     * @returns The relays that were added.
     */
    std::vector<std::string> openRelayConnections();

    /**
     * @brief Removes every relay from the pool.
     */
    void closeRelayConnections();

    /**
     * @brief Revives a relay that gave up connecting.
     * @returns False if the relay is not in the pool.
     */
    bool reconnectRelay(const std::string& url);

    std::vector<std::string> relays() const;

    std::vector<std::string> connectedRelays() const;

    /**
     * @brief Gets the connection state of a relay in the pool.
     * @throws `std::invalid_argument` if the relay is not in the pool.
     */
    RelayState relayState(const std::string& url) const;

    /**
     * @brief Opens a subscription on the pool's relays.
     * @returns The subscription ID, and the stream the subscription's items are delivered to.
     * Events from the local store are delivered first.
     * @throws `std::invalid_argument` if no filters are given.
     * @remark Relays that connect later are sent the subscription as well.
     */
    std::tuple<std::string, std::shared_ptr<EventStream>> openSubscription(const std::vector<data::Filter>& filters);

    /**
     * @brief Closes a subscription on every relay serving it.
     * @returns False if the subscription does not exist.
     */
    bool closeSubscription(const std::string& subscriptionId);

    /**
     * @brief Publishes an event to every connected relay.
     * @returns One result for each relay in the pool.
     * @remark Unsigned events are signed first if the pool has a signer.  Relay failures are
     * reported in the results and are never thrown.
     * @throws `std::invalid_argument` if the event is unsigned and cannot be signed, or is
     * malformed.
     */
    std::vector<RelayPublishResult> publishEvent(std::shared_ptr<data::Event> event);

    /**
     * @brief Queries the pool's relays and waits for the stored events they return.
     * @returns Every matching event received before the relays caught up or the timeout passed.
     * @throws `std::invalid_argument` if no filters are given.
     */
    std::vector<std::shared_ptr<const data::Event>> queryRelays(
        const std::vector<data::Filter>& filters,
        std::chrono::milliseconds timeout);

    /**
     * @brief Queries the local store without contacting any relay.
     * @returns An empty list if the pool has no store.
     */
    std::vector<std::shared_ptr<const data::Event>> queryLocal(const data::Filter& filter) const;

    /**
     * @brief Sets the handler that receives pool events.
     * @remark The handler runs on the pool's internal threads.
     */
    void setEventHandler(std::function<void(const PoolEvent&)> handler);

private:
    enum class IngressType
    {
        RelayMessage,
        RelayStateChanged,
        Overflow,
        Subscribe,
        Unsubscribe,
        RelayRemoved,
        Stop
    };

    struct IngressCommand
    {
        IngressType type = IngressType::Stop;
        std::string relay;
        codec::RelayMessage message;
        RelayState state = RelayState::Disconnected;
        std::string reason;
        std::string subscriptionId;
        std::vector<data::Filter> filters;
        std::shared_ptr<EventStream> stream;
        std::shared_ptr<std::promise<bool>> done;
    };

    PoolConfig _config;
    std::shared_ptr<client::IWebSocketClient> _client;
    std::shared_ptr<validation::IEventValidator> _validator;
    std::shared_ptr<store::IEventStore> _store;
    std::shared_ptr<signer::ISigner> _signer;

    std::shared_ptr<ActorTable> _actors;
    std::shared_ptr<SubscriptionRouter> _router;
    std::unique_ptr<IngestionPipeline> _pipeline;
    PublishTracker _publishTracker;

    concurrency::BlockingQueue<IngressCommand> _ingress;
    std::thread _ingressThread;

    std::function<void(const PoolEvent&)> _eventHandler;
    std::mutex _handlerMutex;

    void onStateChanged(const std::string& relay, RelayState state, const std::string& reason) override;

    void onMessage(const std::string& relay, codec::RelayMessage message) override;

    void onOverflow(const std::string& relay, const std::string& droppedFrame) override;

    void _runIngress();

    void _handleRelayMessage(const std::string& relay, const codec::RelayMessage& message);

    /**
     * @brief Raises each filter's `since` to the newest backfilled event's `created_at`.
     */
    static std::vector<data::Filter> _sinceOptimized(
        const std::vector<data::Filter>& filters,
        const std::vector<std::shared_ptr<const data::Event>>& backfilled);

    void _handleRelayState(const std::string& relay, RelayState state, const std::string& reason);

    void _raise(const PoolEvent& event);

    static bool _isValidRelayUrl(const std::string& url);
};
} // namespace pool
} // namespace relaydeck
