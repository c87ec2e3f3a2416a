#pragma once

#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <plog/Log.h>
#include <uuid_v4.h>

#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/dedup_cache.hpp"
#include "relaydeck/pool/event_stream.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief The router's view of the relays in a pool.
 */
class IRelayDirectory
{
public:
    virtual ~IRelayDirectory() = default;

    virtual std::vector<std::string> connectedRelays() const = 0;

    /**
     * @brief Asks the relay's connection to serve a subscription.
     */
    virtual void openSubscription(
        const std::string& relay,
        const std::string& subscriptionId,
        const std::vector<data::Filter>& filters) = 0;

    /**
     * @brief Asks the relay's connection to stop serving a subscription.
     * @param notifyRelay Whether the relay should be sent `CLOSE`.
     */
    virtual void closeSubscription(const std::string& relay, const std::string& subscriptionId, bool notifyRelay) = 0;
};

/**
 * @brief Chooses which relays serve a subscription.
 */
class IRelaySelectionPolicy
{
public:
    virtual ~IRelaySelectionPolicy() = default;

    /**
     * @param candidates Connected relays that do not yet serve the subscription.
     * @returns The candidates that should serve it.
     */
    virtual std::vector<std::string> select(
        const std::vector<std::string>& candidates,
        const std::vector<data::Filter>& filters) const = 0;
};

/**
 * @brief Sends every subscription to every connected relay.
 */
class AllRelaysPolicy : public IRelaySelectionPolicy
{
public:
    std::vector<std::string> select(
        const std::vector<std::string>& candidates,
        const std::vector<data::Filter>& filters) const override
    {
        return candidates;
    };
};

/**
 * @brief Delivers accepted events to the subscriptions that want them.
 */
class IEventForwarder
{
public:
    virtual ~IEventForwarder() = default;

    /**
     * @brief Delivers the event to every open subscription with a matching filter that has not
     * received it yet.
     * @returns The number of subscriptions that received the event.
     */
    virtual size_t forward(std::shared_ptr<const data::Event> event, const std::string& relay) = 0;
};

/**
 * @brief Tracks open subscriptions and the relays serving each of them.
 * @remark The router decides which relay messages concern a live subscription, and tells each
 * consumer when its subscription has caught up with stored events or lost a relay.
 * @remark The pool calls the router from its ingress thread.  Accessors may be called from any
 * thread.
 */
class SubscriptionRouter : public IEventForwarder
{
public:
    SubscriptionRouter(std::shared_ptr<IRelayDirectory> directory);

    /**
     * @param deliveredCapacity How many delivered event IDs each subscription remembers.
     */
    SubscriptionRouter(
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<IRelaySelectionPolicy> policy,
        size_t deliveredCapacity = 65536);

    /**
     * @brief Opens a subscription under a freshly generated ID.
     * @returns The subscription ID.  The subscription's stream is available from `stream`.
     * @throws `std::invalid_argument` if no filters are given.
     */
    std::string subscribe(const std::vector<data::Filter>& filters);

    /**
     * @brief Opens a subscription under the given ID and sends `REQ` to the selected relays.
     * @param delivered Events the stream already holds, such as those backfilled from the store.
     * They are not forwarded to the subscription again.
     * @param requestFilters The filters sent to relays, when they differ from the filters events
     * are matched against.  Empty to send `filters`.
     * @throws `std::invalid_argument` if no filters are given, or the ID is invalid or in use.
     */
    void subscribe(
        const std::string& subscriptionId,
        const std::vector<data::Filter>& filters,
        std::shared_ptr<EventStream> stream,
        const std::vector<std::shared_ptr<const data::Event>>& delivered = {},
        const std::vector<data::Filter>& requestFilters = {});

    /**
     * @brief Closes a subscription on every relay serving it and ends its stream.
     * @returns False if the subscription does not exist.
     */
    bool unsubscribe(const std::string& subscriptionId);

    /**
     * @brief Applies a message from a relay to the subscription it concerns.
     * @returns True if the message is an event that belongs to a live subscription on that relay.
     * Such events should continue through ingestion; any other event should be discarded.
     */
    bool routeIncoming(const std::string& relay, const codec::RelayMessage& message);

    /**
     * @brief Dispatches open subscriptions to a relay that has just connected.
     * @remark Only subscriptions not yet sent to the relay are dispatched, subject to the selection
     * policy.
     */
    void onRelayConnected(const std::string& relay);

    /**
     * @brief Removes a relay that has left the pool or stopped retrying from every subscription.
     * @remark Each affected consumer receives a `RelayClosed` item.
     */
    void onRelayLost(const std::string& relay, const std::string& reason);

    size_t forward(std::shared_ptr<const data::Event> event, const std::string& relay) override;

    bool hasSubscription(const std::string& subscriptionId) const;

    std::shared_ptr<EventStream> stream(const std::string& subscriptionId) const;

    /**
     * @brief Returns the relays currently serving a subscription.
     */
    std::vector<std::string> subscriptionRelays(const std::string& subscriptionId) const;

    bool isCaughtUp(const std::string& subscriptionId) const;

    size_t subscriptionCount() const;

    /**
     * @brief Closes every subscription.
     */
    void closeAll(const std::string& reason);

    /**
     * @brief Generates a unique ID for a new subscription.
     * @returns A stringified UUID.
     */
    std::string generateSubscriptionId();

private:
    struct Subscription
    {
        std::string id;
        std::vector<data::Filter> filters;
        std::vector<data::Filter> requestFilters;
        std::unique_ptr<DedupCache> delivered;
        std::unordered_set<std::string> relays; ///< Relays currently serving the subscription.
        std::unordered_set<std::string> sentTo; ///< Relays that have been sent `REQ`, including any that closed it.
        std::unordered_set<std::string> eoseReceived;
        bool isCaughtUp = false;
        std::shared_ptr<EventStream> stream;
    };

    std::shared_ptr<IRelayDirectory> _directory;
    std::shared_ptr<IRelaySelectionPolicy> _policy;
    size_t _deliveredCapacity;
    UUIDv4::UUIDGenerator<std::mt19937_64> _uuidGenerator;

    std::unordered_map<std::string, Subscription> _subscriptions;
    std::unordered_map<std::string, std::unordered_set<std::string>> _subscriptionsByRelay;
    mutable std::mutex _propertyMutex;

    void _dispatch(Subscription& subscription, const std::string& relay);

    void _detach(Subscription& subscription, const std::string& relay);

    void _checkCaughtUp(Subscription& subscription);
};
} // namespace pool
} // namespace relaydeck
