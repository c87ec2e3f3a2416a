#include <stdexcept>

#include "relaydeck/invariant.hpp"
#include "relaydeck/pool/subscription_router.hpp"

using namespace relaydeck::codec;
using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace std;

SubscriptionRouter::SubscriptionRouter(shared_ptr<IRelayDirectory> directory)
: SubscriptionRouter(directory, make_shared<AllRelaysPolicy>()) { };

SubscriptionRouter::SubscriptionRouter(
    shared_ptr<IRelayDirectory> directory,
    shared_ptr<IRelaySelectionPolicy> policy,
    size_t deliveredCapacity)
: _directory(directory), _policy(policy), _deliveredCapacity(deliveredCapacity)
{
    if (this->_directory == nullptr || this->_policy == nullptr)
    {
        throw invalid_argument("SubscriptionRouter: A relay directory and a selection policy are required.");
    }
    if (this->_deliveredCapacity == 0)
    {
        throw invalid_argument("SubscriptionRouter: The delivered-event capacity must be positive.");
    }
};

string SubscriptionRouter::subscribe(const vector<Filter>& filters)
{
    string subscriptionId = this->generateSubscriptionId();
    this->subscribe(subscriptionId, filters, make_shared<EventStream>());
    return subscriptionId;
};

void SubscriptionRouter::subscribe(
    const string& subscriptionId,
    const vector<Filter>& filters,
    shared_ptr<EventStream> stream,
    const vector<shared_ptr<const Event>>& delivered,
    const vector<Filter>& requestFilters)
{
    if (filters.empty())
    {
        throw invalid_argument("SubscriptionRouter::subscribe: At least one filter is required.");
    }
    if (subscriptionId.empty() || subscriptionId.size() > 64)
    {
        throw invalid_argument("SubscriptionRouter::subscribe: The subscription ID must be between 1 and 64 characters long.");
    }
    if (stream == nullptr)
    {
        throw invalid_argument("SubscriptionRouter::subscribe: A stream is required.");
    }

    vector<string> candidates = this->_directory->connectedRelays();

    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_subscriptions.find(subscriptionId) != this->_subscriptions.end())
    {
        throw invalid_argument("SubscriptionRouter::subscribe: Subscription " + subscriptionId + " already exists.");
    }

    Subscription& subscription = this->_subscriptions[subscriptionId];
    subscription.id = subscriptionId;
    subscription.filters = filters;
    subscription.requestFilters = requestFilters.empty() ? filters : requestFilters;
    subscription.delivered = make_unique<DedupCache>(this->_deliveredCapacity);
    subscription.stream = stream;

    for (const auto& event : delivered)
    {
        subscription.delivered->markSeen(event->id);
    }

    for (const string& relay : this->_policy->select(candidates, filters))
    {
        this->_dispatch(subscription, relay);
    }

    PLOG_INFO << "Opened subscription " << subscriptionId << " on " << subscription.relays.size() << " relays.";
};

bool SubscriptionRouter::unsubscribe(const string& subscriptionId)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        PLOG_WARNING << "Subscription " << subscriptionId << " not found.";
        return false;
    }

    Subscription& subscription = it->second;
    for (const string& relay : subscription.relays)
    {
        this->_directory->closeSubscription(relay, subscriptionId, true);

        auto reverse = this->_subscriptionsByRelay.find(relay);
        if (reverse != this->_subscriptionsByRelay.end())
        {
            reverse->second.erase(subscriptionId);
        }
    }

    subscription.stream->close("unsubscribed");
    PLOG_INFO << "Closed subscription " << subscriptionId << " on " << subscription.relays.size() << " relays.";

    this->_subscriptions.erase(it);
    return true;
};

bool SubscriptionRouter::routeIncoming(const string& relay, const RelayMessage& message)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    switch (message.type)
    {
    case RelayMessageType::Event:
    case RelayMessageType::Eose:
    case RelayMessageType::Closed:
        break;
    default:
        return false;
    }

    auto it = this->_subscriptions.find(message.subscriptionId);
    if (it == this->_subscriptions.end())
    {
        PLOG_VERBOSE << "Discarded " << WireCodec::typeName(message.type) << " from " << relay
                     << " for unknown subscription " << message.subscriptionId;
        return false;
    }

    Subscription& subscription = it->second;
    if (subscription.relays.find(relay) == subscription.relays.end())
    {
        PLOG_VERBOSE << "Discarded " << WireCodec::typeName(message.type) << " from " << relay
                     << ", which does not serve subscription " << message.subscriptionId;
        return false;
    }

    if (message.type == RelayMessageType::Event)
    {
        return true;
    }

    if (message.type == RelayMessageType::Eose)
    {
        subscription.eoseReceived.insert(relay);
        this->_checkCaughtUp(subscription);
        return false;
    }

    PLOG_WARNING << "Relay " << relay << " closed subscription " << subscription.id << ": " << message.message;
    this->_directory->closeSubscription(relay, subscription.id, false);
    this->_detach(subscription, relay);
    subscription.stream->pushRelayClosed(relay, message.message);
    this->_checkCaughtUp(subscription);
    return false;
};

void SubscriptionRouter::onRelayConnected(const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    for (auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        if (subscription.sentTo.find(relay) != subscription.sentTo.end())
        {
            continue;
        }

        if (!this->_policy->select({ relay }, subscription.filters).empty())
        {
            PLOG_INFO << "Dispatching subscription " << subscriptionId << " to newly connected relay " << relay;
            this->_dispatch(subscription, relay);
        }
    }
};

void SubscriptionRouter::onRelayLost(const string& relay, const string& reason)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto reverse = this->_subscriptionsByRelay.find(relay);
    if (reverse == this->_subscriptionsByRelay.end())
    {
        return;
    }

    unordered_set<string> affected = move(reverse->second);
    this->_subscriptionsByRelay.erase(reverse);

    for (const string& subscriptionId : affected)
    {
        auto it = this->_subscriptions.find(subscriptionId);
        RELAYDECK_INVARIANT(
            it != this->_subscriptions.end(),
            "relay " + relay + " serves missing subscription " + subscriptionId,
            continue);

        Subscription& subscription = it->second;
        this->_directory->closeSubscription(relay, subscriptionId, false);
        subscription.relays.erase(relay);
        subscription.eoseReceived.erase(relay);

        // The relay may be dispatched to again if it comes back.
        subscription.sentTo.erase(relay);

        subscription.stream->pushRelayClosed(relay, reason);
        this->_checkCaughtUp(subscription);
    }

    PLOG_INFO << "Relay " << relay << " left " << affected.size() << " subscriptions: " << reason;
};

size_t SubscriptionRouter::forward(shared_ptr<const Event> event, const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    size_t delivered = 0;
    for (auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        if (Filter::matchesAny(subscription.filters, *event) && subscription.delivered->markSeen(event->id))
        {
            subscription.stream->pushEvent(event, relay);
            delivered++;
        }
    }
    return delivered;
};

bool SubscriptionRouter::hasSubscription(const string& subscriptionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_subscriptions.find(subscriptionId) != this->_subscriptions.end();
};

shared_ptr<EventStream> SubscriptionRouter::stream(const string& subscriptionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return nullptr;
    }
    return it->second.stream;
};

vector<string> SubscriptionRouter::subscriptionRelays(const string& subscriptionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return {};
    }
    return vector<string>(it->second.relays.begin(), it->second.relays.end());
};

bool SubscriptionRouter::isCaughtUp(const string& subscriptionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    return it != this->_subscriptions.end() && it->second.isCaughtUp;
};

size_t SubscriptionRouter::subscriptionCount() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_subscriptions.size();
};

void SubscriptionRouter::closeAll(const string& reason)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    for (auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        for (const string& relay : subscription.relays)
        {
            this->_directory->closeSubscription(relay, subscriptionId, true);
        }
        subscription.stream->close(reason);
    }
    this->_subscriptions.clear();
    this->_subscriptionsByRelay.clear();
};

string SubscriptionRouter::generateSubscriptionId()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    UUIDv4::UUID uuid = this->_uuidGenerator.getUUID();
    return uuid.str();
};

void SubscriptionRouter::_dispatch(Subscription& subscription, const string& relay)
{
    this->_directory->openSubscription(relay, subscription.id, subscription.requestFilters);
    subscription.relays.insert(relay);
    subscription.sentTo.insert(relay);
    this->_subscriptionsByRelay[relay].insert(subscription.id);
};

void SubscriptionRouter::_detach(Subscription& subscription, const string& relay)
{
    subscription.relays.erase(relay);
    subscription.eoseReceived.erase(relay);

    auto reverse = this->_subscriptionsByRelay.find(relay);
    if (reverse != this->_subscriptionsByRelay.end())
    {
        reverse->second.erase(subscription.id);
    }
};

void SubscriptionRouter::_checkCaughtUp(Subscription& subscription)
{
    if (subscription.isCaughtUp || subscription.relays.empty())
    {
        return;
    }

    for (const string& relay : subscription.relays)
    {
        if (subscription.eoseReceived.find(relay) == subscription.eoseReceived.end())
        {
            return;
        }
    }

    subscription.isCaughtUp = true;
    subscription.stream->pushCaughtUp();
    PLOG_INFO << "Subscription " << subscription.id << " caught up on " << subscription.relays.size() << " relays.";
};
