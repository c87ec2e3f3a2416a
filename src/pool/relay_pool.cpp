#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "relaydeck/pool/relay_pool.hpp"
#include "../internal/logging.hpp"

using namespace nlohmann;
using namespace relaydeck::client;
using namespace relaydeck::codec;
using namespace relaydeck::data;
using namespace relaydeck::internal;
using namespace relaydeck::pool;
using namespace relaydeck::signer;
using namespace relaydeck::store;
using namespace relaydeck::validation;
using namespace std;

RelayPool::RelayPool(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketClient> client,
    shared_ptr<ISignatureVerifier> verifier,
    shared_ptr<IEventStore> store,
    shared_ptr<ISigner> signer,
    PoolConfig config)
: RelayPool(
    appender,
    client,
    make_shared<EventValidator>(verifier, config.futureSkewTolerance),
    store,
    signer,
    config,
    make_shared<AllRelaysPolicy>()) { };

RelayPool::RelayPool(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketClient> client,
    shared_ptr<IEventValidator> validator,
    shared_ptr<IEventStore> store,
    shared_ptr<ISigner> signer,
    PoolConfig config,
    shared_ptr<IRelaySelectionPolicy> policy)
: _config(config), _client(client), _validator(validator), _store(store), _signer(signer)
{
    initLogging(appender);
    this->_config.validate();

    if (this->_client == nullptr || this->_validator == nullptr)
    {
        throw invalid_argument("RelayPool: A WebSocket client and an event validator are required.");
    }

    this->_actors = make_shared<ActorTable>();
    this->_router = make_shared<SubscriptionRouter>(
        this->_actors,
        policy != nullptr ? policy : make_shared<AllRelaysPolicy>(),
        this->_config.dedupCapacity);
    this->_pipeline = make_unique<IngestionPipeline>(
        this->_router,
        this->_store,
        this->_config,
        [this](const PoolEvent& event) { this->_raise(event); });

    this->_client->start();
    this->_pipeline->start();
    this->_ingressThread = thread([this]() { this->_runIngress(); });
};

RelayPool::~RelayPool()
{
    for (auto& actor : this->_actors->clear())
    {
        actor->stop();
    }

    IngressCommand stop;
    stop.type = IngressType::Stop;
    this->_ingress.tryPush(move(stop));
    if (this->_ingressThread.joinable())
    {
        this->_ingressThread.join();
    }
    this->_ingress.close();

    this->_router->closeAll("relay pool closed");
    this->_pipeline->stop();
    this->_client->stop();
};

bool RelayPool::addRelay(const string& url)
{
    if (!_isValidRelayUrl(url))
    {
        PLOG_WARNING << "Rejected relay URL " << url << ": only ws:// and wss:// URLs are supported.";
        return false;
    }

    if (this->_actors->contains(url))
    {
        PLOG_INFO << "Relay " << url << " is already in the pool.";
        return false;
    }

    auto actor = make_shared<ConnectionActor>(
        url,
        this->_client,
        this->_validator,
        this->_signer,
        *this,
        this->_config);

    if (!this->_actors->add(actor))
    {
        return false;
    }

    PLOG_INFO << "Added relay " << url << " to the pool.";
    actor->start();
    return true;
};

bool RelayPool::removeRelay(const string& url)
{
    shared_ptr<ConnectionActor> actor = this->_actors->remove(url);
    if (actor == nullptr)
    {
        PLOG_WARNING << "Relay " << url << " is not in the pool.";
        return false;
    }

    actor->stop();

    IngressCommand removed;
    removed.type = IngressType::RelayRemoved;
    removed.relay = url;
    this->_ingress.tryPush(move(removed));

    PLOG_INFO << "Removed relay " << url << " from the pool.";
    return true;
};

vector<string> RelayPool::openRelayConnections()
{
    PLOG_INFO << "Attempting to connect to Nostr relays.";

    vector<string> addedRelays;
    for (const string& relay : this->_config.defaultRelays)
    {
        if (this->addRelay(relay))
        {
            addedRelays.push_back(relay);
        }
    }

    PLOG_INFO << "Added " << addedRelays.size() << "/" << this->_config.defaultRelays.size() << " default relays.";
    return addedRelays;
};

void RelayPool::closeRelayConnections()
{
    vector<string> relays = this->_actors->relays();
    if (relays.empty())
    {
        PLOG_INFO << "No active relay connections to close.";
        return;
    }

    PLOG_INFO << "Disconnecting from Nostr relays.";
    for (const string& relay : relays)
    {
        this->removeRelay(relay);
    }
};

bool RelayPool::reconnectRelay(const string& url)
{
    shared_ptr<ConnectionActor> actor = this->_actors->find(url);
    if (actor == nullptr)
    {
        return false;
    }

    actor->reconnect();
    return true;
};

vector<string> RelayPool::relays() const
{
    return this->_actors->relays();
};

vector<string> RelayPool::connectedRelays() const
{
    return this->_actors->connectedRelays();
};

RelayState RelayPool::relayState(const string& url) const
{
    shared_ptr<ConnectionActor> actor = this->_actors->find(url);
    if (actor == nullptr)
    {
        throw invalid_argument("RelayPool::relayState: Relay " + url + " is not in the pool.");
    }
    return actor->state();
};

tuple<string, shared_ptr<EventStream>> RelayPool::openSubscription(const vector<Filter>& filters)
{
    if (filters.empty())
    {
        throw invalid_argument("RelayPool::openSubscription: At least one filter is required.");
    }

    IngressCommand subscribe;
    subscribe.type = IngressType::Subscribe;
    subscribe.subscriptionId = this->_router->generateSubscriptionId();
    subscribe.filters = filters;
    subscribe.stream = make_shared<EventStream>();

    string subscriptionId = subscribe.subscriptionId;
    shared_ptr<EventStream> stream = subscribe.stream;
    if (!this->_ingress.tryPush(move(subscribe)))
    {
        stream->close("relay pool closed");
    }

    return make_tuple(subscriptionId, stream);
};

bool RelayPool::closeSubscription(const string& subscriptionId)
{
    IngressCommand unsubscribe;
    unsubscribe.type = IngressType::Unsubscribe;
    unsubscribe.subscriptionId = subscriptionId;
    unsubscribe.done = make_shared<promise<bool>>();

    future<bool> closed = unsubscribe.done->get_future();
    if (!this->_ingress.tryPush(move(unsubscribe)))
    {
        return false;
    }
    return closed.get();
};

vector<RelayPublishResult> RelayPool::publishEvent(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        throw invalid_argument("RelayPool::publishEvent: No event was provided.");
    }

    PLOG_INFO << "Attempting to publish event to Nostr relays.";

    if (event->sig.empty())
    {
        if (this->_signer == nullptr)
        {
            throw invalid_argument("RelayPool::publishEvent: The event is unsigned and the pool has no signer.");
        }

        try
        {
            this->_signer->sign(event);
        }
        catch (const invalid_argument& e)
        {
            PLOG_ERROR << "Failed to sign event: " << e.what();
            throw;
        }
    }

    string frame;
    try
    {
        frame = WireCodec::encode(ClientMessage::publish(event));
    }
    catch (const json::exception& je)
    {
        PLOG_ERROR << "Failed to serialize event: " << je.what();
        throw invalid_argument(string("RelayPool::publishEvent: The event cannot be serialized: ") + je.what());
    }

    vector<string> targetRelays = this->_actors->relays();
    vector<RelayPublishResult> results(targetRelays.size());
    vector<PendingPublish> publishFutures(targetRelays.size());

    for (size_t i = 0; i < targetRelays.size(); i++)
    {
        results[i].relay = targetRelays[i];

        shared_ptr<ConnectionActor> actor = this->_actors->find(targetRelays[i]);
        if (actor == nullptr || actor->state() != RelayState::Connected)
        {
            results[i].status = PublishStatus::NotConnected;
            continue;
        }

        publishFutures[i] = this->_publishTracker.track(event->id, targetRelays[i]);
        actor->send(frame);
    }

    auto deadline = chrono::steady_clock::now() + this->_config.publishTimeout;
    size_t acceptedCount = 0;
    for (size_t i = 0; i < targetRelays.size(); i++)
    {
        future<RelayPublishResult>& publishFuture = publishFutures[i].result;
        if (!publishFuture.valid())
        {
            continue;
        }

        if (publishFuture.wait_until(deadline) != future_status::ready)
        {
            this->_publishTracker.forget(event->id, targetRelays[i], publishFutures[i].token);

            // The response may have arrived while the entry was being forgotten.
            if (publishFuture.wait_for(chrono::seconds(0)) != future_status::ready)
            {
                PLOG_WARNING << "Relay " << targetRelays[i] << " did not respond to event " << event->id;
                results[i].status = PublishStatus::TimedOut;
                continue;
            }
        }

        try
        {
            results[i] = publishFuture.get();
        }
        catch (const future_error& fe)
        {
            PLOG_ERROR << "Lost the response from relay " << targetRelays[i] << " to event " << event->id << ": " << fe.what();
            results[i].status = PublishStatus::TimedOut;
            continue;
        }

        if (results[i].status == PublishStatus::Accepted)
        {
            PLOG_INFO << "Relay " << targetRelays[i] << " accepted event: " << event->id;
            acceptedCount++;
        }
        else
        {
            PLOG_WARNING << "Relay " << targetRelays[i] << " rejected event " << event->id << ": " << results[i].message;
        }
    }

    PLOG_INFO << "Published event to " << acceptedCount << "/" << targetRelays.size() << " target relays.";
    return results;
};

vector<shared_ptr<const Event>> RelayPool::queryRelays(const vector<Filter>& filters, chrono::milliseconds timeout)
{
    if (filters.empty())
    {
        throw invalid_argument("RelayPool::queryRelays: At least one filter is required.");
    }

    auto deadline = chrono::steady_clock::now() + timeout;

    IngressCommand subscribe;
    subscribe.type = IngressType::Subscribe;
    subscribe.subscriptionId = this->_router->generateSubscriptionId();
    subscribe.filters = filters;
    subscribe.stream = make_shared<EventStream>();
    subscribe.done = make_shared<promise<bool>>();

    string subscriptionId = subscribe.subscriptionId;
    shared_ptr<EventStream> stream = subscribe.stream;
    future<bool> subscribed = subscribe.done->get_future();
    if (!this->_ingress.tryPush(move(subscribe)) || !subscribed.get())
    {
        return {};
    }

    // With no relay to wait for, only the stored events are available.
    bool isLocalOnly = this->_router->subscriptionRelays(subscriptionId).empty();
    if (isLocalOnly)
    {
        PLOG_WARNING << "No connected relays to query; answering from the local store.";
    }

    vector<shared_ptr<const Event>> events;
    unordered_set<string> uniqueEventIds;
    StreamItem item;
    bool isDone = false;
    while (!isDone)
    {
        bool hasItem;
        if (isLocalOnly)
        {
            hasItem = stream->tryNext(item);
        }
        else
        {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                PLOG_WARNING << "Query " << subscriptionId << " timed out before every relay caught up.";
                break;
            }
            hasItem = stream->next(item, remaining);
        }

        if (!hasItem)
        {
            isDone = isLocalOnly || stream->isClosed();
            continue;
        }

        switch (item.type)
        {
        case StreamItemType::Event:
            // Check if the event is unique before adding.
            if (uniqueEventIds.insert(item.event->id).second)
            {
                events.push_back(item.event);
            }
            break;
        case StreamItemType::CaughtUp:
        case StreamItemType::Closed:
            isDone = true;
            break;
        case StreamItemType::RelayClosed:
            PLOG_WARNING << "Relay " << item.relay << " closed query " << subscriptionId << ": " << item.message;
            break;
        }
    }

    this->closeSubscription(subscriptionId);
    PLOG_INFO << "Query " << subscriptionId << " returned " << events.size() << " events.";
    return events;
};

vector<shared_ptr<const Event>> RelayPool::queryLocal(const Filter& filter) const
{
    vector<shared_ptr<const Event>> events;
    if (this->_store == nullptr)
    {
        return events;
    }

    try
    {
        auto cursor = this->_store->query(filter);
        shared_ptr<const Event> event;
        while (cursor->next(event))
        {
            events.push_back(event);
        }
    }
    catch (const StoreError& se)
    {
        PLOG_ERROR << "Failed to query the local store: " << se.what();
        throw;
    }

    return events;
};

void RelayPool::setEventHandler(function<void(const PoolEvent&)> handler)
{
    lock_guard<mutex> lock(this->_handlerMutex);
    this->_eventHandler = handler;
};

#pragma region Connection Observer

void RelayPool::onStateChanged(const string& relay, RelayState state, const string& reason)
{
    IngressCommand changed;
    changed.type = IngressType::RelayStateChanged;
    changed.relay = relay;
    changed.state = state;
    changed.reason = reason;
    this->_ingress.tryPush(move(changed));
};

void RelayPool::onMessage(const string& relay, RelayMessage message)
{
    IngressCommand received;
    received.type = IngressType::RelayMessage;
    received.relay = relay;
    received.message = move(message);
    this->_ingress.tryPush(move(received));
};

void RelayPool::onOverflow(const string& relay, const string& droppedFrame)
{
    IngressCommand overflow;
    overflow.type = IngressType::Overflow;
    overflow.relay = relay;
    overflow.reason = droppedFrame;
    this->_ingress.tryPush(move(overflow));
};

#pragma endregion

#pragma region Ingress Thread

void RelayPool::_runIngress()
{
    IngressCommand command;
    while (this->_ingress.pop(command))
    {
        switch (command.type)
        {
        case IngressType::RelayMessage:
            this->_handleRelayMessage(command.relay, command.message);
            break;

        case IngressType::RelayStateChanged:
            this->_handleRelayState(command.relay, command.state, command.reason);
            break;

        case IngressType::Overflow:
        {
            PoolEvent overflow;
            overflow.type = PoolEventType::OutboundOverflow;
            overflow.relay = command.relay;
            overflow.message = "dropped queued frame: " + command.reason;
            this->_raise(overflow);
            break;
        }

        case IngressType::Subscribe:
        {
            bool isSubscribed = false;
            auto backfilled = this->_pipeline->backfill(command.filters, *command.stream);
            vector<Filter> requestFilters;
            if (this->_config.sinceOptimize)
            {
                requestFilters = _sinceOptimized(command.filters, backfilled);
            }

            try
            {
                this->_router->subscribe(
                    command.subscriptionId,
                    command.filters,
                    command.stream,
                    backfilled,
                    requestFilters);
                isSubscribed = true;
                PLOG_VERBOSE << "Subscription " << command.subscriptionId << " backfilled " << backfilled.size() << " stored events.";
            }
            catch (const invalid_argument& e)
            {
                PLOG_ERROR << "Failed to open subscription " << command.subscriptionId << ": " << e.what();
                command.stream->close(e.what());
            }

            if (command.done != nullptr)
            {
                command.done->set_value(isSubscribed);
            }
            break;
        }

        case IngressType::Unsubscribe:
        {
            bool isClosed = this->_router->unsubscribe(command.subscriptionId);
            if (command.done != nullptr)
            {
                command.done->set_value(isClosed);
            }
            break;
        }

        case IngressType::RelayRemoved:
            this->_router->onRelayLost(command.relay, "relay removed from pool");
            break;

        case IngressType::Stop:
            return;
        }
    }
};

void RelayPool::_handleRelayMessage(const string& relay, const RelayMessage& message)
{
    // Frames still in flight from a removed relay are discarded.
    if (!this->_actors->contains(relay))
    {
        return;
    }

    switch (message.type)
    {
    case RelayMessageType::Event:
        if (this->_router->routeIncoming(relay, message))
        {
            this->_pipeline->accept(message.event, relay);
        }
        break;

    case RelayMessageType::Eose:
    case RelayMessageType::Closed:
        this->_router->routeIncoming(relay, message);
        break;

    case RelayMessageType::Ok:
        if (!this->_publishTracker.resolve(relay, message))
        {
            PLOG_VERBOSE << "Relay " << relay << " sent an unexpected OK for event " << message.eventId;
        }
        break;

    case RelayMessageType::Notice:
    {
        PLOG_WARNING << "Notice from relay " << relay << ": " << message.message;
        PoolEvent notice;
        notice.type = PoolEventType::RelayNotice;
        notice.relay = relay;
        notice.message = message.message;
        this->_raise(notice);
        break;
    }

    default:
        break;
    }
};

vector<Filter> RelayPool::_sinceOptimized(
    const vector<Filter>& filters,
    const vector<shared_ptr<const Event>>& backfilled)
{
    if (backfilled.empty())
    {
        return {};
    }

    time_t newest = 0;
    for (const auto& event : backfilled)
    {
        newest = max(newest, event->createdAt);
    }

    vector<Filter> narrowed = filters;
    for (Filter& filter : narrowed)
    {
        // A window that already ends before the newest stored event is left alone.
        if (filter.until > 0 && filter.until < newest)
        {
            continue;
        }
        filter.since = max(filter.since, newest);
    }

    PLOG_VERBOSE << "Narrowed subscription filters to events since " << newest;
    return narrowed;
};

void RelayPool::_handleRelayState(const string& relay, RelayState state, const string& reason)
{
    if (!this->_actors->contains(relay))
    {
        return;
    }

    PoolEvent changed;
    changed.type = PoolEventType::RelayStateChanged;
    changed.relay = relay;
    changed.state = state;
    changed.message = reason;
    this->_raise(changed);

    if (state == RelayState::Connected)
    {
        this->_router->onRelayConnected(relay);
    }
    else if (state == RelayState::Failed)
    {
        this->_router->onRelayLost(relay, reason);
    }
};

#pragma endregion

void RelayPool::_raise(const PoolEvent& event)
{
    function<void(const PoolEvent&)> handler;
    {
        lock_guard<mutex> lock(this->_handlerMutex);
        handler = this->_eventHandler;
    }

    if (!handler)
    {
        return;
    }

    try
    {
        handler(event);
    }
    catch (const exception& e)
    {
        PLOG_ERROR << "Pool event handler threw: " << e.what();
    }
};

bool RelayPool::_isValidRelayUrl(const string& url)
{
    size_t hostStart;
    if (url.rfind("wss://", 0) == 0)
    {
        hostStart = 6;
    }
    else if (url.rfind("ws://", 0) == 0)
    {
        hostStart = 5;
    }
    else
    {
        return false;
    }

    if (url.size() <= hostStart || url[hostStart] == '/' || url[hostStart] == ':')
    {
        return false;
    }

    return url.find_first_of(" \t\r\n") == string::npos;
};
