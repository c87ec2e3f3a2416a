#include <algorithm>
#include <cmath>
#include <ctime>
#include <stdexcept>

#include "relaydeck/pool/connection_actor.hpp"

using namespace relaydeck::client;
using namespace relaydeck::codec;
using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace relaydeck::signer;
using namespace relaydeck::validation;
using namespace std;

static const int AUTH_EVENT_KIND = 22242;
static const string AUTH_REQUIRED_PREFIX = "auth-required:";

ConnectionActor::ConnectionActor(
    string url,
    shared_ptr<IWebSocketClient> client,
    shared_ptr<IEventValidator> validator,
    shared_ptr<ISigner> signer,
    IConnectionObserver& observer,
    const PoolConfig& config)
: _url(url),
  _client(client),
  _validator(validator),
  _signer(signer),
  _observer(observer),
  _config(config),
  _mailbox(make_shared<concurrency::BlockingQueue<Command>>()),
  _isRunning(false),
  _state(RelayState::Disconnected),
  _retryCount(0),
  _jitterEngine(random_device{}())
{
    if (this->_client == nullptr || this->_validator == nullptr)
    {
        throw invalid_argument("ConnectionActor: A WebSocket client and an event validator are required.");
    }
};

ConnectionActor::~ConnectionActor()
{
    this->stop();
};

void ConnectionActor::start()
{
    if (this->_isRunning.exchange(true))
    {
        return;
    }

    this->_thread = thread([this]() { this->_run(); });

    Command connect;
    connect.type = CommandType::Connect;
    this->_post(connect);
};

void ConnectionActor::stop()
{
    if (!this->_isRunning.exchange(false))
    {
        return;
    }

    Command stop;
    stop.type = CommandType::Stop;
    this->_post(stop);

    if (this->_thread.joinable())
    {
        this->_thread.join();
    }

    // Transport callbacks still in flight find the mailbox closed.
    this->_mailbox->close();
    this->_client->closeConnection(this->_url);
    this->_state.store(RelayState::Disconnected);

    PLOG_INFO << "Stopped connection actor for " << this->_url;
};

void ConnectionActor::reconnect()
{
    Command reconnect;
    reconnect.type = CommandType::Reconnect;
    this->_post(reconnect);
};

void ConnectionActor::send(string frame)
{
    Command send;
    send.type = CommandType::Send;
    send.payload = move(frame);
    this->_post(send);
};

void ConnectionActor::openSubscription(const string& subscriptionId, const vector<Filter>& filters)
{
    Command open;
    open.type = CommandType::OpenSubscription;
    open.subscriptionId = subscriptionId;
    open.payload = WireCodec::encode(ClientMessage::req(subscriptionId, filters));
    this->_post(open);
};

void ConnectionActor::closeSubscription(const string& subscriptionId, bool notifyRelay)
{
    Command close;
    close.type = CommandType::CloseSubscription;
    close.subscriptionId = subscriptionId;
    close.notifyRelay = notifyRelay;
    this->_post(close);
};

string ConnectionActor::lastFailure() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_lastFailure;
};

vector<string> ConnectionActor::activeSubscriptions() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    vector<string> subscriptionIds;
    for (const auto& [subscriptionId, frame] : this->_activeSubscriptions)
    {
        subscriptionIds.push_back(subscriptionId);
    }
    return subscriptionIds;
};

size_t ConnectionActor::queuedFrames() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_outboundQueue.size();
};

chrono::milliseconds ConnectionActor::backoffDelay(
    unsigned int retryCount,
    chrono::milliseconds backoffInitial,
    chrono::milliseconds backoffMax,
    double jitter)
{
    if (retryCount == 0)
    {
        return chrono::milliseconds(0);
    }

    // Past 2^62 the product exceeds any representable cap anyway.
    unsigned int exponent = min(retryCount - 1, 62u);
    long double uncapped = static_cast<long double>(backoffInitial.count()) * powl(2.0L, exponent);
    long long delay = uncapped >= static_cast<long double>(backoffMax.count())
        ? backoffMax.count()
        : static_cast<long long>(uncapped);

    jitter = max(0.0, min(1.0, jitter));
    long long floor = (delay + 1) / 2;
    return chrono::milliseconds(floor + llround(static_cast<double>(delay - floor) * jitter));
};

#pragma region Actor Thread

void ConnectionActor::_run()
{
    PLOG_VERBOSE << "Connection actor for " << this->_url << " started.";

    Command command;
    while (true)
    {
        bool hasCommand;
        if (this->_state.load() == RelayState::Connecting)
        {
            hasCommand = this->_mailbox->popFor(command, this->_handshakeDeadline - clock::now());
        }
        else if (this->_state.load() == RelayState::Disconnected && this->_isReconnectScheduled)
        {
            hasCommand = this->_mailbox->popFor(command, this->_reconnectAt - clock::now());
        }
        else
        {
            hasCommand = this->_mailbox->pop(command);
            if (!hasCommand)
            {
                break;
            }
        }

        if (!hasCommand)
        {
            this->_onDeadline();
            continue;
        }

        if (command.type == CommandType::Stop)
        {
            break;
        }

        this->_handle(command);
    }

    PLOG_VERBOSE << "Connection actor for " << this->_url << " exited.";
};

void ConnectionActor::_handle(Command& command)
{
    switch (command.type)
    {
    case CommandType::Connect:
        if (this->_state.load() == RelayState::Disconnected && !this->_isReconnectScheduled)
        {
            this->_beginAttempt();
        }
        break;

    case CommandType::Reconnect:
        if (this->_state.load() == RelayState::Failed || this->_state.load() == RelayState::Disconnected)
        {
            PLOG_INFO << "Reconnecting to " << this->_url;
            this->_retryCount.store(0);
            this->_isReconnectScheduled = false;
            this->_beginAttempt();
        }
        break;

    case CommandType::Opened:
        if (command.attempt == this->_attempt && this->_state.load() == RelayState::Connecting)
        {
            this->_onOpened();
        }
        break;

    case CommandType::TransportFailed:
        if (command.attempt == this->_attempt
            && (this->_state.load() == RelayState::Connecting || this->_state.load() == RelayState::Connected))
        {
            this->_onTransportFailure(command.payload);
        }
        break;

    case CommandType::Frame:
        if (command.attempt == this->_attempt && this->_state.load() == RelayState::Connected)
        {
            this->_onFrame(command.payload);
        }
        break;

    case CommandType::Send:
        this->_sendOrQueue(command.payload);
        break;

    case CommandType::OpenSubscription:
    {
        unique_lock<mutex> lock(this->_propertyMutex);
        this->_activeSubscriptions[command.subscriptionId] = command.payload;
        lock.unlock();

        // Subscriptions are requested again on connection, so a REQ is never queued.
        if (this->_state.load() == RelayState::Connected && !this->_transmit(command.payload))
        {
            this->_onTransportFailure("failed to send REQ for " + command.subscriptionId);
        }
        break;
    }

    case CommandType::CloseSubscription:
    {
        unique_lock<mutex> lock(this->_propertyMutex);
        size_t erased = this->_activeSubscriptions.erase(command.subscriptionId);
        lock.unlock();

        if (erased > 0 && command.notifyRelay && this->_state.load() == RelayState::Connected)
        {
            string closeFrame = WireCodec::encode(ClientMessage::close(command.subscriptionId));
            if (!this->_transmit(closeFrame))
            {
                this->_onTransportFailure("failed to send CLOSE for " + command.subscriptionId);
            }
        }
        break;
    }

    case CommandType::Stop:
        break;
    }
};

void ConnectionActor::_onDeadline()
{
    if (this->_state.load() == RelayState::Connecting && clock::now() >= this->_handshakeDeadline)
    {
        PLOG_WARNING << "Connection to " << this->_url << " timed out.";
        this->_client->closeConnection(this->_url);
        this->_onTransportFailure("connection timed out");
    }
    else if (this->_state.load() == RelayState::Disconnected
        && this->_isReconnectScheduled
        && clock::now() >= this->_reconnectAt)
    {
        this->_isReconnectScheduled = false;
        this->_beginAttempt();
    }
};

void ConnectionActor::_post(Command command)
{
    if (!this->_mailbox->tryPush(move(command)))
    {
        PLOG_VERBOSE << "Connection actor for " << this->_url << " is stopped; command discarded.";
    }
};

void ConnectionActor::_beginAttempt()
{
    unsigned long attempt = ++this->_attempt;
    this->_handshakeDeadline = clock::now() + this->_config.connectTimeout;
    this->_setState(RelayState::Connecting, "");

    PLOG_INFO << "Connecting to relay " << this->_url << " (attempt " << this->_retryCount.load() + 1 << ")";

    // Callbacks hold the mailbox itself, so they stay safe after the actor is gone.
    auto mailbox = this->_mailbox;
    this->_client->openConnection(
        this->_url,
        [mailbox, attempt]()
        {
            Command opened;
            opened.type = CommandType::Opened;
            opened.attempt = attempt;
            mailbox->tryPush(move(opened));
        },
        [mailbox, attempt](const string& payload)
        {
            Command frame;
            frame.type = CommandType::Frame;
            frame.attempt = attempt;
            frame.payload = payload;
            mailbox->tryPush(move(frame));
        },
        [mailbox, attempt](const string& reason)
        {
            Command failed;
            failed.type = CommandType::TransportFailed;
            failed.attempt = attempt;
            failed.payload = reason;
            mailbox->tryPush(move(failed));
        });
};

void ConnectionActor::_onOpened()
{
    this->_hasDecodedSinceConnect = false;
    this->_authEventId.clear();
    this->_isAuthenticated = false;
    this->_isAuthRejected = false;
    this->_authBlockedSubscriptions.clear();
    this->_setState(RelayState::Connected, "");

    unique_lock<mutex> lock(this->_propertyMutex);
    vector<string> requests;
    for (const auto& [subscriptionId, frame] : this->_activeSubscriptions)
    {
        requests.push_back(frame);
    }
    lock.unlock();

    for (const string& request : requests)
    {
        if (!this->_transmit(request))
        {
            this->_onTransportFailure("failed to restore subscriptions");
            return;
        }
    }

    this->_flushOutboundQueue();
};

void ConnectionActor::_onTransportFailure(const string& reason)
{
    // Invalidate callbacks from the failed attempt.
    this->_attempt++;
    this->_client->closeConnection(this->_url);

    unique_lock<mutex> lock(this->_propertyMutex);
    this->_lastFailure = reason;
    lock.unlock();

    unsigned int retryCount = ++this->_retryCount;
    if (this->_config.maxConnectAttempts > 0 && retryCount >= this->_config.maxConnectAttempts)
    {
        PLOG_ERROR << "Giving up on relay " << this->_url << " after " << retryCount << " failed attempts: " << reason;
        this->_isReconnectScheduled = false;
        this->_setState(RelayState::Failed, reason);
        return;
    }

    uniform_real_distribution<double> jitter(0.0, 1.0);
    chrono::milliseconds delay = backoffDelay(
        retryCount,
        this->_config.backoffInitial,
        this->_config.backoffMax,
        jitter(this->_jitterEngine));

    PLOG_WARNING << "Connection to relay " << this->_url << " failed (" << reason << "); retrying in "
                 << delay.count() << "ms.";

    this->_reconnectAt = clock::now() + delay;
    this->_isReconnectScheduled = true;
    this->_setState(RelayState::Disconnected, reason);
};

void ConnectionActor::_onFrame(const string& frame)
{
    RelayMessage message;
    try
    {
        message = WireCodec::decode(frame);
    }
    catch (const CodecError& ce)
    {
        PLOG_WARNING << "Dropped malformed frame from " << this->_url << ": " << ce.what();
        return;
    }

    if (!this->_hasDecodedSinceConnect)
    {
        this->_hasDecodedSinceConnect = true;
        this->_retryCount.store(0);
    }

    switch (message.type)
    {
    case RelayMessageType::Event:
        try
        {
            this->_validator->validate(*message.event);
        }
        catch (const ValidationError& ve)
        {
            PLOG_WARNING << "Dropped invalid event from " << this->_url << ": " << ve.what();
            return;
        }
        break;

    case RelayMessageType::Closed:
    {
        if (this->_holdForAuth(message))
        {
            return;
        }

        lock_guard<mutex> lock(this->_propertyMutex);
        this->_activeSubscriptions.erase(message.subscriptionId);
        break;
    }

    case RelayMessageType::Ok:
        if (!this->_authEventId.empty() && message.eventId == this->_authEventId)
        {
            this->_onAuthResult(message);
            return;
        }
        break;

    case RelayMessageType::Auth:
        this->_onAuthChallenge(message.message);
        return;

    case RelayMessageType::Unknown:
        PLOG_VERBOSE << "Ignored message of unknown type '" << message.label << "' from " << this->_url;
        return;

    default:
        break;
    }

    this->_observer.onMessage(this->_url, move(message));
};

void ConnectionActor::_onAuthChallenge(const string& challenge)
{
    if (this->_signer == nullptr)
    {
        PLOG_INFO << "Relay " << this->_url << " requested authentication, but no signer is configured.";
        return;
    }

    auto authEvent = make_shared<Event>();
    authEvent->kind = AUTH_EVENT_KIND;
    authEvent->createdAt = time(nullptr);
    authEvent->tags = { { "relay", this->_url }, { "challenge", challenge } };

    try
    {
        this->_signer->sign(authEvent);
    }
    catch (const invalid_argument& e)
    {
        PLOG_ERROR << "Failed to build authentication event for " << this->_url << ": " << e.what();
        return;
    }
    catch (const runtime_error& e)
    {
        PLOG_ERROR << "Failed to sign authentication event for " << this->_url << ": " << e.what();
        return;
    }

    PLOG_INFO << "Authenticating to relay " << this->_url;
    this->_authEventId = authEvent->id;
    this->_isAuthenticated = false;
    this->_isAuthRejected = false;
    this->_sendOrQueue(WireCodec::encode(ClientMessage::auth(authEvent)));
};

bool ConnectionActor::_holdForAuth(const RelayMessage& closed)
{
    if (this->_signer == nullptr
        || this->_isAuthenticated
        || this->_isAuthRejected
        || closed.message.rfind(AUTH_REQUIRED_PREFIX, 0) != 0)
    {
        return false;
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_activeSubscriptions.count(closed.subscriptionId) == 0)
    {
        return false;
    }

    PLOG_INFO << "Relay " << this->_url << " requires authentication for " << closed.subscriptionId
              << "; holding the subscription.";
    this->_authBlockedSubscriptions[closed.subscriptionId] = closed.message;
    return true;
};

void ConnectionActor::_onAuthResult(const RelayMessage& ok)
{
    this->_authEventId.clear();
    map<string, string> blocked;
    blocked.swap(this->_authBlockedSubscriptions);

    if (ok.accepted)
    {
        PLOG_INFO << "Authenticated to relay " << this->_url;
        this->_isAuthenticated = true;

        for (const auto& [subscriptionId, reason] : blocked)
        {
            unique_lock<mutex> lock(this->_propertyMutex);
            auto it = this->_activeSubscriptions.find(subscriptionId);
            if (it == this->_activeSubscriptions.end())
            {
                continue;
            }
            string request = it->second;
            lock.unlock();

            if (!this->_transmit(request))
            {
                this->_onTransportFailure("failed to send REQ for " + subscriptionId);
                return;
            }
        }
        return;
    }

    PLOG_WARNING << "Relay " << this->_url << " rejected authentication: " << ok.message;
    this->_isAuthRejected = true;
    for (const auto& [subscriptionId, reason] : blocked)
    {
        unique_lock<mutex> lock(this->_propertyMutex);
        size_t erased = this->_activeSubscriptions.erase(subscriptionId);
        lock.unlock();

        if (erased == 0)
        {
            continue;
        }

        RelayMessage closed;
        closed.type = RelayMessageType::Closed;
        closed.label = "CLOSED";
        closed.subscriptionId = subscriptionId;
        closed.message = reason;
        this->_observer.onMessage(this->_url, move(closed));
    }
};

void ConnectionActor::_setState(RelayState state, const string& reason)
{
    if (this->_state.exchange(state) == state)
    {
        return;
    }

    PLOG_VERBOSE << "Relay " << this->_url << " is now " << toString(state);
    this->_observer.onStateChanged(this->_url, state, reason);
};

void ConnectionActor::_sendOrQueue(const string& frame)
{
    if (this->_state.load() != RelayState::Connected)
    {
        this->_enqueue(frame);
        return;
    }

    if (!this->_transmit(frame))
    {
        this->_enqueue(frame);
        this->_onTransportFailure("send failed");
    }
};

void ConnectionActor::_enqueue(const string& frame)
{
    string dropped;
    bool hasDropped = false;

    unique_lock<mutex> lock(this->_propertyMutex);
    if (this->_outboundQueue.size() >= this->_config.outboundQueueDepth)
    {
        dropped = move(this->_outboundQueue.front());
        this->_outboundQueue.pop_front();
        hasDropped = true;
    }
    this->_outboundQueue.push_back(frame);
    lock.unlock();

    if (hasDropped)
    {
        PLOG_WARNING << "Outbound queue for " << this->_url << " is full; dropped the oldest frame.";
        this->_observer.onOverflow(this->_url, dropped);
    }
};

bool ConnectionActor::_transmit(const string& frame)
{
    auto [uri, success] = this->_client->send(frame, this->_url);
    if (!success)
    {
        PLOG_WARNING << "Failed to send frame to relay " << uri;
    }
    return success;
};

void ConnectionActor::_flushOutboundQueue()
{
    while (this->_state.load() == RelayState::Connected)
    {
        unique_lock<mutex> lock(this->_propertyMutex);
        if (this->_outboundQueue.empty())
        {
            return;
        }
        string frame = move(this->_outboundQueue.front());
        this->_outboundQueue.pop_front();
        lock.unlock();

        if (!this->_transmit(frame))
        {
            lock.lock();
            this->_outboundQueue.push_front(move(frame));
            lock.unlock();

            this->_onTransportFailure("failed to flush the outbound queue");
            return;
        }
    }
};

#pragma endregion
