#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <plog/Log.h>

#include "relaydeck/client/web_socket_client.hpp"
#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/concurrency/blocking_queue.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/config.hpp"
#include "relaydeck/pool/pool_types.hpp"
#include "relaydeck/signer/signer.hpp"
#include "relaydeck/validation/event_validator.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief Receives what a connection actor learns from its relay.
 * @remark Callbacks run on the actor's thread.  Implementations should hand the work off rather
 * than block.
 */
class IConnectionObserver
{
public:
    virtual ~IConnectionObserver() = default;

    virtual void onStateChanged(const std::string& relay, RelayState state, const std::string& reason) = 0;

    /**
     * @brief Called for each decoded message the actor does not consume itself.
     * @remark `Event` messages have already passed validation.
     */
    virtual void onMessage(const std::string& relay, codec::RelayMessage message) = 0;

    /**
     * @brief Called once for each frame dropped from a full outbound queue.
     */
    virtual void onOverflow(const std::string& relay, const std::string& droppedFrame) = 0;
};

/**
 * @brief Owns the connection to a single relay.
 * @remark Each actor runs one thread that processes a mailbox of commands.  Transport callbacks
 * and calls from the pool only post commands, so the connection state machine, the outbound
 * queue, and the set of active subscriptions are only changed on the actor's own thread.
 * @remark Transport failures are retried with exponential backoff.  Frames sent while the relay is
 * not connected are queued, and every active subscription is requested again on reconnection.
 * @remark When a signer is available, a subscription the relay closes with `auth-required:` is held
 * until the relay answers the NIP-42 `AUTH` event, then requested again if authentication succeeded.
 */
class ConnectionActor
{
public:
    /**
     * @param signer Answers NIP-42 authentication challenges.  May be null, in which case
     * challenges are ignored.
     * @param observer Must outlive the actor.
     */
    ConnectionActor(
        std::string url,
        std::shared_ptr<client::IWebSocketClient> client,
        std::shared_ptr<validation::IEventValidator> validator,
        std::shared_ptr<signer::ISigner> signer,
        IConnectionObserver& observer,
        const PoolConfig& config);

    ~ConnectionActor();

    /**
     * @brief Starts the actor's thread and begins connecting.
     */
    void start();

    /**
     * @brief Stops the actor's thread and closes the connection.
     * @remark The observer is not notified of anything after this call returns.
     */
    void stop();

    /**
     * @brief Begins a fresh connection attempt with a reset retry count.
     * @remark Use this to revive a relay in the `Failed` state.  Has no effect while the relay is
     * connected or connecting.
     */
    void reconnect();

    /**
     * @brief Sends a frame, queueing it until the relay is connected.
     */
    void send(std::string frame);

    /**
     * @brief Makes the actor responsible for a subscription and sends its `REQ`.
     */
    void openSubscription(const std::string& subscriptionId, const std::vector<data::Filter>& filters);

    /**
     * @brief Makes the actor forget a subscription.
     * @param notifyRelay Whether to send `CLOSE` to the relay.  Subscriptions the relay closed
     * itself need no notice.
     */
    void closeSubscription(const std::string& subscriptionId, bool notifyRelay);

    const std::string& url() const { return this->_url; };

    RelayState state() const { return this->_state.load(); };

    unsigned int retryCount() const { return this->_retryCount.load(); };

    std::string lastFailure() const;

    std::vector<std::string> activeSubscriptions() const;

    size_t queuedFrames() const;

    /**
     * @brief Computes the delay before the next connection attempt.
     * @param retryCount The number of consecutive failed attempts so far.
     * @param jitter A value in `[0, 1]` that places the delay within `[d/2, d]`, where `d` is
     * `min(backoffMax, backoffInitial * 2^(retryCount - 1))`.
     */
    static std::chrono::milliseconds backoffDelay(
        unsigned int retryCount,
        std::chrono::milliseconds backoffInitial,
        std::chrono::milliseconds backoffMax,
        double jitter);

private:
    enum class CommandType
    {
        Connect,
        Reconnect,
        Opened,
        TransportFailed,
        Frame,
        Send,
        OpenSubscription,
        CloseSubscription,
        Stop
    };

    struct Command
    {
        CommandType type = CommandType::Stop;
        unsigned long attempt = 0; ///< The connection attempt a transport callback belongs to.
        std::string payload;
        std::string subscriptionId;
        bool notifyRelay = false;
    };

    typedef std::chrono::steady_clock clock;

    std::string _url;
    std::shared_ptr<client::IWebSocketClient> _client;
    std::shared_ptr<validation::IEventValidator> _validator;
    std::shared_ptr<signer::ISigner> _signer;
    IConnectionObserver& _observer;
    PoolConfig _config;

    std::shared_ptr<concurrency::BlockingQueue<Command>> _mailbox;
    std::thread _thread;
    std::atomic<bool> _isRunning;

    std::atomic<RelayState> _state;
    std::atomic<unsigned int> _retryCount;

    // Touched only by the actor's thread.
    unsigned long _attempt = 0;
    bool _hasDecodedSinceConnect = false;
    bool _isReconnectScheduled = false;
    clock::time_point _handshakeDeadline;
    clock::time_point _reconnectAt;
    std::mt19937 _jitterEngine;
    std::string _authEventId; ///< The `AUTH` event awaiting the relay's `OK`.
    bool _isAuthenticated = false;
    bool _isAuthRejected = false;
    std::map<std::string, std::string> _authBlockedSubscriptions; ///< Subscription IDs mapped to the relay's `CLOSED` reason.

    // Written by the actor's thread, readable from any thread.
    std::string _lastFailure;
    std::map<std::string, std::string> _activeSubscriptions; ///< Subscription IDs mapped to their `REQ` frames.
    std::deque<std::string> _outboundQueue;
    mutable std::mutex _propertyMutex;

    void _run();

    void _handle(Command& command);

    void _onDeadline();

    void _post(Command command);

    void _beginAttempt();

    void _onOpened();

    void _onTransportFailure(const std::string& reason);

    void _onFrame(const std::string& frame);

    void _onAuthChallenge(const std::string& challenge);

    /**
     * @returns True if the subscription is held until authentication completes.
     */
    bool _holdForAuth(const codec::RelayMessage& closed);

    void _onAuthResult(const codec::RelayMessage& ok);

    void _setState(RelayState state, const std::string& reason);

    /**
     * @brief Sends the frame now if connected, and queues it otherwise.
     */
    void _sendOrQueue(const std::string& frame);

    void _enqueue(const std::string& frame);

    /**
     * @brief Writes a frame to the live connection.
     * @returns False if the transport rejected the frame.
     */
    bool _transmit(const std::string& frame);

    void _flushOutboundQueue();
};
} // namespace pool
} // namespace relaydeck
