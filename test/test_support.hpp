#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "relaydeck/client/web_socket_client.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/subscription_router.hpp"
#include "relaydeck/signer/signer.hpp"
#include "relaydeck/store/event_store.hpp"

namespace relaydeck_test
{
inline const std::string testPubkey = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";
inline const std::string otherPubkey = "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36";
inline const std::string fakeSignature = std::string(128, 'a');

/**
 * @brief Builds an event with a correct ID and a placeholder signature.
 */
inline relaydeck::data::Event makeEvent(
    const std::string& content,
    int kind = 1,
    std::time_t createdAt = 1700000000,
    const std::string& pubkey = testPubkey)
{
    relaydeck::data::Event event;
    event.pubkey = pubkey;
    event.createdAt = createdAt;
    event.kind = kind;
    event.tags = { { "t", "relaydeck" } };
    event.content = content;
    event.id = event.computeId();
    event.sig = fakeSignature;
    return event;
};

inline std::string eventFrame(const std::string& subscriptionId, const relaydeck::data::Event& event)
{
    nlohmann::json jarr = nlohmann::json::array({ "EVENT", subscriptionId, event.toJson() });
    return jarr.dump();
};

inline std::shared_ptr<plog::IAppender> testAppender()
{
    static auto appender = std::make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    return appender;
};

/**
 * @brief Polls the condition until it holds or the timeout passes.
 */
inline bool eventually(std::function<bool()> condition, std::chrono::milliseconds timeout = std::chrono::seconds(3))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
};

class MockWebSocketClient : public relaydeck::client::IWebSocketClient
{
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, openConnection, (
        std::string uri,
        std::function<void()> openHandler,
        std::function<void(const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler), (override));
    MOCK_METHOD(bool, isConnected, (std::string uri), (override));
    MOCK_METHOD((std::tuple<std::string, bool>), send, (std::string message, std::string uri), (override));
    MOCK_METHOD(void, closeConnection, (std::string uri), (override));
};

class MockSignatureVerifier : public relaydeck::signer::ISignatureVerifier
{
public:
    MOCK_METHOD(bool, verify, (const std::string& id, const std::string& pubkey, const std::string& sig), (const, override));
};

class MockSigner : public relaydeck::signer::ISigner
{
public:
    MOCK_METHOD(void, sign, (std::shared_ptr<relaydeck::data::Event> event), (override));
    MOCK_METHOD(std::string, publicKey, (), (const, override));
};

class MockRelayDirectory : public relaydeck::pool::IRelayDirectory
{
public:
    MOCK_METHOD(std::vector<std::string>, connectedRelays, (), (const, override));
    MOCK_METHOD(void, openSubscription, (
        const std::string& relay,
        const std::string& subscriptionId,
        const std::vector<relaydeck::data::Filter>& filters), (override));
    MOCK_METHOD(void, closeSubscription, (
        const std::string& relay,
        const std::string& subscriptionId,
        bool notifyRelay), (override));
};

class MockEventStore : public relaydeck::store::IEventStore
{
public:
    MOCK_METHOD(void, put, (const relaydeck::data::Event& event), (override));
    MOCK_METHOD(std::unique_ptr<relaydeck::store::IEventCursor>, query, (const relaydeck::data::Filter& filter), (override));
};

/**
 * @brief Plays the part of the relays behind a mock WebSocket client.
 * @remark The harness records connection attempts and sent frames, and lets a test open, feed,
 * and fail each connection by invoking the handlers the code under test registered.
 */
class RelayHarness
{
public:
    void attach(MockWebSocketClient& client)
    {
        using ::testing::_;
        using ::testing::Invoke;
        using ::testing::Return;

        ON_CALL(client, openConnection(_, _, _, _)).WillByDefault(Invoke(
            [this](
                std::string uri,
                std::function<void()> openHandler,
                std::function<void(const std::string&)> messageHandler,
                std::function<void(const std::string&)> closeHandler)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                Connection& connection = this->_connections[uri];
                connection.openHandler = openHandler;
                connection.messageHandler = messageHandler;
                connection.closeHandler = closeHandler;
                connection.attempts++;
                connection.isOpen = false;
                this->_changed.notify_all();
            }));

        ON_CALL(client, send(_, _)).WillByDefault(Invoke(
            [this](std::string message, std::string uri)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                Connection& connection = this->_connections[uri];
                if (!connection.isOpen || !this->_acceptSends)
                {
                    return std::make_tuple(uri, false);
                }
                connection.sent.push_back(message);
                this->_changed.notify_all();
                return std::make_tuple(uri, true);
            }));

        ON_CALL(client, isConnected(_)).WillByDefault(Invoke(
            [this](std::string uri)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                return this->_connections[uri].isOpen;
            }));

        ON_CALL(client, closeConnection(_)).WillByDefault(Invoke(
            [this](std::string uri)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                this->_connections[uri].isOpen = false;
            }));
    };

    bool waitForAttempts(const std::string& uri, size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(3))
    {
        std::unique_lock<std::mutex> lock(this->_mutex);
        return this->_changed.wait_for(lock, timeout, [&]() { return this->_connections[uri].attempts >= count; });
    };

    size_t attempts(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_connections[uri].attempts;
    };

    void open(const std::string& uri)
    {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            this->_connections[uri].isOpen = true;
            handler = this->_connections[uri].openHandler;
        }
        handler();
    };

    void deliver(const std::string& uri, const std::string& frame)
    {
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            handler = this->_connections[uri].messageHandler;
        }
        handler(frame);
    };

    void fail(const std::string& uri, const std::string& reason)
    {
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            this->_connections[uri].isOpen = false;
            handler = this->_connections[uri].closeHandler;
        }
        handler(reason);
    };

    void setAcceptSends(bool acceptSends)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_acceptSends = acceptSends;
    };

    std::vector<std::string> sent(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_connections[uri].sent;
    };

    /**
     * @brief Waits for a frame beginning with the given prefix to be sent to the relay.
     * @returns The first such frame, or an empty string on timeout.
     */
    std::string waitForSent(
        const std::string& uri,
        const std::string& prefix,
        std::chrono::milliseconds timeout = std::chrono::seconds(3))
    {
        std::string match;
        std::unique_lock<std::mutex> lock(this->_mutex);
        this->_changed.wait_for(lock, timeout, [&]()
        {
            for (const auto& frame : this->_connections[uri].sent)
            {
                if (frame.rfind(prefix, 0) == 0)
                {
                    match = frame;
                    return true;
                }
            }
            return false;
        });
        return match;
    };

    size_t countSent(const std::string& uri, const std::string& prefix)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        size_t count = 0;
        for (const auto& frame : this->_connections[uri].sent)
        {
            if (frame.rfind(prefix, 0) == 0)
            {
                count++;
            }
        }
        return count;
    };

private:
    struct Connection
    {
        std::function<void()> openHandler;
        std::function<void(const std::string&)> messageHandler;
        std::function<void(const std::string&)> closeHandler;
        size_t attempts = 0;
        bool isOpen = false;
        std::vector<std::string> sent;
    };

    std::unordered_map<std::string, Connection> _connections;
    bool _acceptSends = true;
    std::mutex _mutex;
    std::condition_variable _changed;
};
} // namespace relaydeck_test
