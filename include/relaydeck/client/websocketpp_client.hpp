#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <plog/Log.h>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "web_socket_client.hpp"

namespace relaydeck
{
namespace client
{
/**
 * @brief An implementation of the `IWebSocketClient` interface that uses the WebSocket++ library.
 * @remark `ws://` and `wss://` URIs are served by separate endpoints that share one network
 * thread.  TLS connections use OpenSSL through Boost.Asio.
 */
class WebsocketppClient : public IWebSocketClient
{
public:
    /**
     * @param openHandshakeTimeout The longest the client waits for a connection to open before
     * reporting it as failed.
     */
    WebsocketppClient(
        std::shared_ptr<plog::IAppender> appender,
        std::chrono::milliseconds openHandshakeTimeout);

    ~WebsocketppClient();

    void start() override;

    void stop() override;

    void openConnection(
        std::string uri,
        std::function<void()> openHandler,
        std::function<void(const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler) override;

    bool isConnected(std::string uri) override;

    std::tuple<std::string, bool> send(std::string message, std::string uri) override;

    void closeConnection(std::string uri) override;

private:
    typedef websocketpp::client<websocketpp::config::asio_client> websocketpp_client;
    typedef websocketpp::client<websocketpp::config::asio_tls_client> websocketpp_tls_client;
    typedef websocketpp::lib::shared_ptr<websocketpp::lib::asio::ssl::context> ssl_context_ptr;

    struct Connection
    {
        websocketpp::connection_hdl handle;
        bool isSecure = false;
        /// Cleared once the connection is closed or replaced.  Handlers check it before firing.
        std::shared_ptr<std::atomic<bool>> isActive;
    };

    websocketpp::lib::asio::io_service _ioService;
    std::unique_ptr<websocketpp::lib::asio::io_service::work> _work;
    std::thread _networkThread;

    websocketpp_client _client;
    websocketpp_tls_client _tlsClient;
    std::chrono::milliseconds _openHandshakeTimeout;
    bool _isAsioInitialized = false;
    bool _isStarted = false;

    std::unordered_map<std::string, Connection> _connections;
    std::mutex _propertyMutex;

    /**
     * @brief Configures handlers common to both endpoints on a freshly created connection.
     */
    template <typename TConnectionPtr>
    void _configureConnection(
        TConnectionPtr connection,
        const std::string& uri,
        std::shared_ptr<std::atomic<bool>> isActive,
        std::function<void()> openHandler,
        std::function<void(const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler);

    /**
     * @brief Removes the bookkeeping for a connection, if it is still the current one for the URI.
     */
    void _forgetConnection(const std::string& uri, const std::shared_ptr<std::atomic<bool>>& isActive);

    /**
     * @brief Closes the given connection on whichever endpoint owns it.
     * @remark The caller must hold `_propertyMutex`.
     */
    void _closeLocked(const std::string& uri, Connection& connection);
};
} // namespace client
} // namespace relaydeck
