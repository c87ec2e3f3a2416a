#include <stdexcept>

#include "relaydeck/client/websocketpp_client.hpp"
#include "../internal/logging.hpp"

using namespace relaydeck::client;
using namespace relaydeck::internal;
using namespace std;

namespace asio = websocketpp::lib::asio;

static bool isSecureUri(const string& uri)
{
    return uri.rfind("wss://", 0) == 0;
};

WebsocketppClient::WebsocketppClient(
    shared_ptr<plog::IAppender> appender,
    chrono::milliseconds openHandshakeTimeout)
: _openHandshakeTimeout(openHandshakeTimeout)
{
    initLogging(appender);

    // WebSocket++ logs through its own channels; this client logs through plog instead.
    this->_client.clear_access_channels(websocketpp::log::alevel::all);
    this->_client.clear_error_channels(websocketpp::log::elevel::all);
    this->_tlsClient.clear_access_channels(websocketpp::log::alevel::all);
    this->_tlsClient.clear_error_channels(websocketpp::log::elevel::all);
};

WebsocketppClient::~WebsocketppClient()
{
    this->stop();
};

void WebsocketppClient::start()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_isStarted)
    {
        return;
    }

    if (!this->_isAsioInitialized)
    {
        this->_client.init_asio(&this->_ioService);
        this->_tlsClient.init_asio(&this->_ioService);

        this->_client.set_open_handshake_timeout(this->_openHandshakeTimeout.count());
        this->_tlsClient.set_open_handshake_timeout(this->_openHandshakeTimeout.count());

        this->_tlsClient.set_tls_init_handler([this](websocketpp::connection_hdl handle)
        {
            auto context = websocketpp::lib::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
            context->set_options(
                asio::ssl::context::default_workarounds
                | asio::ssl::context::no_sslv2
                | asio::ssl::context::no_sslv3);
            context->set_default_verify_paths();
            context->set_verify_mode(asio::ssl::verify_peer);

            websocketpp::lib::error_code error;
            auto connection = this->_tlsClient.get_con_from_hdl(handle, error);
            if (!error)
            {
                context->set_verify_callback(asio::ssl::host_name_verification(connection->get_host()));
            }
            return context;
        });

        this->_isAsioInitialized = true;
    }
    else
    {
        this->_ioService.restart();
    }

    this->_work.reset(new asio::io_service::work(this->_ioService));
    this->_networkThread = thread([this]() { this->_ioService.run(); });
    this->_isStarted = true;

    PLOG_INFO << "WebSocket client started.";
};

void WebsocketppClient::stop()
{
    unique_lock<mutex> lock(this->_propertyMutex);
    if (!this->_isStarted)
    {
        return;
    }
    this->_isStarted = false;

    for (auto& [uri, connection] : this->_connections)
    {
        this->_closeLocked(uri, connection);
    }
    this->_connections.clear();
    lock.unlock();

    this->_work.reset();
    this->_ioService.stop();
    if (this->_networkThread.joinable() && this->_networkThread.get_id() != this_thread::get_id())
    {
        this->_networkThread.join();
    }

    PLOG_INFO << "WebSocket client stopped.";
};

void WebsocketppClient::openConnection(
    string uri,
    function<void()> openHandler,
    function<void(const string&)> messageHandler,
    function<void(const string&)> closeHandler)
{
    unique_lock<mutex> lock(this->_propertyMutex);
    if (!this->_isStarted)
    {
        lock.unlock();
        PLOG_ERROR << "Cannot connect to " << uri << ": the WebSocket client is not started.";
        closeHandler("WebSocket client is not started");
        return;
    }

    // A new attempt replaces whatever connection the URI had before.
    auto existing = this->_connections.find(uri);
    if (existing != this->_connections.end())
    {
        this->_closeLocked(uri, existing->second);
        this->_connections.erase(existing);
    }

    websocketpp::lib::error_code error;
    auto isActive = make_shared<atomic<bool>>(true);
    Connection record;
    record.isSecure = isSecureUri(uri);
    record.isActive = isActive;

    if (record.isSecure)
    {
        websocketpp_tls_client::connection_ptr connection = this->_tlsClient.get_connection(uri, error);
        if (!error)
        {
            this->_configureConnection(connection, uri, isActive, openHandler, messageHandler, closeHandler);
            record.handle = connection->get_handle();
            this->_connections[uri] = record;
            this->_tlsClient.connect(connection);
        }
    }
    else
    {
        websocketpp_client::connection_ptr connection = this->_client.get_connection(uri, error);
        if (!error)
        {
            this->_configureConnection(connection, uri, isActive, openHandler, messageHandler, closeHandler);
            record.handle = connection->get_handle();
            this->_connections[uri] = record;
            this->_client.connect(connection);
        }
    }
    lock.unlock();

    if (error)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << error.message();
        closeHandler(error.message());
    }
};

bool WebsocketppClient::isConnected(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        return false;
    }

    websocketpp::lib::error_code error;
    if (it->second.isSecure)
    {
        auto connection = this->_tlsClient.get_con_from_hdl(it->second.handle, error);
        return !error && connection->get_state() == websocketpp::session::state::open;
    }

    auto connection = this->_client.get_con_from_hdl(it->second.handle, error);
    return !error && connection->get_state() == websocketpp::session::state::open;
};

tuple<string, bool> WebsocketppClient::send(string message, string uri)
{
    websocketpp::lib::error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        return make_tuple(uri, false);
    }

    if (it->second.isSecure)
    {
        this->_tlsClient.send(it->second.handle, message, websocketpp::frame::opcode::text, error);
    }
    else
    {
        this->_client.send(it->second.handle, message, websocketpp::frame::opcode::text, error);
    }

    if (error)
    {
        PLOG_WARNING << "Failed to send message to " << uri << ": " << error.message();
        return make_tuple(uri, false);
    }

    return make_tuple(uri, true);
};

void WebsocketppClient::closeConnection(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        return;
    }

    this->_closeLocked(uri, it->second);
    this->_connections.erase(it);
};

template <typename TConnectionPtr>
void WebsocketppClient::_configureConnection(
    TConnectionPtr connection,
    const string& uri,
    shared_ptr<atomic<bool>> isActive,
    function<void()> openHandler,
    function<void(const string&)> messageHandler,
    function<void(const string&)> closeHandler)
{
    typedef typename TConnectionPtr::element_type connection_type;
    websocketpp::lib::weak_ptr<connection_type> weakConnection = connection;

    connection->set_open_handler([uri, isActive, openHandler](websocketpp::connection_hdl)
    {
        if (!isActive->load())
        {
            return;
        }
        PLOG_INFO << "Opened connection to " << uri;
        openHandler();
    });

    connection->set_message_handler([isActive, messageHandler](websocketpp::connection_hdl, auto message)
    {
        if (!isActive->load())
        {
            return;
        }
        messageHandler(message->get_payload());
    });

    connection->set_fail_handler([this, uri, isActive, weakConnection, closeHandler](websocketpp::connection_hdl)
    {
        if (!isActive->exchange(false))
        {
            return;
        }

        string reason = "connection failed";
        if (auto failed = weakConnection.lock())
        {
            reason = failed->get_ec().message();
        }
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << reason;

        this->_forgetConnection(uri, isActive);
        closeHandler(reason);
    });

    connection->set_close_handler([this, uri, isActive, weakConnection, closeHandler](websocketpp::connection_hdl)
    {
        if (!isActive->exchange(false))
        {
            return;
        }

        string reason = "connection closed";
        if (auto closed = weakConnection.lock())
        {
            reason = "closed with code " + to_string(closed->get_remote_close_code());
            if (!closed->get_remote_close_reason().empty())
            {
                reason += ": " + closed->get_remote_close_reason();
            }
        }
        PLOG_WARNING << "Connection to relay " << uri << " " << reason;

        this->_forgetConnection(uri, isActive);
        closeHandler(reason);
    });
};

void WebsocketppClient::_forgetConnection(const string& uri, const shared_ptr<atomic<bool>>& isActive)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it != this->_connections.end() && it->second.isActive == isActive)
    {
        this->_connections.erase(it);
    }
};

void WebsocketppClient::_closeLocked(const string& uri, Connection& connection)
{
    connection.isActive->store(false);

    websocketpp::lib::error_code error;
    if (connection.isSecure)
    {
        this->_tlsClient.close(connection.handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }
    else
    {
        this->_client.close(connection.handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }

    if (error)
    {
        // Connections that never opened cannot be closed cleanly.
        PLOG_VERBOSE << "Close of " << uri << " reported: " << error.message();
    }
};
