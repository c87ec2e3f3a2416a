#pragma once

#include <functional>
#include <string>
#include <tuple>

namespace relaydeck
{
namespace client
{
/**
 * @brief An interface for a WebSocket client shared by every relay connection in a pool.
 * @remark Handlers passed to `openConnection` are invoked on the client's network thread.  They
 * should post work elsewhere rather than block.
 */
class IWebSocketClient
{
public:
    virtual ~IWebSocketClient() = default;

    /**
     * @brief Starts the client.
     * @remark This method must be called before any other client methods.
     */
    virtual void start() = 0;

    /**
     * @brief Stops the client.
     * @remark This method should be called when the client is no longer needed, before it is
     * destroyed.
     */
    virtual void stop() = 0;

    /**
     * @brief Begins opening a connection to the given server.
     * @param openHandler Invoked once the WebSocket handshake completes.
     * @param messageHandler Invoked with the payload of each text frame the server sends.
     * @param closeHandler Invoked with a reason when the connection fails to open, or when an
     * open connection is closed by either side.
     * @remark The call returns immediately.  Exactly one of `openHandler` or `closeHandler` is
     * invoked for the attempt, and `closeHandler` follows a successful open when it ends.
     */
    virtual void openConnection(
        std::string uri,
        std::function<void()> openHandler,
        std::function<void(const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler) = 0;

    /**
     * @brief Indicates whether the client is connected to the given server.
     * @returns True if the client is connected, false otherwise.
     */
    virtual bool isConnected(std::string uri) = 0;

    /**
     * @brief Sends the given message to the given server.
     * @returns A tuple indicating the server URI and whether the message was successfully
     * sent.
     */
    virtual std::tuple<std::string, bool> send(std::string message, std::string uri) = 0;

    /**
     * @brief Closes the connection to the given server.
     * @remark Handlers registered for the connection are not invoked after this call returns.
     */
    virtual void closeConnection(std::string uri) = 0;
};
} // namespace client
} // namespace relaydeck
