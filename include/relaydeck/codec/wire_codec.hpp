#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "relaydeck/data/data.hpp"

namespace relaydeck
{
namespace codec
{
/**
 * @brief Thrown when a frame does not have the shape of a Nostr protocol message.
 * @remark A malformed frame is dropped on its own; it never closes the connection it came from.
 */
class CodecError : public std::invalid_argument
{
public:
    explicit CodecError(const std::string& message) : std::invalid_argument(message) { };
};

enum class ClientMessageType
{
    Req,
    Close,
    Event,
    Auth
};

/**
 * @brief A message sent from the client to a relay.
 */
struct ClientMessage
{
    ClientMessageType type = ClientMessageType::Req;
    std::string subscriptionId; ///< Set for `Req` and `Close`.
    std::vector<data::Filter> filters; ///< Set for `Req`.
    std::shared_ptr<const data::Event> event; ///< Set for `Event` and `Auth`.

    static ClientMessage req(std::string subscriptionId, std::vector<data::Filter> filters);

    static ClientMessage close(std::string subscriptionId);

    static ClientMessage publish(std::shared_ptr<const data::Event> event);

    static ClientMessage auth(std::shared_ptr<const data::Event> event);

    /**
     * @brief Compares message type and every payload field, including all event fields.
     */
    bool operator==(const ClientMessage& other) const;
};

enum class RelayMessageType
{
    Event,
    Eose,
    Ok,
    Notice,
    Closed,
    Auth,
    Unknown
};

/**
 * @brief A message received from a relay.
 * @remark Only the fields relevant to `type` are set.  Unknown message types keep their label in
 * `label` so they may be logged; they are otherwise ignored.
 */
struct RelayMessage
{
    RelayMessageType type = RelayMessageType::Unknown;
    std::string subscriptionId; ///< Set for `Event`, `Eose`, and `Closed`.
    std::shared_ptr<const data::Event> event; ///< Set for `Event`.
    std::string eventId; ///< Set for `Ok`.
    bool accepted = false; ///< Set for `Ok`.
    std::string message; ///< The human-readable message of `Ok`, `Notice`, and `Closed`, or the `Auth` challenge.
    std::string label; ///< The raw message type.
};

/**
 * @brief Encodes and decodes the JSON-array frames of the Nostr relay protocol (NIP-01, NIP-42).
 * @remark The codec holds no state and has no side effects.
 */
class WireCodec
{
public:
    /**
     * @brief Encodes a client message as a JSON array frame.
     * @throws `std::invalid_argument` if a required payload is missing.
     */
    static std::string encode(const ClientMessage& message);

    /**
     * @brief Decodes a frame received from a relay.
     * @returns The decoded message.  Frames with an unrecognized type decode to
     * `RelayMessageType::Unknown` rather than failing.
     * @throws `CodecError` if the frame is not a well-formed relay message.
     */
    static RelayMessage decode(const std::string& frame);

    /**
     * @brief Decodes a frame sent by a client.
     * @throws `CodecError` if the frame is not a well-formed client message.
     */
    static ClientMessage decodeClientMessage(const std::string& frame);

    /**
     * @brief Returns a short, printable name for a relay message type.
     */
    static std::string typeName(RelayMessageType type);
};
} // namespace codec
} // namespace relaydeck
