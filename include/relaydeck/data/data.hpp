#pragma once

#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace relaydeck
{
namespace data
{
/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
 * @remark The `id`, `pubkey`, and `sig` fields hold lowercase hex strings, exactly as they appear
 * on the wire.
 */
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = 0; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object, generating its ID first.
     * @returns A stringified JSON object representing the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark Use this method when preparing an event for signing.  Events received from relays
     * should be encoded with `toJson`, which leaves the ID untouched.
     */
    std::string serialize();

    /**
     * @brief Builds the JSON object for the event without modifying any field.
     */
    nlohmann::json toJson() const;

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `nlohmann::json::exception` if the string is not valid JSON.
     * @throws `std::invalid_argument` if the JSON object is not a structurally valid event.
     */
    static Event fromString(std::string jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @throws `std::invalid_argument` if the JSON object is not a structurally valid event.
     */
    static Event fromJson(const nlohmann::json& j);

    /**
     * @brief Computes the ID the event should have, given its current data.
     * @returns A 32-byte lowercase hex-encoded SHA-256 of the canonical serialization
     * `[0, pubkey, created_at, kind, tags, content]`.
     */
    std::string computeId() const;

    /**
     * @brief Returns the value of the first tag with the given name, or an empty string.
     */
    std::string firstTagValue(const std::string& name) const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is empty for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;

    /**
     * @brief Compares every field of two events.
     */
    bool isIdenticalTo(const Event& other) const;

private:
    /**
     * @brief Validates the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The `createdAt` field defaults to the present if it is not already set.
     */
    void validate();
};

/**
 * @brief A filter for querying Nostr relays and matching events.
 * @remark Empty lists mean the field is absent.  The `since`, `until`, and `limit` fields use `0`
 * to mean absent.  An event matches the filter only if every present field matches it.
 */
struct Filter
{
    std::vector<std::string> ids; ///< Event IDs.
    std::vector<std::string> authors; ///< Event author pubkeys, hex-encoded.
    std::vector<int> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag names mapped to lists of tag values.
    std::time_t since = 0; ///< Unix timestamp.  Matching events must not be older than this.
    std::time_t until = 0; ///< Unix timestamp.  Matching events must not be newer than this.
    int limit = 0; ///< The maximum number of events the relay should return on the initial query.

    /**
     * @brief Serializes the filter as a REQ message.
     * @param subscriptionId A string up to 64 chars in length that is unique per relay connection.
     * @returns A stringified JSON array of the form `["REQ", <subscriptionId>, <filter>]`.
     * @throws `std::invalid_argument` if the subscription ID is invalid.
     */
    std::string serialize(const std::string& subscriptionId) const;

    /**
     * @brief Deserializes a filter from a JSON object.
     * @throws `std::invalid_argument` if the JSON object is not a valid filter.
     */
    static Filter fromJson(const nlohmann::json& j);

    /**
     * @brief Indicates whether the given event satisfies every field present in the filter.
     * @remark The `limit` field only bounds stored-event queries and is ignored here.
     */
    bool matches(const Event& event) const;

    /**
     * @brief Indicates whether the given event matches any of the given filters.
     */
    static bool matchesAny(const std::vector<Filter>& filters, const Event& event);

    bool operator==(const Filter& other) const;
};
} // namespace data
} // namespace relaydeck

namespace nlohmann
{
template <>
struct adl_serializer<relaydeck::data::Event>
{
    static void to_json(json& j, const relaydeck::data::Event& event);
    static void from_json(const json& j, relaydeck::data::Event& event);
};

template <>
struct adl_serializer<relaydeck::data::Filter>
{
    static void to_json(json& j, const relaydeck::data::Filter& filter);
    static void from_json(const json& j, relaydeck::data::Filter& filter);
};
} // namespace nlohmann
