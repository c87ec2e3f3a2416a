#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/pool/pool_types.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief A publish waiting for one relay's response.
 */
struct PendingPublish
{
    uint64_t token = 0;
    std::future<RelayPublishResult> result;
};

/**
 * @brief Matches `OK` responses from relays to the publishes waiting for them.
 * @remark Several publishes of the same event to the same relay may wait at once; an `OK` answers
 * all of them.
 */
class PublishTracker
{
public:
    /**
     * @brief Starts waiting for a relay's response to an event.
     * @returns The token identifying this wait and a future that is fulfilled when the relay answers.
     */
    PendingPublish track(const std::string& eventId, const std::string& relay);

    /**
     * @brief Fulfills every publish an `OK` message answers.
     * @returns False if nothing was waiting for the response.
     */
    bool resolve(const std::string& relay, const codec::RelayMessage& ok);

    /**
     * @brief Stops one wait for a relay's response to an event.
     */
    void forget(const std::string& eventId, const std::string& relay, uint64_t token);

    size_t pending() const;

private:
    typedef std::pair<std::string, std::string> PublishKey;

    std::map<PublishKey, std::map<uint64_t, std::promise<RelayPublishResult>>> _pending;
    uint64_t _nextToken = 1;
    mutable std::mutex _propertyMutex;
};
} // namespace pool
} // namespace relaydeck
