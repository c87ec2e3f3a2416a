#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace relaydeck
{
namespace pool
{
/**
 * @brief Tuning parameters for a relay pool.
 */
struct PoolConfig
{
    std::vector<std::string> defaultRelays; ///< Relays opened by `RelayPool::openRelayConnections`.
    std::chrono::milliseconds connectTimeout = std::chrono::seconds(10); ///< Bounds the open and handshake of one attempt.
    std::chrono::milliseconds backoffInitial = std::chrono::milliseconds(500);
    std::chrono::milliseconds backoffMax = std::chrono::seconds(60);
    unsigned int maxConnectAttempts = 0; ///< Consecutive failures before a relay is marked failed.  `0` retries forever.
    size_t outboundQueueDepth = 256; ///< Frames held per relay while it is not connected.
    size_t dedupCapacity = 65536; ///< Event IDs remembered for deduplication.
    size_t storeQueueDepth = 1024; ///< Events waiting to be written to the local store.
    unsigned int storeRetries = 3; ///< Retries of a failed store write before it is abandoned.
    std::chrono::seconds futureSkewTolerance = std::chrono::minutes(15);
    std::chrono::milliseconds publishTimeout = std::chrono::seconds(10); ///< How long to wait for each relay's `OK`.

    /**
     * @brief Narrows each `REQ` to events no older than the newest stored event the subscription
     * was backfilled with, so relays do not resend what the store already holds.
     */
    bool sinceOptimize = false;

    /**
     * @brief Reads a configuration from a JSON object.
     * @remark Keys are snake_case field names with a unit suffix on durations, for example
     * `connect_timeout_ms` or `future_skew_tolerance_s`.  Missing keys keep their defaults and
     * unknown keys are ignored.
     * @throws `std::invalid_argument` if a value has the wrong type or is out of range.
     */
    static PoolConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Checks that the configuration is usable.
     * @throws `std::invalid_argument` describing the first problem found.
     */
    void validate() const;
};
} // namespace pool
} // namespace relaydeck
