#pragma once

#include <string>

namespace relaydeck
{
namespace pool
{
enum class RelayState
{
    Disconnected,
    Connecting,
    Connected,
    Failed ///< The relay exhausted its connection attempts and is no longer retried.
};

std::string toString(RelayState state);

enum class PublishStatus
{
    Accepted,
    Rejected,
    NotConnected,
    TimedOut
};

std::string toString(PublishStatus status);

/**
 * @brief The outcome of publishing an event to one relay.
 */
struct RelayPublishResult
{
    std::string relay;
    PublishStatus status = PublishStatus::TimedOut;
    std::string message; ///< The relay's message from its `OK` response, if it sent one.
};

enum class PoolEventType
{
    RelayStateChanged,
    OutboundOverflow,
    RelayNotice,
    StoreBackpressure,
    IngestionDegraded
};

/**
 * @brief A notification about the health of the pool, delivered to the pool's event handler.
 */
struct PoolEvent
{
    PoolEventType type = PoolEventType::RelayStateChanged;
    std::string relay; ///< The relay concerned, if any.
    RelayState state = RelayState::Disconnected; ///< Set for `RelayStateChanged`.
    std::string eventId; ///< Set for `StoreBackpressure` and `IngestionDegraded`.
    std::string message; ///< A human-readable description.
};
} // namespace pool
} // namespace relaydeck
