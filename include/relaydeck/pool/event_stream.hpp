#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "relaydeck/concurrency/blocking_queue.hpp"
#include "relaydeck/data/data.hpp"

namespace relaydeck
{
namespace pool
{
enum class StreamItemType
{
    Event,
    CaughtUp, ///< Every relay serving the subscription has sent its stored events.
    RelayClosed, ///< A relay stopped serving the subscription; later events from it are missing.
    Closed ///< The subscription has ended.  No further items follow.
};

struct StreamItem
{
    StreamItemType type = StreamItemType::Event;
    std::shared_ptr<const data::Event> event; ///< Set for `Event`.
    std::string relay; ///< Set for `RelayClosed`, and for `Event` when it came from a relay.
    std::string message; ///< The reason given for `RelayClosed` or `Closed`.
};

/**
 * @brief The consumer end of a subscription.
 * @remark The pool produces items from its ingress thread, and consumers read them from any
 * thread.  A `CaughtUp` item is delivered at most once, and `Closed` is always the last item.
 */
class EventStream
{
public:
    /**
     * @brief Waits up to the given timeout for the next item.
     * @returns False if no item arrived in time, or if the stream has been fully drained after
     * closing.
     */
    bool next(StreamItem& item, std::chrono::milliseconds timeout);

    /**
     * @brief Takes the next item if one is ready.
     */
    bool tryNext(StreamItem& item);

    /**
     * @brief Indicates whether the producer has closed the stream.  Queued items may remain.
     */
    bool isClosed() const;

    void pushEvent(std::shared_ptr<const data::Event> event, const std::string& relay);

    /**
     * @returns False if the stream was already caught up or closed.
     */
    bool pushCaughtUp();

    void pushRelayClosed(const std::string& relay, const std::string& reason);

    /**
     * @brief Delivers the terminal `Closed` item.  Later pushes are ignored.
     */
    void close(const std::string& reason);

private:
    concurrency::BlockingQueue<StreamItem> _items;
    bool _isCaughtUp = false;
    mutable std::mutex _propertyMutex;
};
} // namespace pool
} // namespace relaydeck
