#pragma once

#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

#include "event_store.hpp"

namespace relaydeck
{
namespace store
{
/**
 * @brief An event store held in memory.
 * @remark Queries scan every stored event.  Results are ordered newest first, and ties are
 * broken by event ID.
 */
class MemoryEventStore : public IEventStore
{
public:
    void put(const data::Event& event) override;

    std::unique_ptr<IEventCursor> query(const data::Filter& filter) override;

    size_t size() const;

private:
    std::vector<std::shared_ptr<const data::Event>> _events;
    std::unordered_set<std::string> _storedIds;
    mutable std::mutex _propertyMutex;
};
} // namespace store
} // namespace relaydeck
