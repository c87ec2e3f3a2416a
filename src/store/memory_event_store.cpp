#include <algorithm>

#include "relaydeck/store/memory_event_store.hpp"

using namespace relaydeck::data;
using namespace relaydeck::store;
using namespace std;

namespace
{
/**
 * @brief Walks a snapshot of stored events, yielding those that match the filter.
 */
class SnapshotCursor : public IEventCursor
{
public:
    SnapshotCursor(vector<shared_ptr<const Event>> snapshot, Filter filter)
    : _snapshot(move(snapshot)), _filter(move(filter)) { };

    bool next(shared_ptr<const Event>& event) override
    {
        if (this->_filter.limit > 0 && this->_yielded >= static_cast<size_t>(this->_filter.limit))
        {
            return false;
        }

        while (this->_position < this->_snapshot.size())
        {
            const auto& candidate = this->_snapshot[this->_position++];
            if (this->_filter.matches(*candidate))
            {
                event = candidate;
                this->_yielded++;
                return true;
            }
        }
        return false;
    };

    void reset() override
    {
        this->_position = 0;
        this->_yielded = 0;
    };

private:
    vector<shared_ptr<const Event>> _snapshot;
    Filter _filter;
    size_t _position = 0;
    size_t _yielded = 0;
};
} // namespace

void MemoryEventStore::put(const Event& event)
{
    if (event.id.empty())
    {
        throw StoreError("MemoryEventStore: Cannot store an event without an ID.");
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    if (!this->_storedIds.insert(event.id).second)
    {
        return;
    }

    this->_events.push_back(make_shared<const Event>(event));
};

unique_ptr<IEventCursor> MemoryEventStore::query(const Filter& filter)
{
    vector<shared_ptr<const Event>> snapshot;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        snapshot = this->_events;
    }

    sort(snapshot.begin(), snapshot.end(), [](const auto& a, const auto& b)
    {
        if (a->createdAt != b->createdAt)
        {
            return a->createdAt > b->createdAt;
        }
        return a->id < b->id;
    });

    return make_unique<SnapshotCursor>(move(snapshot), filter);
};

size_t MemoryEventStore::size() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_events.size();
};
