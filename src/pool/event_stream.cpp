#include "relaydeck/pool/event_stream.hpp"

using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace std;

bool EventStream::next(StreamItem& item, chrono::milliseconds timeout)
{
    return this->_items.popFor(item, timeout);
};

bool EventStream::tryNext(StreamItem& item)
{
    return this->_items.tryPop(item);
};

bool EventStream::isClosed() const
{
    return this->_items.isClosed();
};

void EventStream::pushEvent(shared_ptr<const Event> event, const string& relay)
{
    StreamItem item;
    item.type = StreamItemType::Event;
    item.event = event;
    item.relay = relay;
    this->_items.tryPush(move(item));
};

bool EventStream::pushCaughtUp()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_isCaughtUp)
    {
        return false;
    }

    StreamItem item;
    item.type = StreamItemType::CaughtUp;
    if (!this->_items.tryPush(move(item)))
    {
        return false;
    }

    this->_isCaughtUp = true;
    return true;
};

void EventStream::pushRelayClosed(const string& relay, const string& reason)
{
    StreamItem item;
    item.type = StreamItemType::RelayClosed;
    item.relay = relay;
    item.message = reason;
    this->_items.tryPush(move(item));
};

void EventStream::close(const string& reason)
{
    StreamItem item;
    item.type = StreamItemType::Closed;
    item.message = reason;

    // The queue is unbounded, so the push fails only if the stream is already closed.
    if (this->_items.tryPush(move(item)))
    {
        this->_items.close();
    }
};
