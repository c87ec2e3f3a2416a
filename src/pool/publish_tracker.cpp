#include "relaydeck/pool/publish_tracker.hpp"

using namespace relaydeck::codec;
using namespace relaydeck::pool;
using namespace std;

PendingPublish PublishTracker::track(const string& eventId, const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    PendingPublish pendingPublish;
    pendingPublish.token = this->_nextToken++;
    promise<RelayPublishResult>& publishPromise = this->_pending[make_pair(eventId, relay)][pendingPublish.token];
    pendingPublish.result = publishPromise.get_future();
    return pendingPublish;
};

bool PublishTracker::resolve(const string& relay, const RelayMessage& ok)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_pending.find(make_pair(ok.eventId, relay));
    if (it == this->_pending.end())
    {
        return false;
    }

    RelayPublishResult result;
    result.relay = relay;
    result.status = ok.accepted ? PublishStatus::Accepted : PublishStatus::Rejected;
    result.message = ok.message;

    for (auto& waiting : it->second)
    {
        waiting.second.set_value(result);
    }
    this->_pending.erase(it);
    return true;
};

void PublishTracker::forget(const string& eventId, const string& relay, uint64_t token)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_pending.find(make_pair(eventId, relay));
    if (it == this->_pending.end())
    {
        return;
    }

    it->second.erase(token);
    if (it->second.empty())
    {
        this->_pending.erase(it);
    }
};

size_t PublishTracker::pending() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    size_t count = 0;
    for (const auto& entry : this->_pending)
    {
        count += entry.second.size();
    }
    return count;
};
