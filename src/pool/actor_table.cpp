#include "relaydeck/pool/actor_table.hpp"

using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace std;

bool ActorTable::add(shared_ptr<ConnectionActor> actor)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_actors.emplace(actor->url(), actor).second;
};

shared_ptr<ConnectionActor> ActorTable::remove(const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_actors.find(relay);
    if (it == this->_actors.end())
    {
        return nullptr;
    }

    shared_ptr<ConnectionActor> actor = it->second;
    this->_actors.erase(it);
    return actor;
};

shared_ptr<ConnectionActor> ActorTable::find(const string& relay) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_actors.find(relay);
    return it == this->_actors.end() ? nullptr : it->second;
};

bool ActorTable::contains(const string& relay) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_actors.find(relay) != this->_actors.end();
};

vector<string> ActorTable::relays() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    vector<string> relays;
    for (const auto& [relay, actor] : this->_actors)
    {
        relays.push_back(relay);
    }
    return relays;
};

vector<shared_ptr<ConnectionActor>> ActorTable::clear()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    vector<shared_ptr<ConnectionActor>> actors;
    for (const auto& [relay, actor] : this->_actors)
    {
        actors.push_back(actor);
    }
    this->_actors.clear();
    return actors;
};

size_t ActorTable::size() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_actors.size();
};

vector<string> ActorTable::connectedRelays() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    vector<string> connected;
    for (const auto& [relay, actor] : this->_actors)
    {
        if (actor->state() == RelayState::Connected)
        {
            connected.push_back(relay);
        }
    }
    return connected;
};

void ActorTable::openSubscription(const string& relay, const string& subscriptionId, const vector<Filter>& filters)
{
    shared_ptr<ConnectionActor> actor = this->find(relay);
    if (actor != nullptr)
    {
        actor->openSubscription(subscriptionId, filters);
    }
};

void ActorTable::closeSubscription(const string& relay, const string& subscriptionId, bool notifyRelay)
{
    shared_ptr<ConnectionActor> actor = this->find(relay);
    if (actor != nullptr)
    {
        actor->closeSubscription(subscriptionId, notifyRelay);
    }
};
