#include <stdexcept>

#include "relaydeck/pool/dedup_cache.hpp"

using namespace relaydeck::pool;
using namespace std;

DedupCache::DedupCache(size_t capacity) : _capacity(capacity)
{
    if (capacity == 0)
    {
        throw invalid_argument("DedupCache: The capacity must be positive.");
    }
};

bool DedupCache::markSeen(const string& id)
{
    auto existing = this->_index.find(id);
    if (existing != this->_index.end())
    {
        this->_recency.splice(this->_recency.begin(), this->_recency, existing->second);
        return false;
    }

    if (this->_recency.size() >= this->_capacity)
    {
        this->_index.erase(this->_recency.back());
        this->_recency.pop_back();
    }

    this->_recency.push_front(id);
    this->_index[id] = this->_recency.begin();
    return true;
};

bool DedupCache::contains(const string& id) const
{
    return this->_index.find(id) != this->_index.end();
};
