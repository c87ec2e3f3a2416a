#pragma once

#include <list>
#include <string>
#include <unordered_map>

namespace relaydeck
{
namespace pool
{
/**
 * @brief A bounded set of recently seen event IDs.
 * @remark When the cache is full, the least recently seen ID is evicted.  The cache is not
 * thread-safe; the pool only touches it from its ingress thread.
 */
class DedupCache
{
public:
    explicit DedupCache(size_t capacity);

    /**
     * @brief Records an event ID as seen.
     * @returns True if the ID was not already in the cache.
     * @remark Seeing an ID again refreshes its recency.
     */
    bool markSeen(const std::string& id);

    bool contains(const std::string& id) const;

    size_t size() const { return this->_recency.size(); };

    size_t capacity() const { return this->_capacity; };

private:
    size_t _capacity;
    std::list<std::string> _recency; ///< Most recently seen first.
    std::unordered_map<std::string, std::list<std::string>::iterator> _index;
};
} // namespace pool
} // namespace relaydeck
