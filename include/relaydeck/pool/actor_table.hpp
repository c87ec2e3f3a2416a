#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relaydeck/pool/connection_actor.hpp"
#include "relaydeck/pool/subscription_router.hpp"

namespace relaydeck
{
namespace pool
{
/**
 * @brief The connection actors of a pool, keyed by relay URL.
 * @remark Requests addressed to a relay that is not in the table are ignored.
 */
class ActorTable : public IRelayDirectory
{
public:
    /**
     * @returns False if an actor for the same relay is already present.
     */
    bool add(std::shared_ptr<ConnectionActor> actor);

    /**
     * @returns The removed actor, or null if the relay is not in the table.
     */
    std::shared_ptr<ConnectionActor> remove(const std::string& relay);

    std::shared_ptr<ConnectionActor> find(const std::string& relay) const;

    bool contains(const std::string& relay) const;

    std::vector<std::string> relays() const;

    /**
     * @brief Empties the table.
     * @returns The actors that were in it.
     */
    std::vector<std::shared_ptr<ConnectionActor>> clear();

    size_t size() const;

    std::vector<std::string> connectedRelays() const override;

    void openSubscription(
        const std::string& relay,
        const std::string& subscriptionId,
        const std::vector<data::Filter>& filters) override;

    void closeSubscription(const std::string& relay, const std::string& subscriptionId, bool notifyRelay) override;

private:
    std::unordered_map<std::string, std::shared_ptr<ConnectionActor>> _actors;
    mutable std::mutex _propertyMutex;
};
} // namespace pool
} // namespace relaydeck
