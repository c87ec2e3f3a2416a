#include "relaydeck/pool/pool_types.hpp"

using namespace std;

namespace relaydeck
{
namespace pool
{
string toString(RelayState state)
{
    switch (state)
    {
    case RelayState::Disconnected:
        return "disconnected";
    case RelayState::Connecting:
        return "connecting";
    case RelayState::Connected:
        return "connected";
    case RelayState::Failed:
        return "failed";
    }
    return "unknown";
};

string toString(PublishStatus status)
{
    switch (status)
    {
    case PublishStatus::Accepted:
        return "accepted";
    case PublishStatus::Rejected:
        return "rejected";
    case PublishStatus::NotConnected:
        return "not connected";
    case PublishStatus::TimedOut:
        return "timed out";
    }
    return "unknown";
};
} // namespace pool
} // namespace relaydeck
