#include <stdexcept>
#include <type_traits>

#include "relaydeck/pool/config.hpp"

using namespace nlohmann;
using namespace relaydeck::pool;
using namespace std;

template <typename T>
static void readField(const json& j, const string& key, T& field)
{
    if (!j.contains(key))
    {
        return;
    }

    if constexpr (is_unsigned<T>::value)
    {
        if (j.at(key).is_number_integer() && j.at(key).get<long long>() < 0)
        {
            throw invalid_argument("PoolConfig: '" + key + "' must not be negative.");
        }
    }

    try
    {
        field = j.at(key).get<T>();
    }
    catch (const json::exception& je)
    {
        throw invalid_argument("PoolConfig: Invalid value for '" + key + "': " + je.what());
    }
};

template <typename TDuration>
static void readDuration(const json& j, const string& key, TDuration& field)
{
    typename TDuration::rep count = field.count();
    readField(j, key, count);
    field = TDuration(count);
};

PoolConfig PoolConfig::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("PoolConfig::fromJson: The configuration must be a JSON object.");
    }

    PoolConfig config;
    readField(j, "default_relays", config.defaultRelays);
    readDuration(j, "connect_timeout_ms", config.connectTimeout);
    readDuration(j, "backoff_initial_ms", config.backoffInitial);
    readDuration(j, "backoff_max_ms", config.backoffMax);
    readField(j, "max_connect_attempts", config.maxConnectAttempts);
    readField(j, "outbound_queue_depth", config.outboundQueueDepth);
    readField(j, "dedup_capacity", config.dedupCapacity);
    readField(j, "store_queue_depth", config.storeQueueDepth);
    readField(j, "store_retries", config.storeRetries);
    readDuration(j, "future_skew_tolerance_s", config.futureSkewTolerance);
    readDuration(j, "publish_timeout_ms", config.publishTimeout);
    readField(j, "since_optimize", config.sinceOptimize);

    config.validate();
    return config;
};

void PoolConfig::validate() const
{
    if (this->connectTimeout.count() <= 0)
    {
        throw invalid_argument("PoolConfig: connect_timeout_ms must be positive.");
    }
    if (this->backoffInitial.count() <= 0)
    {
        throw invalid_argument("PoolConfig: backoff_initial_ms must be positive.");
    }
    if (this->backoffMax < this->backoffInitial)
    {
        throw invalid_argument("PoolConfig: backoff_max_ms must not be less than backoff_initial_ms.");
    }
    if (this->outboundQueueDepth == 0 || this->dedupCapacity == 0 || this->storeQueueDepth == 0)
    {
        throw invalid_argument("PoolConfig: Queue depths and the dedup capacity must be positive.");
    }
    if (this->futureSkewTolerance.count() < 0)
    {
        throw invalid_argument("PoolConfig: future_skew_tolerance_s must not be negative.");
    }
    if (this->publishTimeout.count() <= 0)
    {
        throw invalid_argument("PoolConfig: publish_timeout_ms must be positive.");
    }
};
